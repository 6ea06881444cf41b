#ifndef INVENTORY_MODEL_VALIDATOR_HPP
#define INVENTORY_MODEL_VALIDATOR_HPP

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace inventory {
namespace model {

/**
 * @brief Request body validation for device payloads
 *
 * Both variants return every violation found, in a stable order:
 * missing fields (in field order), then the type check, then the
 * IPv4 check, then string-type checks. An empty vector means valid.
 *
 * A field counts as missing when absent, null, or an empty string.
 * Fields outside the device schema are ignored.
 */

// POST /devices body: name, ip_address, type, location
std::vector<std::string> validate_create(const nlohmann::json &body);

// PUT /devices/{name} body: ip_address, type, location (name comes from the path)
std::vector<std::string> validate_update(const nlohmann::json &body);

// Dotted-quad IPv4: exactly four decimal octets 0-255, no leading zeros
bool is_valid_ipv4(const std::string &address);

}  // namespace model
}  // namespace inventory

#endif  // INVENTORY_MODEL_VALIDATOR_HPP

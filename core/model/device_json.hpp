#ifndef INVENTORY_MODEL_DEVICE_JSON_HPP
#define INVENTORY_MODEL_DEVICE_JSON_HPP

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "device.hpp"

namespace inventory {
namespace model {

/**
 * @brief JSON encoding for device records
 *
 * The same shape is used on the wire and as the stored document:
 *   {"name": ..., "ip_address": ..., "type": "Router|Switch|Server", "location": ...}
 *
 * Decoders expect input that already passed validate_create/validate_update
 * (or a document written by encode_device) and report anything else through
 * the error out-parameter.
 */
nlohmann::json encode_device(const Device &device);
nlohmann::json encode_devices(const std::vector<Device> &devices);

bool decode_device(const nlohmann::json &json, Device &device, std::string &error);

// Reads ip_address/type/location only; any "name" key is ignored
bool decode_device_fields(const nlohmann::json &json, DeviceFields &fields, std::string &error);

}  // namespace model
}  // namespace inventory

#endif  // INVENTORY_MODEL_DEVICE_JSON_HPP

#include "validator.hpp"

#include "device.hpp"

namespace inventory {
namespace model {

namespace {

constexpr const char *kCreateFields[] = {"name", "ip_address", "type", "location"};
constexpr const char *kUpdateFields[] = {"ip_address", "type", "location"};

bool is_missing(const nlohmann::json &body, const char *field) {
    auto it = body.find(field);
    if (it == body.end() || it->is_null()) {
        return true;
    }
    return it->is_string() && it->get_ref<const std::string &>().empty();
}

template <size_t N>
std::vector<std::string> validate_fields(const nlohmann::json &body, const char *const (&required)[N]) {
    std::vector<std::string> errors;

    if (!body.is_object()) {
        errors.emplace_back("Request body must be a JSON object");
        return errors;
    }

    for (const char *field : required) {
        if (is_missing(body, field)) {
            errors.push_back(std::string("Missing required field: ") + field);
        }
    }

    // A present but null or empty type is also outside the allowed set
    if (body.contains("type")) {
        const auto &type = body.at("type");
        if (!type.is_string() || !parse_device_type(type.get<std::string>())) {
            errors.emplace_back("Field 'type' must be one of: Router, Switch, Server");
        }
    }

    if (!is_missing(body, "ip_address")) {
        const auto &ip = body.at("ip_address");
        if (!ip.is_string() || !is_valid_ipv4(ip.get<std::string>())) {
            errors.emplace_back("Field 'ip_address' must be a valid IPv4 address");
        }
    }

    for (const char *field : required) {
        const std::string name(field);
        if (name == "type" || name == "ip_address") {
            continue;
        }
        if (!is_missing(body, field) && !body.at(name).is_string()) {
            errors.push_back("Field '" + name + "' must be a string");
        }
    }

    return errors;
}

}  // namespace

std::vector<std::string> validate_create(const nlohmann::json &body) { return validate_fields(body, kCreateFields); }

std::vector<std::string> validate_update(const nlohmann::json &body) { return validate_fields(body, kUpdateFields); }

bool is_valid_ipv4(const std::string &address) {
    int octets = 0;
    size_t pos = 0;

    while (true) {
        size_t start = pos;
        int value = 0;
        while (pos < address.size() && address[pos] >= '0' && address[pos] <= '9') {
            value = value * 10 + (address[pos] - '0');
            ++pos;
            if (pos - start > 3) {
                return false;
            }
        }

        size_t digits = pos - start;
        if (digits == 0 || value > 255) {
            return false;
        }
        if (digits > 1 && address[start] == '0') {
            return false;
        }
        ++octets;

        if (pos == address.size()) {
            break;
        }
        if (address[pos] != '.' || octets == 4) {
            return false;
        }
        ++pos;
    }

    return octets == 4;
}

}  // namespace model
}  // namespace inventory

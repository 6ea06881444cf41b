#include "device.hpp"

namespace inventory {
namespace model {

std::optional<DeviceType> parse_device_type(const std::string &type_str) {
    // Names are case-sensitive on the wire
    if (type_str == "Router") {
        return DeviceType::ROUTER;
    }
    if (type_str == "Switch") {
        return DeviceType::SWITCH;
    }
    if (type_str == "Server") {
        return DeviceType::SERVER;
    }
    return std::nullopt;
}

std::string device_type_to_string(DeviceType type) {
    switch (type) {
        case DeviceType::ROUTER:
            return "Router";
        case DeviceType::SWITCH:
            return "Switch";
        case DeviceType::SERVER:
            return "Server";
        default:
            return "Unknown";
    }
}

bool operator==(const Device &lhs, const Device &rhs) {
    return lhs.name == rhs.name && lhs.ip_address == rhs.ip_address && lhs.type == rhs.type &&
           lhs.location == rhs.location;
}

bool operator==(const DeviceFields &lhs, const DeviceFields &rhs) {
    return lhs.ip_address == rhs.ip_address && lhs.type == rhs.type && lhs.location == rhs.location;
}

}  // namespace model
}  // namespace inventory

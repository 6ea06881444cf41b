#ifndef INVENTORY_MODEL_DEVICE_HPP
#define INVENTORY_MODEL_DEVICE_HPP

#include <optional>
#include <string>

namespace inventory {
namespace model {

// Closed set of device kinds accepted by the inventory
enum class DeviceType { ROUTER, SWITCH, SERVER };

std::optional<DeviceType> parse_device_type(const std::string &type_str);
std::string device_type_to_string(DeviceType type);

// Mutable part of a device record (everything except the name)
struct DeviceFields {
    std::string ip_address;
    DeviceType type = DeviceType::ROUTER;
    std::string location;
};

// Inventory device. The name is the unique lookup key and never changes
// after creation.
struct Device {
    std::string name;
    std::string ip_address;
    DeviceType type = DeviceType::ROUTER;
    std::string location;

    // Same record with the mutable fields replaced; name is kept
    Device with_fields(const DeviceFields &updated) const {
        return {name, updated.ip_address, updated.type, updated.location};
    }
};

bool operator==(const Device &lhs, const Device &rhs);
inline bool operator!=(const Device &lhs, const Device &rhs) { return !(lhs == rhs); }

bool operator==(const DeviceFields &lhs, const DeviceFields &rhs);
inline bool operator!=(const DeviceFields &lhs, const DeviceFields &rhs) { return !(lhs == rhs); }

}  // namespace model
}  // namespace inventory

#endif  // INVENTORY_MODEL_DEVICE_HPP

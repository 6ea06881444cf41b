#include "device_json.hpp"

namespace inventory {
namespace model {

namespace {

bool read_string(const nlohmann::json &json, const char *key, std::string &out, std::string &error) {
    auto it = json.find(key);
    if (it == json.end() || !it->is_string()) {
        error = std::string("Field '") + key + "' missing or not a string";
        return false;
    }
    out = it->get<std::string>();
    return true;
}

}  // namespace

nlohmann::json encode_device(const Device &device) {
    return {{"name", device.name},
            {"ip_address", device.ip_address},
            {"type", device_type_to_string(device.type)},
            {"location", device.location}};
}

nlohmann::json encode_devices(const std::vector<Device> &devices) {
    nlohmann::json array = nlohmann::json::array();
    for (const auto &device : devices) {
        array.push_back(encode_device(device));
    }
    return array;
}

bool decode_device_fields(const nlohmann::json &json, DeviceFields &fields, std::string &error) {
    if (!json.is_object()) {
        error = "Device document must be a JSON object";
        return false;
    }

    std::string type_str;
    if (!read_string(json, "ip_address", fields.ip_address, error) || !read_string(json, "type", type_str, error) ||
        !read_string(json, "location", fields.location, error)) {
        return false;
    }

    auto type = parse_device_type(type_str);
    if (!type) {
        error = "Unknown device type: " + type_str;
        return false;
    }
    fields.type = *type;
    return true;
}

bool decode_device(const nlohmann::json &json, Device &device, std::string &error) {
    DeviceFields fields;
    if (!decode_device_fields(json, fields, error)) {
        return false;
    }

    std::string name;
    if (!read_string(json, "name", name, error)) {
        return false;
    }

    device = Device{name, fields.ip_address, fields.type, fields.location};
    return true;
}

}  // namespace model
}  // namespace inventory

#include <optional>
#include <vector>

#include "../../logging/logger.hpp"
#include "../../model/device_json.hpp"
#include "../../model/validator.hpp"
#include "../server.hpp"
#include "utils.hpp"

namespace inventory {
namespace http {

namespace {

constexpr int kStatusCreated = 201;

// Empty body is treated as an empty object so validation reports every missing field
bool parse_body(const httplib::Request &req, httplib::Response &res, nlohmann::json &body) {
    if (req.body.empty()) {
        body = nlohmann::json::object();
        return true;
    }
    try {
        body = nlohmann::json::parse(req.body);
    } catch (const nlohmann::json::parse_error &e) {
        send_error(res, StatusCode::VALIDATION_ERROR, std::string("Invalid JSON: ") + e.what());
        return false;
    }
    return true;
}

void send_repository_error(httplib::Response &res, const storage::RepositoryResult &result, const std::string &name) {
    StatusCode code = status_from_repository(result.status);
    switch (result.status) {
        case storage::RepositoryStatus::DUPLICATE:
            send_error(res, code, "Device name already exists: " + name);
            break;
        case storage::RepositoryStatus::NOT_FOUND:
            send_error(res, code, "Device not found: " + name);
            break;
        default:
            LOG_WARN("[HTTP] Repository returned " << storage::repository_status_to_string(result.status) << ": "
                                                   << result.error_message);
            send_error(res, code, "Storage failure: " + result.error_message);
            break;
    }
}

void send_not_found(httplib::Response &res, const std::string &name) {
    send_error(res, StatusCode::NOT_FOUND, "Device not found: " + name);
}

void send_internal(httplib::Response &res, const char *handler, const std::exception &e) {
    LOG_ERROR("[HTTP] Exception in " << handler << ": " << e.what());
    send_error(res, StatusCode::INTERNAL, std::string("Internal server error: ") + e.what());
}

}  // namespace

//=============================================================================
// GET /devices
//=============================================================================
void HttpServer::handle_list_devices(const httplib::Request &, httplib::Response &res) {
    try {
        std::vector<model::Device> devices;
        auto result = repository_.list_all(devices);
        if (!result.ok()) {
            send_repository_error(res, result, "");
            return;
        }

        send_json(res, StatusCode::OK, model::encode_devices(devices));
    } catch (const std::exception &e) {
        send_internal(res, "handle_list_devices", e);
    }
}

//=============================================================================
// POST /devices
//=============================================================================
void HttpServer::handle_create_device(const httplib::Request &req, httplib::Response &res) {
    try {
        nlohmann::json body;
        if (!parse_body(req, res, body)) {
            return;
        }

        auto errors = model::validate_create(body);
        if (!errors.empty()) {
            send_json(res, StatusCode::VALIDATION_ERROR, make_validation_error(errors));
            return;
        }

        model::Device device;
        std::string error;
        if (!model::decode_device(body, device, error)) {
            send_error(res, StatusCode::VALIDATION_ERROR, error);
            return;
        }

        // Pre-check gives a clean 409; the unique index still settles races below
        std::optional<model::Device> existing;
        auto result = repository_.find_by_name(device.name, existing);
        if (!result.ok()) {
            send_repository_error(res, result, device.name);
            return;
        }
        if (existing) {
            send_repository_error(
                res, storage::RepositoryResult::failure(storage::RepositoryStatus::DUPLICATE, ""), device.name);
            return;
        }

        result = repository_.insert(device);
        if (!result.ok()) {
            send_repository_error(res, result, device.name);
            return;
        }

        LOG_INFO("[HTTP] Created device '" << device.name << "'");
        send_json(res, kStatusCreated, model::encode_device(device));
    } catch (const std::exception &e) {
        send_internal(res, "handle_create_device", e);
    }
}

//=============================================================================
// GET /devices/{name}
//=============================================================================
void HttpServer::handle_get_device(const httplib::Request &req, httplib::Response &res) {
    try {
        std::string name;
        if (!parse_name_param(req, name)) {
            send_error(res, StatusCode::VALIDATION_ERROR, "Invalid path parameters");
            return;
        }

        std::optional<model::Device> device;
        auto result = repository_.find_by_name(name, device);
        if (!result.ok()) {
            send_repository_error(res, result, name);
            return;
        }
        if (!device) {
            send_not_found(res, name);
            return;
        }

        send_json(res, StatusCode::OK, model::encode_device(*device));
    } catch (const std::exception &e) {
        send_internal(res, "handle_get_device", e);
    }
}

//=============================================================================
// PUT /devices/{name}
//=============================================================================
void HttpServer::handle_update_device(const httplib::Request &req, httplib::Response &res) {
    try {
        std::string name;
        if (!parse_name_param(req, name)) {
            send_error(res, StatusCode::VALIDATION_ERROR, "Invalid path parameters");
            return;
        }

        nlohmann::json body;
        if (!parse_body(req, res, body)) {
            return;
        }

        auto errors = model::validate_update(body);
        if (!errors.empty()) {
            send_json(res, StatusCode::VALIDATION_ERROR, make_validation_error(errors));
            return;
        }

        // A "name" key in the body is ignored; the path is the only key
        model::DeviceFields fields;
        std::string error;
        if (!model::decode_device_fields(body, fields, error)) {
            send_error(res, StatusCode::VALIDATION_ERROR, error);
            return;
        }

        std::optional<model::Device> existing;
        auto result = repository_.find_by_name(name, existing);
        if (!result.ok()) {
            send_repository_error(res, result, name);
            return;
        }
        if (!existing) {
            send_not_found(res, name);
            return;
        }

        result = repository_.update_by_name(name, fields);
        if (!result.ok()) {
            send_repository_error(res, result, name);
            return;
        }

        LOG_INFO("[HTTP] Updated device '" << name << "'");
        send_json(res, StatusCode::OK, model::encode_device(existing->with_fields(fields)));
    } catch (const std::exception &e) {
        send_internal(res, "handle_update_device", e);
    }
}

//=============================================================================
// DELETE /devices/{name}
//=============================================================================
void HttpServer::handle_delete_device(const httplib::Request &req, httplib::Response &res) {
    try {
        std::string name;
        if (!parse_name_param(req, name)) {
            send_error(res, StatusCode::VALIDATION_ERROR, "Invalid path parameters");
            return;
        }

        std::optional<model::Device> existing;
        auto result = repository_.find_by_name(name, existing);
        if (!result.ok()) {
            send_repository_error(res, result, name);
            return;
        }
        if (!existing) {
            send_not_found(res, name);
            return;
        }

        result = repository_.delete_by_name(name);
        if (!result.ok()) {
            send_repository_error(res, result, name);
            return;
        }

        LOG_INFO("[HTTP] Deleted device '" << name << "'");
        send_json(res, StatusCode::OK, nlohmann::json{{"name", name}, {"deleted", true}});
    } catch (const std::exception &e) {
        send_internal(res, "handle_delete_device", e);
    }
}

}  // namespace http
}  // namespace inventory

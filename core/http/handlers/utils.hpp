#pragma once

#include <httplib.h>

#include <nlohmann/json.hpp>
#include <string>

#include "../errors.hpp"

namespace inventory {
namespace http {

// Helper: Parse the {name} path segment from regex matches
inline bool parse_name_param(const httplib::Request &req, std::string &name) {
    if (req.matches.size() >= 2) {
        name = req.matches[1].str();
        return !name.empty();
    }
    return false;
}

// Helper: Send JSON response
inline void send_json(httplib::Response &res, StatusCode code, const nlohmann::json &body) {
    res.status = status_code_to_http(code);
    res.set_content(body.dump(), "application/json");
}

inline void send_json(httplib::Response &res, int http_status, const nlohmann::json &body) {
    res.status = http_status;
    res.set_content(body.dump(), "application/json");
}

inline void send_error(httplib::Response &res, StatusCode code, const std::string &message) {
    send_json(res, code, make_error_response(code, message));
}

}  // namespace http
}  // namespace inventory

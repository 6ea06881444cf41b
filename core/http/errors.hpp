#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "storage/device_repository.hpp"

namespace inventory {
namespace http {

/**
 * @brief Error taxonomy mapped to HTTP status codes
 *
 * - OK -> HTTP 200
 * - VALIDATION_ERROR -> HTTP 400
 * - NOT_FOUND -> HTTP 404
 * - CONFLICT -> HTTP 409
 * - STORAGE_FAILURE -> HTTP 500
 * - INTERNAL -> HTTP 500
 * - UNAVAILABLE -> HTTP 503
 */
enum class StatusCode { OK, VALIDATION_ERROR, NOT_FOUND, CONFLICT, STORAGE_FAILURE, INTERNAL, UNAVAILABLE };

inline int status_code_to_http(StatusCode code) {
    switch (code) {
        case StatusCode::OK:
            return 200;
        case StatusCode::VALIDATION_ERROR:
            return 400;
        case StatusCode::NOT_FOUND:
            return 404;
        case StatusCode::CONFLICT:
            return 409;
        case StatusCode::STORAGE_FAILURE:
            return 500;
        case StatusCode::INTERNAL:
            return 500;
        case StatusCode::UNAVAILABLE:
            return 503;
        default:
            return 500;
    }
}

inline std::string status_code_to_string(StatusCode code) {
    switch (code) {
        case StatusCode::OK:
            return "OK";
        case StatusCode::VALIDATION_ERROR:
            return "VALIDATION_ERROR";
        case StatusCode::NOT_FOUND:
            return "NOT_FOUND";
        case StatusCode::CONFLICT:
            return "CONFLICT";
        case StatusCode::STORAGE_FAILURE:
            return "STORAGE_FAILURE";
        case StatusCode::INTERNAL:
            return "INTERNAL";
        case StatusCode::UNAVAILABLE:
            return "UNAVAILABLE";
        default:
            return "INTERNAL";
    }
}

// Repository outcome -> response status. OK maps to OK.
inline StatusCode status_from_repository(storage::RepositoryStatus status) {
    switch (status) {
        case storage::RepositoryStatus::OK:
            return StatusCode::OK;
        case storage::RepositoryStatus::DUPLICATE:
            return StatusCode::CONFLICT;
        case storage::RepositoryStatus::NOT_FOUND:
            return StatusCode::NOT_FOUND;
        case storage::RepositoryStatus::STORAGE_FAILURE:
            return StatusCode::STORAGE_FAILURE;
        default:
            return StatusCode::INTERNAL;
    }
}

/**
 * @brief Build the error envelope
 *
 * Every non-2xx response body has the shape
 *   {"error": {"code": "<CODE>", "message": "<text>"}}
 */
inline nlohmann::json make_error_response(StatusCode code, const std::string &message) {
    std::string msg = message.empty() ? status_code_to_string(code) : message;
    return {{"error", {{"code", status_code_to_string(code)}, {"message", msg}}}};
}

// Validation errors are joined so the caller sees every problem at once
inline nlohmann::json make_validation_error(const std::vector<std::string> &errors) {
    std::string message;
    for (const auto &error : errors) {
        if (!message.empty()) {
            message += "; ";
        }
        message += error;
    }
    return make_error_response(StatusCode::VALIDATION_ERROR, message);
}

}  // namespace http
}  // namespace inventory

#include "../../logging/logger.hpp"
#include "../server.hpp"
#include "utils.hpp"

namespace inventory {
namespace http {

//=============================================================================
// GET /healthz
//=============================================================================
void HttpServer::handle_get_healthz(const httplib::Request &, httplib::Response &res) {
    try {
        auto result = repository_.ping();
        if (!result.ok()) {
            LOG_WARN("[HTTP] Health check failed: " << result.error_message);
            send_error(res, StatusCode::UNAVAILABLE, "Database connectivity error: " + result.error_message);
            return;
        }

        send_json(res, StatusCode::OK, nlohmann::json{{"status", "ok"}});
    } catch (const std::exception &e) {
        LOG_WARN("[HTTP] Health check failed: " << e.what());
        send_error(res, StatusCode::UNAVAILABLE, std::string("Health check failed: ") + e.what());
    }
}

}  // namespace http
}  // namespace inventory

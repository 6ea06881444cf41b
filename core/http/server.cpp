#include "server.hpp"

#include <algorithm>

#include "errors.hpp"
#include "handlers/utils.hpp"
#include "logging/logger.hpp"

namespace inventory {
namespace http {

namespace {
constexpr int kDefaultTimeoutSeconds = 5;
constexpr int kDefaultTimeoutMilliseconds = 0;
constexpr int kStatusNoContent = 204;
constexpr int kStatusNotFound = 404;
constexpr const char *kAllowedMethods = "GET, POST, PUT, DELETE, OPTIONS";
}  // namespace

HttpServer::HttpServer(const runtime::HttpConfig &config, storage::IDeviceRepository &repository)
    : config_(config), repository_(repository) {}

HttpServer::~HttpServer() { stop(); }

bool HttpServer::start(std::string &error) {
    if (running_.load()) {
        error = "Server already running";
        return false;
    }

    LOG_INFO("[HTTP] Starting server on " << config_.bind << ":" << config_.port);

    server_ = std::make_unique<httplib::Server>();

    server_->set_read_timeout(kDefaultTimeoutSeconds, kDefaultTimeoutMilliseconds);
    server_->set_write_timeout(kDefaultTimeoutSeconds, kDefaultTimeoutMilliseconds);

    int pool_size = config_.thread_pool_size;
    server_->new_task_queue = [pool_size] { return new httplib::ThreadPool(pool_size); };

    // Add CORS headers to all responses (allowlist with wildcard support)
    const bool allow_credentials = config_.cors_allow_credentials;
    server_->set_post_routing_handler([allow_credentials, origins = config_.cors_allowed_origins](
                                          const httplib::Request &req, httplib::Response &res) {
        const auto origin_it = req.headers.find("Origin");
        if (origin_it == req.headers.end()) {
            return;
        }

        const std::string origin = origin_it->second;
        auto origin_matches = [&origin](const std::string &allowed) {
            if (allowed == "*") {
                return true;
            }

            const auto wildcard_pos = allowed.find('*');
            if (wildcard_pos == std::string::npos) {
                return allowed == origin;
            }

            const std::string prefix = allowed.substr(0, wildcard_pos);
            const std::string suffix = allowed.substr(wildcard_pos + 1);
            if (origin.size() < prefix.size() + suffix.size()) {
                return false;
            }

            const bool prefix_ok = origin.compare(0, prefix.size(), prefix) == 0;
            const bool suffix_ok = origin.compare(origin.size() - suffix.size(), suffix.size(), suffix) == 0;
            return prefix_ok && suffix_ok;
        };

        auto matched = std::find_if(origins.begin(), origins.end(), origin_matches);
        if (matched == origins.end()) {
            return;
        }

        const std::string response_origin = *matched == "*" ? "*" : origin;

        res.set_header("Access-Control-Allow-Origin", response_origin.c_str());
        res.set_header("Access-Control-Allow-Methods", kAllowedMethods);
        res.set_header("Access-Control-Allow-Headers", "Content-Type");
        if (allow_credentials) {
            res.set_header("Access-Control-Allow-Credentials", "true");
        }
    });

    setup_routes();

    // JSON envelope for errors httplib raises itself (unrouted paths, bad requests).
    // Handlers always set a body, so anything with content is left alone.
    server_->set_error_handler([](const httplib::Request &req, httplib::Response &res) {
        if (!res.body.empty()) {
            return;
        }

        StatusCode code = StatusCode::INTERNAL;
        std::string message = "Internal server error";

        if (res.status == kStatusNotFound) {
            code = StatusCode::NOT_FOUND;
            message = "Route not found: " + req.method + " " + req.path;
        } else if (res.status >= 400 && res.status < 500) {
            code = StatusCode::VALIDATION_ERROR;
            message = "Bad request";
        }

        // Keep the status httplib chose; only the body is normalised
        res.set_content(make_error_response(code, message).dump(), "application/json");
    });

    // Backstop for exceptions escaping a handler
    server_->set_exception_handler([](const httplib::Request &req, httplib::Response &res, std::exception_ptr ep) {
        std::string msg = "Unknown exception";
        try {
            std::rethrow_exception(std::move(ep));
        } catch (const std::exception &e) {
            msg = e.what();
        } catch (...) {
            // Non-standard exception type; reported with the generic message
        }
        LOG_ERROR("[HTTP] Exception in " << req.method << " " << req.path << ": " << msg);
        send_error(res, StatusCode::INTERNAL, "Internal server error: " + msg);
    });

    if (!server_->bind_to_port(config_.bind.c_str(), config_.port)) {
        error = "Failed to bind to " + config_.bind + ":" + std::to_string(config_.port);
        server_.reset();
        return false;
    }
    port_ = config_.port;

    running_.store(true);
    server_thread_ = std::make_unique<std::thread>([this]() {
        LOG_INFO("[HTTP] Server thread started");
        server_->listen_after_bind();
        LOG_INFO("[HTTP] Server thread exiting");
    });

    LOG_INFO("[HTTP] Server listening on " << config_.bind << ":" << config_.port);
    return true;
}

void HttpServer::stop() {
    if (!running_.load()) {
        return;
    }

    LOG_INFO("[HTTP] Stopping server");
    running_.store(false);

    if (server_) {
        server_->stop();
    }

    if (server_thread_ && server_thread_->joinable()) {
        server_thread_->join();
    }

    server_thread_.reset();
    server_.reset();
    LOG_INFO("[HTTP] Server stopped");
}

void HttpServer::setup_routes() {
    // GET /devices - List all devices
    server_->Get(R"(/devices/?)",
                 [this](const httplib::Request &req, httplib::Response &res) { handle_list_devices(req, res); });

    // POST /devices - Create a device
    server_->Post(R"(/devices/?)",
                  [this](const httplib::Request &req, httplib::Response &res) { handle_create_device(req, res); });

    // GET /devices/{name} - Get one device
    server_->Get(R"(/devices/([^/]+))",
                 [this](const httplib::Request &req, httplib::Response &res) { handle_get_device(req, res); });

    // PUT /devices/{name} - Replace mutable fields
    server_->Put(R"(/devices/([^/]+))",
                 [this](const httplib::Request &req, httplib::Response &res) { handle_update_device(req, res); });

    // DELETE /devices/{name} - Remove a device
    server_->Delete(R"(/devices/([^/]+))",
                    [this](const httplib::Request &req, httplib::Response &res) { handle_delete_device(req, res); });

    // GET /healthz - Storage connectivity probe
    server_->Get("/healthz",
                 [this](const httplib::Request &req, httplib::Response &res) { handle_get_healthz(req, res); });

    // OPTIONS catch-all for CORS preflight on all routes
    server_->Options(R"(/.*)", [](const httplib::Request &, httplib::Response &res) {
        res.status = kStatusNoContent;
        res.set_header("Access-Control-Allow-Methods", kAllowedMethods);
        res.set_header("Access-Control-Allow-Headers", "Content-Type");
    });

    LOG_INFO("[HTTP] Routes configured:");
    LOG_INFO("[HTTP]   GET    /devices");
    LOG_INFO("[HTTP]   POST   /devices");
    LOG_INFO("[HTTP]   GET    /devices/{name}");
    LOG_INFO("[HTTP]   PUT    /devices/{name}");
    LOG_INFO("[HTTP]   DELETE /devices/{name}");
    LOG_INFO("[HTTP]   GET    /healthz");
}

}  // namespace http
}  // namespace inventory

#pragma once

// Prevent Windows macro pollution (must be before httplib.h)
#ifdef _WIN32
#define WIN32_LEAN_AND_MEAN
#define NOMINMAX
#endif

#include <httplib.h>

#include <atomic>
#include <memory>
#include <string>
#include <thread>

#include "runtime/config.hpp"
#include "storage/device_repository.hpp"

namespace inventory {
namespace http {

/**
 * @brief HTTP server exposing the device inventory
 *
 * Thin adapter between REST endpoints and the device repository.
 *
 * Thread model:
 * - Server runs in its own thread (via httplib::Server::listen_after_bind)
 * - Request handlers execute in httplib's thread pool
 * - Handlers share nothing but the repository, which keeps no state
 *   between calls
 *
 * Lifecycle:
 * - start() binds to configured port and spawns server thread
 * - stop() signals shutdown and joins server thread
 */
class HttpServer {
public:
    HttpServer(const runtime::HttpConfig &config, storage::IDeviceRepository &repository);
    ~HttpServer();

    HttpServer(const HttpServer &) = delete;
    HttpServer &operator=(const HttpServer &) = delete;

    /**
     * @brief Start HTTP server
     *
     * @param error Populated with error message on failure
     * @return true if server started
     */
    bool start(std::string &error);

    // Safe to call multiple times
    void stop();

    bool is_running() const { return running_.load(); }
    int get_port() const { return port_; }

private:
    runtime::HttpConfig config_;
    int port_ = 0;

    storage::IDeviceRepository &repository_;

    std::unique_ptr<httplib::Server> server_;
    std::unique_ptr<std::thread> server_thread_;
    std::atomic<bool> running_{false};

    void setup_routes();

    // Device handlers (handlers/device_handlers.cpp)
    void handle_list_devices(const httplib::Request &req, httplib::Response &res);
    void handle_create_device(const httplib::Request &req, httplib::Response &res);
    void handle_get_device(const httplib::Request &req, httplib::Response &res);
    void handle_update_device(const httplib::Request &req, httplib::Response &res);
    void handle_delete_device(const httplib::Request &req, httplib::Response &res);

    // System handlers (handlers/system_handlers.cpp)
    void handle_get_healthz(const httplib::Request &req, httplib::Response &res);
};

}  // namespace http
}  // namespace inventory

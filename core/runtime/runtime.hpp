#pragma once

#include <atomic>
#include <memory>
#include <string>

#include "config.hpp"
#include "http/server.hpp"
#include "storage/device_repository.hpp"

namespace inventory {
namespace runtime {

class Runtime {
public:
    explicit Runtime(const ServiceConfig &config);
    ~Runtime();

    // Prepare the device collection and start the HTTP server
    bool initialize(std::string &error);

    // Blocks until stop() or a shutdown signal
    void run();

    // Triggers the main loop to exit
    void stop() { running_ = false; }

    void shutdown();

    storage::IDeviceRepository &get_repository() { return *repository_; }

private:
    bool init_storage(std::string &error);
    bool init_http(std::string &error);

    ServiceConfig config_;

    std::unique_ptr<storage::IDeviceRepository> repository_;
    std::unique_ptr<http::HttpServer> http_server_;

    std::atomic<bool> running_{false};
};

}  // namespace runtime
}  // namespace inventory

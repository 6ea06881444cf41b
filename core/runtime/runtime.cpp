#include "runtime.hpp"

#include <chrono>
#include <thread>

#include "logging/logger.hpp"
#include "signal_handler.hpp"
#include "storage/sqlite_device_repository.hpp"

namespace inventory {
namespace runtime {

namespace {
constexpr auto kShutdownPollInterval = std::chrono::milliseconds(100);
}  // namespace

Runtime::Runtime(const ServiceConfig &config) : config_(config) {}

Runtime::~Runtime() { shutdown(); }

bool Runtime::initialize(std::string &error) {
    LOG_INFO("[Runtime] Initializing device inventory service");

    if (!init_storage(error)) {
        return false;
    }

    if (!init_http(error)) {
        return false;
    }

    LOG_INFO("[Runtime] Initialization complete");
    return true;
}

bool Runtime::init_storage(std::string &error) {
    auto repository = std::make_unique<storage::SqliteDeviceRepository>(config_.storage);
    if (!repository->initialize(error)) {
        return false;
    }
    repository_ = std::move(repository);
    return true;
}

bool Runtime::init_http(std::string &error) {
    http_server_ = std::make_unique<http::HttpServer>(config_.http, *repository_);

    std::string http_error;
    if (!http_server_->start(http_error)) {
        error = "HTTP server failed to start: " + http_error;
        http_server_.reset();
        return false;
    }
    return true;
}

void Runtime::run() {
    running_ = true;
    LOG_INFO("[Runtime] Serving requests (Ctrl+C to stop)");

    while (running_ && !SignalHandler::is_shutdown_requested()) {
        std::this_thread::sleep_for(kShutdownPollInterval);
    }

    LOG_INFO("[Runtime] Shutdown requested");
    running_ = false;
    shutdown();
}

void Runtime::shutdown() {
    if (http_server_) {
        http_server_->stop();
        http_server_.reset();
    }
    repository_.reset();
}

}  // namespace runtime
}  // namespace inventory

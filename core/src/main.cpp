// Device Inventory Service
// HTTP CRUD over the device collection

#include <iostream>
#include <optional>
#include <string>

#include "logging/logger.hpp"
#include "runtime/config.hpp"
#include "runtime/runtime.hpp"
#include "runtime/signal_handler.hpp"

int main(int argc, char **argv) {
    std::optional<std::string> config_path;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg.rfind("--config=", 0) == 0) {
            config_path = arg.substr(9);
        } else if (arg == "--help" || arg == "-h") {
            std::cerr << "Usage: inventory-server [OPTIONS]\n\n";
            std::cerr << "Options:\n";
            std::cerr << "  --config=PATH    Path to config file (default: " << inventory::runtime::kDefaultConfigPath
                      << ", then INVENTORY_* environment variables)\n";
            std::cerr << "  --help, -h       Show this help\n";
            return 0;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            std::cerr << "Use --help for usage information\n";
            return 1;
        }
    }

    LOG_INFO("Device inventory service starting...");

    inventory::runtime::ServiceConfig config;
    std::string error;

    if (!inventory::runtime::resolve_config(config_path, config, error)) {
        LOG_ERROR("Configuration error: " << error);
        return 1;
    }

    inventory::logging::Logger::set_level(inventory::logging::string_to_level(config.logging.level));

    inventory::runtime::Runtime runtime(config);

    if (!runtime.initialize(error)) {
        LOG_ERROR("Runtime initialization failed: " << error);
        return 1;
    }

    inventory::runtime::SignalHandler::install();

    runtime.run();

    LOG_INFO("Shutdown complete");
    return 0;
}

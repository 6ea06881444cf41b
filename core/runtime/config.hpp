#pragma once

#include <optional>
#include <string>
#include <vector>

namespace inventory {
namespace runtime {

constexpr const char *kDefaultConfigPath = "inventory-server.yaml";

struct LoggingConfig {
    std::string level = "info";  // debug, info, warn, error
};

struct HttpConfig {
    std::string bind = "127.0.0.1";                      // Bind address
    int port = 8080;                                     // HTTP port
    std::vector<std::string> cors_allowed_origins{"*"};  // CORS allowlist ("*" = allow all)
    bool cors_allow_credentials = false;                 // Whether to emit Access-Control-Allow-Credentials
    int thread_pool_size = 8;                            // Worker thread pool size
};

struct StorageConfig {
    std::string uri;                     // Database file path or SQLite "file:" URI
    std::string collection = "devices";  // Collection (table) holding device documents
    int busy_timeout_ms = 2000;          // Wait on a locked database before failing
};

struct ServiceConfig {
    HttpConfig http;
    StorageConfig storage;
    LoggingConfig logging;
};

// Loads configuration from a YAML file
bool load_config(const std::string &config_path, ServiceConfig &config, std::string &error);

// Builds configuration from INVENTORY_* environment variables
bool load_config_from_env(ServiceConfig &config, std::string &error);

/**
 * Resolution order:
 *  1. explicit_path, if given: must exist and be valid
 *  2. kDefaultConfigPath in the working directory, if present and valid
 *     (an invalid default file is reported and skipped)
 *  3. environment variables
 */
bool resolve_config(const std::optional<std::string> &explicit_path, ServiceConfig &config, std::string &error);

// Validates the configuration
bool validate_config(const ServiceConfig &config, std::string &error);

// True for names usable as an unquoted SQL identifier
bool is_valid_collection_name(const std::string &name);

}  // namespace runtime
}  // namespace inventory

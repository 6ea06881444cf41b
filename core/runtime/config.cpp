#include "config.hpp"

#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <filesystem>

#include "../logging/logger.hpp"

namespace inventory {
namespace runtime {

namespace {

bool is_in_memory_uri(const std::string &uri) {
    return uri == ":memory:" || uri.rfind("file::memory:", 0) == 0 || uri.find("mode=memory") != std::string::npos;
}

const char *env_or_null(const char *name) {
    const char *value = std::getenv(name);
    if (value == nullptr || *value == '\0') {
        return nullptr;
    }
    return value;
}

bool parse_env_int(const char *name, int &out, std::string &error) {
    const char *value = env_or_null(name);
    if (value == nullptr) {
        return true;
    }
    try {
        size_t consumed = 0;
        int parsed = std::stoi(value, &consumed);
        if (consumed != std::string(value).size()) {
            error = std::string(name) + " must be an integer, got '" + value + "'";
            return false;
        }
        out = parsed;
        return true;
    } catch (const std::exception &) {
        error = std::string(name) + " must be an integer, got '" + value + "'";
        return false;
    }
}

void log_config_summary(const ServiceConfig &config) {
    LOG_INFO("[Config] HTTP: " << config.http.bind << ":" << config.http.port << " (" << config.http.thread_pool_size
                               << " workers)");
    LOG_INFO("[Config] Storage: " << config.storage.uri << " collection=" << config.storage.collection);
    LOG_INFO("[Config] Log level: " << config.logging.level);
}

}  // namespace

bool is_valid_collection_name(const std::string &name) {
    if (name.empty()) {
        return false;
    }
    auto is_alpha = [](char c) { return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_'; };
    if (!is_alpha(name[0])) {
        return false;
    }
    for (char c : name) {
        if (!is_alpha(c) && !(c >= '0' && c <= '9')) {
            return false;
        }
    }
    return true;
}

bool validate_config(const ServiceConfig &config, std::string &error) {
    // HTTP settings
    if (config.http.port < 1 || config.http.port > 65535) {
        error = "HTTP port must be between 1 and 65535";
        return false;
    }
    if (config.http.bind.empty()) {
        error = "http.bind must not be empty";
        return false;
    }
    if (config.http.thread_pool_size < 1) {
        error = "HTTP thread_pool_size must be at least 1";
        return false;
    }
    if (config.http.cors_allowed_origins.empty()) {
        error = "http.cors_allowed_origins must not be empty";
        return false;
    }

    // Storage settings
    if (config.storage.uri.empty()) {
        error = "storage.uri must be a non-empty string";
        return false;
    }
    if (is_in_memory_uri(config.storage.uri)) {
        error = "storage.uri must name a database file; in-memory databases are not shared between connections";
        return false;
    }
    if (!is_valid_collection_name(config.storage.collection)) {
        error = "storage.collection '" + config.storage.collection +
                "' must start with a letter or underscore and contain only letters, digits and underscores";
        return false;
    }
    if (config.storage.busy_timeout_ms < 0) {
        error = "storage.busy_timeout_ms must be >= 0";
        return false;
    }

    // Logging settings
    if (!logging::parse_level(config.logging.level)) {
        error = "Invalid log level: " + config.logging.level;
        return false;
    }

    return true;
}

bool load_config(const std::string &config_path, ServiceConfig &config, std::string &error) {
    try {
        YAML::Node yaml = YAML::LoadFile(config_path);

        if (!yaml.IsMap()) {
            error = "Config root must be a mapping";
            return false;
        }

        // Check for unknown top-level keys
        const std::vector<std::string> valid_keys = {"http", "storage", "logging"};
        for (const auto &key_node : yaml) {
            std::string key = key_node.first.as<std::string>();
            bool known = false;
            for (const auto &valid_key : valid_keys) {
                if (key == valid_key) {
                    known = true;
                    break;
                }
            }
            if (!known) {
                LOG_WARN("[Config] Unknown top-level key: '" << key << "' (will be ignored)");
            }
        }

        // Load HTTP config
        if (yaml["http"]) {
            const auto &http = yaml["http"];
            if (http["bind"]) {
                config.http.bind = http["bind"].as<std::string>();
            }
            if (http["port"]) {
                config.http.port = http["port"].as<int>();
            }

            // CORS allowlist (supports scalar or sequence)
            if (http["cors_allowed_origins"]) {
                const auto &origins_node = http["cors_allowed_origins"];
                config.http.cors_allowed_origins.clear();
                if (origins_node.IsSequence()) {
                    for (const auto &origin : origins_node) {
                        config.http.cors_allowed_origins.push_back(origin.as<std::string>());
                    }
                } else if (origins_node.IsScalar()) {
                    config.http.cors_allowed_origins.push_back(origins_node.as<std::string>());
                }

                if (config.http.cors_allowed_origins.empty()) {
                    config.http.cors_allowed_origins.push_back("*");
                }
            }
            if (http["cors_allow_credentials"]) {
                config.http.cors_allow_credentials = http["cors_allow_credentials"].as<bool>();
            }
            if (http["thread_pool_size"]) {
                config.http.thread_pool_size = http["thread_pool_size"].as<int>();
            }
        }

        // Load storage config
        if (yaml["storage"]) {
            const auto &storage = yaml["storage"];
            if (storage["uri"]) {
                config.storage.uri = storage["uri"].as<std::string>();
            }
            if (storage["collection"]) {
                config.storage.collection = storage["collection"].as<std::string>();
            }
            if (storage["busy_timeout_ms"]) {
                config.storage.busy_timeout_ms = storage["busy_timeout_ms"].as<int>();
            }
        }

        // Load logging config
        if (yaml["logging"]) {
            if (yaml["logging"]["level"]) {
                config.logging.level = yaml["logging"]["level"].as<std::string>();
            }
        }

        if (!validate_config(config, error)) {
            return false;
        }

        LOG_INFO("[Config] Loaded " << config_path);
        log_config_summary(config);
        return true;
    } catch (const YAML::BadFile &e) {
        error = "Cannot open config file: " + config_path;
        return false;
    } catch (const YAML::ParserException &e) {
        error = "YAML parse error: " + std::string(e.what());
        return false;
    } catch (const std::exception &e) {
        error = "Config load error: " + std::string(e.what());
        return false;
    }
}

bool load_config_from_env(ServiceConfig &config, std::string &error) {
    const char *uri = env_or_null("INVENTORY_STORAGE_URI");
    if (uri == nullptr) {
        error =
            "Storage settings not found. Provide inventory-server.yaml in the working directory, pass "
            "--config=PATH, or set INVENTORY_STORAGE_URI (and optionally INVENTORY_STORAGE_COLLECTION, "
            "INVENTORY_HTTP_BIND, INVENTORY_HTTP_PORT, INVENTORY_LOG_LEVEL).";
        return false;
    }
    config.storage.uri = uri;

    if (const char *collection = env_or_null("INVENTORY_STORAGE_COLLECTION")) {
        config.storage.collection = collection;
    }
    if (const char *bind = env_or_null("INVENTORY_HTTP_BIND")) {
        config.http.bind = bind;
    }
    if (const char *level = env_or_null("INVENTORY_LOG_LEVEL")) {
        config.logging.level = level;
    }
    if (!parse_env_int("INVENTORY_HTTP_PORT", config.http.port, error) ||
        !parse_env_int("INVENTORY_STORAGE_BUSY_TIMEOUT_MS", config.storage.busy_timeout_ms, error)) {
        return false;
    }

    if (!validate_config(config, error)) {
        return false;
    }

    LOG_INFO("[Config] Loaded from environment");
    log_config_summary(config);
    return true;
}

bool resolve_config(const std::optional<std::string> &explicit_path, ServiceConfig &config, std::string &error) {
    if (explicit_path) {
        if (!std::filesystem::exists(*explicit_path)) {
            error = "Config file not found: " + *explicit_path;
            return false;
        }
        if (!load_config(*explicit_path, config, error)) {
            error = "Failed to load configuration from '" + *explicit_path + "': " + error;
            return false;
        }
        return true;
    }

    if (std::filesystem::exists(kDefaultConfigPath)) {
        ServiceConfig from_file;
        std::string file_error;
        if (load_config(kDefaultConfigPath, from_file, file_error)) {
            config = from_file;
            return true;
        }
        LOG_WARN("[Config] Ignoring invalid " << kDefaultConfigPath << ": " << file_error);
    }

    return load_config_from_env(config, error);
}

}  // namespace runtime
}  // namespace inventory

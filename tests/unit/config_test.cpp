#include "runtime/config.hpp"

#include <gtest/gtest.h>
#include <stdlib.h>

#include <filesystem>
#include <fstream>
#include <string>

namespace fs = std::filesystem;
using namespace inventory::runtime;

namespace {
const char *const kEnvVars[] = {"INVENTORY_STORAGE_URI",  "INVENTORY_STORAGE_COLLECTION",
                                "INVENTORY_HTTP_BIND",    "INVENTORY_HTTP_PORT",
                                "INVENTORY_LOG_LEVEL",    "INVENTORY_STORAGE_BUSY_TIMEOUT_MS"};
}  // namespace

class ConfigTest : public ::testing::Test {
protected:
    fs::path temp_dir;
    fs::path original_cwd;

    void SetUp() override {
        temp_dir = fs::temp_directory_path() / "inventory_config_test";
        fs::remove_all(temp_dir);
        fs::create_directories(temp_dir);
        original_cwd = fs::current_path();
        clear_env();
    }

    void TearDown() override {
        fs::current_path(original_cwd);
        clear_env();
        if (fs::exists(temp_dir)) {
            fs::remove_all(temp_dir);
        }
    }

    static void clear_env() {
        for (const char *name : kEnvVars) {
            unsetenv(name);
        }
    }

    std::string create_config_file(const std::string &name, const std::string &content) {
        fs::path config_path = temp_dir / name;
        std::ofstream file(config_path);
        file << content;
        file.close();
        return config_path.string();
    }
};

TEST_F(ConfigTest, ValidMinimalConfig) {
    std::string config_path = create_config_file("minimal.yaml", R"(
storage:
  uri: /var/lib/inventory/inventory.db
)");
    ServiceConfig config;
    std::string error;

    ASSERT_TRUE(load_config(config_path, config, error)) << "Error: " << error;
    EXPECT_EQ("/var/lib/inventory/inventory.db", config.storage.uri);
    EXPECT_EQ("devices", config.storage.collection);
    EXPECT_EQ(2000, config.storage.busy_timeout_ms);
    EXPECT_EQ("127.0.0.1", config.http.bind);
    EXPECT_EQ(8080, config.http.port);
    EXPECT_EQ("info", config.logging.level);
}

TEST_F(ConfigTest, FullConfig) {
    std::string config_path = create_config_file("full.yaml", R"(
http:
  bind: 0.0.0.0
  port: 9090
  thread_pool_size: 4
  cors_allowed_origins:
    - http://localhost:3000
    - https://*.example.com
  cors_allow_credentials: true
storage:
  uri: file:/tmp/inventory.db?cache=private
  collection: network_devices
  busy_timeout_ms: 500
logging:
  level: debug
)");
    ServiceConfig config;
    std::string error;

    ASSERT_TRUE(load_config(config_path, config, error)) << "Error: " << error;
    EXPECT_EQ("0.0.0.0", config.http.bind);
    EXPECT_EQ(9090, config.http.port);
    EXPECT_EQ(4, config.http.thread_pool_size);
    ASSERT_EQ(2u, config.http.cors_allowed_origins.size());
    EXPECT_EQ("https://*.example.com", config.http.cors_allowed_origins[1]);
    EXPECT_TRUE(config.http.cors_allow_credentials);
    EXPECT_EQ("file:/tmp/inventory.db?cache=private", config.storage.uri);
    EXPECT_EQ("network_devices", config.storage.collection);
    EXPECT_EQ(500, config.storage.busy_timeout_ms);
    EXPECT_EQ("debug", config.logging.level);
}

TEST_F(ConfigTest, ScalarCorsOrigin) {
    std::string config_path = create_config_file("cors.yaml", R"(
http:
  cors_allowed_origins: http://localhost:5173
storage:
  uri: inventory.db
)");
    ServiceConfig config;
    std::string error;

    ASSERT_TRUE(load_config(config_path, config, error)) << error;
    ASSERT_EQ(1u, config.http.cors_allowed_origins.size());
    EXPECT_EQ("http://localhost:5173", config.http.cors_allowed_origins[0]);
}

TEST_F(ConfigTest, MissingStorageUri) {
    std::string config_path = create_config_file("nouri.yaml", R"(
http:
  port: 8080
)");
    ServiceConfig config;
    std::string error;

    EXPECT_FALSE(load_config(config_path, config, error));
    EXPECT_NE(std::string::npos, error.find("storage.uri"));
}

TEST_F(ConfigTest, InMemoryDatabaseRejected) {
    for (const std::string uri : {":memory:", "file::memory:", "file:inv?mode=memory&cache=shared"}) {
        std::string config_path = create_config_file("memory.yaml", "storage:\n  uri: \"" + uri + "\"\n");
        ServiceConfig config;
        std::string error;

        EXPECT_FALSE(load_config(config_path, config, error)) << uri;
        EXPECT_NE(std::string::npos, error.find("in-memory")) << uri;
    }
}

TEST_F(ConfigTest, InvalidCollectionName) {
    std::string config_path = create_config_file("collection.yaml", R"(
storage:
  uri: inventory.db
  collection: "devices; DROP TABLE x"
)");
    ServiceConfig config;
    std::string error;

    EXPECT_FALSE(load_config(config_path, config, error));
    EXPECT_NE(std::string::npos, error.find("storage.collection"));
}

TEST_F(ConfigTest, CollectionNameRules) {
    EXPECT_TRUE(is_valid_collection_name("devices"));
    EXPECT_TRUE(is_valid_collection_name("_devices2"));
    EXPECT_TRUE(is_valid_collection_name("order"));
    EXPECT_FALSE(is_valid_collection_name(""));
    EXPECT_FALSE(is_valid_collection_name("2devices"));
    EXPECT_FALSE(is_valid_collection_name("dev-ices"));
    EXPECT_FALSE(is_valid_collection_name("dev ices"));
}

TEST_F(ConfigTest, InvalidPort) {
    std::string config_path = create_config_file("port.yaml", R"(
http:
  port: 70000
storage:
  uri: inventory.db
)");
    ServiceConfig config;
    std::string error;

    EXPECT_FALSE(load_config(config_path, config, error));
    EXPECT_NE(std::string::npos, error.find("port"));
}

TEST_F(ConfigTest, InvalidThreadPoolSize) {
    std::string config_path = create_config_file("pool.yaml", R"(
http:
  thread_pool_size: 0
storage:
  uri: inventory.db
)");
    ServiceConfig config;
    std::string error;

    EXPECT_FALSE(load_config(config_path, config, error));
    EXPECT_NE(std::string::npos, error.find("thread_pool_size"));
}

TEST_F(ConfigTest, NegativeBusyTimeout) {
    std::string config_path = create_config_file("busy.yaml", R"(
storage:
  uri: inventory.db
  busy_timeout_ms: -1
)");
    ServiceConfig config;
    std::string error;

    EXPECT_FALSE(load_config(config_path, config, error));
}

TEST_F(ConfigTest, InvalidLogLevel) {
    std::string config_path = create_config_file("log.yaml", R"(
storage:
  uri: inventory.db
logging:
  level: verbose
)");
    ServiceConfig config;
    std::string error;

    EXPECT_FALSE(load_config(config_path, config, error));
    EXPECT_NE(std::string::npos, error.find("Invalid log level"));
}

TEST_F(ConfigTest, ValidLogLevels) {
    for (const std::string level : {"debug", "info", "warn", "error"}) {
        std::string config_path =
            create_config_file("level.yaml", "storage:\n  uri: inventory.db\nlogging:\n  level: " + level + "\n");
        ServiceConfig config;
        std::string error;

        EXPECT_TRUE(load_config(config_path, config, error)) << level << ": " << error;
        EXPECT_EQ(level, config.logging.level);
    }
}

TEST_F(ConfigTest, UnknownKeysDoNotFailLoad) {
    std::string config_path = create_config_file("unknown.yaml", R"(
storage:
  uri: inventory.db
telemetry:
  enabled: true
)");
    ServiceConfig config;
    std::string error;

    EXPECT_TRUE(load_config(config_path, config, error)) << error;
}

TEST_F(ConfigTest, MalformedYaml) {
    std::string config_path = create_config_file("bad.yaml", "storage: [uri: \n  - : :");
    ServiceConfig config;
    std::string error;

    EXPECT_FALSE(load_config(config_path, config, error));
    EXPECT_FALSE(error.empty());
}

TEST_F(ConfigTest, WrongValueType) {
    std::string config_path = create_config_file("type.yaml", R"(
http:
  port: eighty
storage:
  uri: inventory.db
)");
    ServiceConfig config;
    std::string error;

    EXPECT_FALSE(load_config(config_path, config, error));
    EXPECT_NE(std::string::npos, error.find("Config load error"));
}

TEST_F(ConfigTest, FileNotFound) {
    ServiceConfig config;
    std::string error;

    EXPECT_FALSE(load_config((temp_dir / "nonexistent.yaml").string(), config, error));
    EXPECT_NE(std::string::npos, error.find("Cannot open config file"));
}

// ============================================================================
// Environment fallback and resolution order
// ============================================================================

TEST_F(ConfigTest, EnvironmentConfig) {
    setenv("INVENTORY_STORAGE_URI", "/data/inventory.db", 1);
    setenv("INVENTORY_STORAGE_COLLECTION", "assets", 1);
    setenv("INVENTORY_HTTP_PORT", "9100", 1);
    setenv("INVENTORY_LOG_LEVEL", "warn", 1);

    ServiceConfig config;
    std::string error;

    ASSERT_TRUE(load_config_from_env(config, error)) << error;
    EXPECT_EQ("/data/inventory.db", config.storage.uri);
    EXPECT_EQ("assets", config.storage.collection);
    EXPECT_EQ(9100, config.http.port);
    EXPECT_EQ("warn", config.logging.level);
}

TEST_F(ConfigTest, EnvironmentRequiresUri) {
    ServiceConfig config;
    std::string error;

    EXPECT_FALSE(load_config_from_env(config, error));
    EXPECT_NE(std::string::npos, error.find("INVENTORY_STORAGE_URI"));
}

TEST_F(ConfigTest, EnvironmentRejectsNonNumericPort) {
    setenv("INVENTORY_STORAGE_URI", "/data/inventory.db", 1);
    setenv("INVENTORY_HTTP_PORT", "80x", 1);

    ServiceConfig config;
    std::string error;

    EXPECT_FALSE(load_config_from_env(config, error));
    EXPECT_NE(std::string::npos, error.find("INVENTORY_HTTP_PORT"));
}

TEST_F(ConfigTest, ResolveExplicitPathMustExist) {
    setenv("INVENTORY_STORAGE_URI", "/data/inventory.db", 1);

    ServiceConfig config;
    std::string error;

    EXPECT_FALSE(resolve_config((temp_dir / "absent.yaml").string(), config, error));
    EXPECT_NE(std::string::npos, error.find("not found"));
}

TEST_F(ConfigTest, ResolveExplicitInvalidFileIsFatal) {
    setenv("INVENTORY_STORAGE_URI", "/data/inventory.db", 1);
    std::string config_path = create_config_file("explicit.yaml", "http:\n  port: 8080\n");

    ServiceConfig config;
    std::string error;

    EXPECT_FALSE(resolve_config(config_path, config, error));
}

TEST_F(ConfigTest, ResolvePrefersDefaultFile) {
    setenv("INVENTORY_STORAGE_URI", "/from/env.db", 1);
    create_config_file(kDefaultConfigPath, "storage:\n  uri: /from/file.db\n");
    fs::current_path(temp_dir);

    ServiceConfig config;
    std::string error;

    ASSERT_TRUE(resolve_config(std::nullopt, config, error)) << error;
    EXPECT_EQ("/from/file.db", config.storage.uri);
}

TEST_F(ConfigTest, ResolveFallsBackToEnvWhenDefaultFileInvalid) {
    setenv("INVENTORY_STORAGE_URI", "/from/env.db", 1);
    create_config_file(kDefaultConfigPath, "logging:\n  level: loud\n");
    fs::current_path(temp_dir);

    ServiceConfig config;
    std::string error;

    ASSERT_TRUE(resolve_config(std::nullopt, config, error)) << error;
    EXPECT_EQ("/from/env.db", config.storage.uri);
    EXPECT_EQ("info", config.logging.level);
}

TEST_F(ConfigTest, ResolveWithNothingConfigured) {
    fs::current_path(temp_dir);

    ServiceConfig config;
    std::string error;

    EXPECT_FALSE(resolve_config(std::nullopt, config, error));
    EXPECT_NE(std::string::npos, error.find("Storage settings not found"));
}

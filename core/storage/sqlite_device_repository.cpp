#include "sqlite_device_repository.hpp"

#include <nlohmann/json.hpp>

#include "logging/logger.hpp"
#include "model/device_json.hpp"
#include "sqlite_connection.hpp"

namespace inventory {
namespace storage {

namespace {

RepositoryResult storage_failure(const std::string &operation, const std::string &detail) {
    LOG_ERROR("[Storage] " << operation << " failed: " << detail);
    return RepositoryResult::failure(RepositoryStatus::STORAGE_FAILURE, detail);
}

// Collection names are plain identifiers, but may collide with SQL keywords
std::string quote_identifier(const std::string &name) { return "\"" + name + "\""; }

bool read_document(const std::string &text, model::Device &device, std::string &error) {
    nlohmann::json document = nlohmann::json::parse(text, nullptr, false);
    if (document.is_discarded()) {
        error = "Corrupt device document in store";
        return false;
    }
    if (!model::decode_device(document, device, error)) {
        error = "Corrupt device document in store: " + error;
        return false;
    }
    return true;
}

}  // namespace

SqliteDeviceRepository::SqliteDeviceRepository(const runtime::StorageConfig &config) : config_(config) {
    const std::string c = quote_identifier(config_.collection);
    sql_select_all_ = "SELECT document FROM " + c + " ORDER BY id ASC;";
    sql_select_by_name_ = "SELECT document FROM " + c + " WHERE name = ?1;";
    sql_insert_ = "INSERT INTO " + c + " (name, document) VALUES (?1, ?2);";
    sql_update_ = "UPDATE " + c + " SET document = ?2 WHERE name = ?1;";
    sql_delete_ = "DELETE FROM " + c + " WHERE name = ?1;";
    sql_ping_ = "SELECT id FROM " + c + " LIMIT 1;";
}

bool SqliteDeviceRepository::initialize(std::string &error) {
    const std::string c = quote_identifier(config_.collection);
    const std::string index = quote_identifier(config_.collection + "_uniq_name");
    try {
        SqliteConnection connection(config_.uri, config_.busy_timeout_ms);

        // WAL lets readers proceed while another connection writes
        connection.exec("PRAGMA journal_mode=WAL;");
        connection.exec("CREATE TABLE IF NOT EXISTS " + c +
                        " (id INTEGER PRIMARY KEY AUTOINCREMENT, name TEXT NOT NULL, document TEXT NOT NULL);");
        connection.exec("CREATE UNIQUE INDEX IF NOT EXISTS " + index + " ON " + c + " (name);");
    } catch (const StorageError &e) {
        error = "Failed to initialize collection '" + config_.collection + "': " + e.what();
        return false;
    }

    LOG_INFO("[Storage] Collection '" << config_.collection << "' ready at " << config_.uri);
    return true;
}

RepositoryResult SqliteDeviceRepository::list_all(std::vector<model::Device> &devices) {
    devices.clear();
    try {
        SqliteConnection connection(config_.uri, config_.busy_timeout_ms);
        SqliteStatement stmt(connection, sql_select_all_);

        while (stmt.step() == SQLITE_ROW) {
            model::Device device;
            std::string error;
            if (!read_document(stmt.column_text(0), device, error)) {
                devices.clear();
                return storage_failure("list_all", error);
            }
            devices.push_back(std::move(device));
        }
    } catch (const StorageError &e) {
        devices.clear();
        return storage_failure("list_all", e.what());
    }

    return RepositoryResult::success();
}

RepositoryResult SqliteDeviceRepository::find_by_name(const std::string &name, std::optional<model::Device> &device) {
    device.reset();
    try {
        SqliteConnection connection(config_.uri, config_.busy_timeout_ms);
        SqliteStatement stmt(connection, sql_select_by_name_);
        stmt.bind_text(1, name);

        if (stmt.step() == SQLITE_ROW) {
            model::Device found;
            std::string error;
            if (!read_document(stmt.column_text(0), found, error)) {
                return storage_failure("find_by_name", error);
            }
            device = std::move(found);
        }
    } catch (const StorageError &e) {
        return storage_failure("find_by_name", e.what());
    }

    return RepositoryResult::success();
}

RepositoryResult SqliteDeviceRepository::insert(const model::Device &device) {
    try {
        SqliteConnection connection(config_.uri, config_.busy_timeout_ms);
        SqliteStatement stmt(connection, sql_insert_);
        stmt.bind_text(1, device.name);
        stmt.bind_text(2, model::encode_device(device).dump());
        stmt.step();
    } catch (const StorageError &e) {
        if (e.is_unique_violation()) {
            LOG_DEBUG("[Storage] Unique index rejected insert of '" << device.name << "'");
            return RepositoryResult::failure(RepositoryStatus::DUPLICATE, "Device name already exists");
        }
        return storage_failure("insert", e.what());
    }

    LOG_DEBUG("[Storage] Inserted device '" << device.name << "'");
    return RepositoryResult::success();
}

RepositoryResult SqliteDeviceRepository::update_by_name(const std::string &name, const model::DeviceFields &fields) {
    model::Device updated{name, fields.ip_address, fields.type, fields.location};
    try {
        SqliteConnection connection(config_.uri, config_.busy_timeout_ms);
        SqliteStatement stmt(connection, sql_update_);
        stmt.bind_text(1, name);
        stmt.bind_text(2, model::encode_device(updated).dump());
        stmt.step();

        if (connection.changes() == 0) {
            return RepositoryResult::failure(RepositoryStatus::NOT_FOUND, "Device not found");
        }
    } catch (const StorageError &e) {
        return storage_failure("update_by_name", e.what());
    }

    LOG_DEBUG("[Storage] Updated device '" << name << "'");
    return RepositoryResult::success();
}

RepositoryResult SqliteDeviceRepository::delete_by_name(const std::string &name) {
    try {
        SqliteConnection connection(config_.uri, config_.busy_timeout_ms);
        SqliteStatement stmt(connection, sql_delete_);
        stmt.bind_text(1, name);
        stmt.step();

        if (connection.changes() == 0) {
            return RepositoryResult::failure(RepositoryStatus::NOT_FOUND, "Device not found");
        }
    } catch (const StorageError &e) {
        return storage_failure("delete_by_name", e.what());
    }

    LOG_DEBUG("[Storage] Deleted device '" << name << "'");
    return RepositoryResult::success();
}

RepositoryResult SqliteDeviceRepository::ping() {
    try {
        SqliteConnection connection(config_.uri, config_.busy_timeout_ms);
        SqliteStatement stmt(connection, sql_ping_);
        stmt.step();
    } catch (const StorageError &e) {
        return RepositoryResult::failure(RepositoryStatus::STORAGE_FAILURE, e.what());
    }
    return RepositoryResult::success();
}

}  // namespace storage
}  // namespace inventory

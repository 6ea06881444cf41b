#include "sqlite_connection.hpp"

#include <limits>

namespace inventory {
namespace storage {

namespace {

StorageError make_error(sqlite3 *db, const std::string &context) {
    if (db == nullptr) {
        return StorageError(context + ": out of memory", SQLITE_NOMEM);
    }
    return StorageError(context + ": " + sqlite3_errmsg(db), sqlite3_extended_errcode(db));
}

}  // namespace

SqliteConnection::SqliteConnection(const std::string &uri, int busy_timeout_ms) {
    const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_URI | SQLITE_OPEN_FULLMUTEX;
    if (sqlite3_open_v2(uri.c_str(), &db_, flags, nullptr) != SQLITE_OK) {
        StorageError error = make_error(db_, "Failed to open database '" + uri + "'");
        if (db_ != nullptr) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
        throw error;
    }

    sqlite3_extended_result_codes(db_, 1);
    sqlite3_busy_timeout(db_, busy_timeout_ms);
}

SqliteConnection::~SqliteConnection() {
    if (db_ != nullptr) {
        sqlite3_close(db_);
    }
}

void SqliteConnection::exec(const std::string &sql) {
    char *err_msg = nullptr;
    if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err_msg) != SQLITE_OK) {
        std::string message = err_msg != nullptr ? err_msg : "Unknown error";
        sqlite3_free(err_msg);
        throw StorageError("Statement failed: " + message, sqlite3_extended_errcode(db_));
    }
}

SqliteStatement::SqliteStatement(SqliteConnection &connection, const std::string &sql) : db_(connection.get()) {
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt_, nullptr) != SQLITE_OK) {
        throw make_error(db_, "Failed to prepare statement");
    }
}

SqliteStatement::~SqliteStatement() {
    if (stmt_ != nullptr) {
        sqlite3_finalize(stmt_);
    }
}

void SqliteStatement::bind_text(int index, const std::string &value) {
    if (value.size() > static_cast<size_t>(std::numeric_limits<int>::max())) {
        throw StorageError("Failed to bind text: value exceeds SQLite length limit", SQLITE_TOOBIG);
    }
    if (sqlite3_bind_text(stmt_, index, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT) !=
        SQLITE_OK) {
        throw make_error(db_, "Failed to bind text");
    }
}

int SqliteStatement::step() {
    int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW || rc == SQLITE_DONE) {
        return rc;
    }
    throw make_error(db_, "Statement execution failed");
}

std::string SqliteStatement::column_text(int index) const {
    const auto *text = reinterpret_cast<const char *>(sqlite3_column_text(stmt_, index));
    return text != nullptr ? std::string(text) : std::string();
}

}  // namespace storage
}  // namespace inventory

#ifndef INVENTORY_STORAGE_SQLITE_CONNECTION_HPP
#define INVENTORY_STORAGE_SQLITE_CONNECTION_HPP

#include <sqlite3.h>

#include <stdexcept>
#include <string>

namespace inventory {
namespace storage {

/**
 * @brief Failure reported by the document store
 *
 * Carries the SQLite extended result code so callers can tell a
 * unique-index violation apart from connectivity or I/O faults.
 */
class StorageError : public std::runtime_error {
public:
    StorageError(const std::string &message, int code) : std::runtime_error(message), code_(code) {}

    int code() const noexcept { return code_; }

    bool is_unique_violation() const noexcept {
        return code_ == SQLITE_CONSTRAINT_UNIQUE || code_ == SQLITE_CONSTRAINT_PRIMARYKEY;
    }

private:
    int code_;
};

/**
 * @brief RAII connection to the document store
 *
 * One connection is opened per storage call and closed when it goes
 * out of scope, on every exit path. The URI may be a plain file path
 * or an SQLite "file:" URI.
 *
 * @throws StorageError if the database cannot be opened
 */
class SqliteConnection {
public:
    SqliteConnection(const std::string &uri, int busy_timeout_ms);
    ~SqliteConnection();

    SqliteConnection(const SqliteConnection &) = delete;
    SqliteConnection &operator=(const SqliteConnection &) = delete;

    sqlite3 *get() const { return db_; }

    // Run one or more statements without result rows
    void exec(const std::string &sql);

    // Rows touched by the last INSERT/UPDATE/DELETE on this connection
    int changes() const { return sqlite3_changes(db_); }

private:
    sqlite3 *db_{nullptr};
};

/// RAII wrapper for prepared statements
class SqliteStatement {
public:
    SqliteStatement(SqliteConnection &connection, const std::string &sql);
    ~SqliteStatement();

    SqliteStatement(const SqliteStatement &) = delete;
    SqliteStatement &operator=(const SqliteStatement &) = delete;

    void bind_text(int index, const std::string &value);

    // Returns SQLITE_ROW or SQLITE_DONE; anything else throws StorageError
    int step();

    std::string column_text(int index) const;

private:
    sqlite3 *db_;
    sqlite3_stmt *stmt_{nullptr};
};

}  // namespace storage
}  // namespace inventory

#endif  // INVENTORY_STORAGE_SQLITE_CONNECTION_HPP

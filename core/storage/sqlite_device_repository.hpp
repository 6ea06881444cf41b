#ifndef INVENTORY_STORAGE_SQLITE_DEVICE_REPOSITORY_HPP
#define INVENTORY_STORAGE_SQLITE_DEVICE_REPOSITORY_HPP

#include <string>

#include "device_repository.hpp"
#include "runtime/config.hpp"

namespace inventory {
namespace storage {

/**
 * @brief Device repository over an SQLite document collection
 *
 * Schema (one table per collection):
 *   <collection>(id INTEGER PRIMARY KEY AUTOINCREMENT, name TEXT NOT NULL, document TEXT NOT NULL)
 *   UNIQUE INDEX <collection>_uniq_name ON <collection>(name)
 *
 * The document column holds the JSON device record. The id column only
 * orders records by insertion and is never returned.
 *
 * Thread model: stateless apart from the immutable configuration. Each
 * call opens its own connection, so concurrent requests do not share a
 * handle. Name collisions between concurrent inserts are settled by the
 * unique index.
 */
class SqliteDeviceRepository : public IDeviceRepository {
public:
    explicit SqliteDeviceRepository(const runtime::StorageConfig &config);

    bool initialize(std::string &error) override;

    RepositoryResult list_all(std::vector<model::Device> &devices) override;
    RepositoryResult find_by_name(const std::string &name, std::optional<model::Device> &device) override;
    RepositoryResult insert(const model::Device &device) override;
    RepositoryResult update_by_name(const std::string &name, const model::DeviceFields &fields) override;
    RepositoryResult delete_by_name(const std::string &name) override;
    RepositoryResult ping() override;

private:
    runtime::StorageConfig config_;

    // Pre-built statements (collection name is validated by config loading and quoted)
    std::string sql_select_all_;
    std::string sql_select_by_name_;
    std::string sql_insert_;
    std::string sql_update_;
    std::string sql_delete_;
    std::string sql_ping_;
};

}  // namespace storage
}  // namespace inventory

#endif  // INVENTORY_STORAGE_SQLITE_DEVICE_REPOSITORY_HPP

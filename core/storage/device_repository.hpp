#ifndef INVENTORY_STORAGE_DEVICE_REPOSITORY_HPP
#define INVENTORY_STORAGE_DEVICE_REPOSITORY_HPP

#include <optional>
#include <string>
#include <vector>

#include "model/device.hpp"

namespace inventory {
namespace storage {

// Outcome of a repository operation
enum class RepositoryStatus {
    OK,
    DUPLICATE,        // A device with the same name already exists
    NOT_FOUND,        // No device matches the name
    STORAGE_FAILURE   // Connectivity, I/O or protocol fault in the store
};

struct RepositoryResult {
    RepositoryStatus status = RepositoryStatus::OK;
    std::string error_message;

    bool ok() const { return status == RepositoryStatus::OK; }

    static RepositoryResult success() { return {}; }
    static RepositoryResult failure(RepositoryStatus status, std::string message) {
        return {status, std::move(message)};
    }
};

std::string repository_status_to_string(RepositoryStatus status);

/**
 * @brief Device collection access
 *
 * Interface so handlers can be tested against a mock. Implementations
 * hold no cache and keep no per-request state; every call goes to the
 * store. Internal storage identifiers never leave the repository.
 */
class IDeviceRepository {
public:
    virtual ~IDeviceRepository() = default;

    // Create the collection and its unique name index if absent
    virtual bool initialize(std::string &error) = 0;

    // All devices in insertion order
    virtual RepositoryResult list_all(std::vector<model::Device> &devices) = 0;

    // OK with device unset when no record matches
    virtual RepositoryResult find_by_name(const std::string &name, std::optional<model::Device> &device) = 0;

    // DUPLICATE when the name is already taken, including a lost insert race
    virtual RepositoryResult insert(const model::Device &device) = 0;

    // Replaces every field except the name; NOT_FOUND if nothing matches
    virtual RepositoryResult update_by_name(const std::string &name, const model::DeviceFields &fields) = 0;

    // NOT_FOUND if nothing matches
    virtual RepositoryResult delete_by_name(const std::string &name) = 0;

    // Store reachable and collection queryable
    virtual RepositoryResult ping() = 0;
};

}  // namespace storage
}  // namespace inventory

#endif  // INVENTORY_STORAGE_DEVICE_REPOSITORY_HPP

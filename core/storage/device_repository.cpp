#include "device_repository.hpp"

namespace inventory {
namespace storage {

std::string repository_status_to_string(RepositoryStatus status) {
    switch (status) {
        case RepositoryStatus::OK:
            return "OK";
        case RepositoryStatus::DUPLICATE:
            return "DUPLICATE";
        case RepositoryStatus::NOT_FOUND:
            return "NOT_FOUND";
        case RepositoryStatus::STORAGE_FAILURE:
            return "STORAGE_FAILURE";
        default:
            return "STORAGE_FAILURE";
    }
}

}  // namespace storage
}  // namespace inventory

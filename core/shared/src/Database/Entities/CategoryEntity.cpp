#include "Database/Entities/CategoryEntity.h"
#include "Database/Repositories/RepositoryHelpers.h"

namespace ImageVault {
namespace Database {
namespace Entities {

using Repositories::RepositoryHelpers;

json CategoryEntity::toJson() const {
    json j;
    j["id"] = id_;
    j["name"] = name_;
    j["created_at"] = RepositoryHelpers::formatTimestamp(created_at_);
    j["updated_at"] = RepositoryHelpers::formatTimestamp(updated_at_);
    return j;
}

std::string CategoryEntity::toString() const {
    return toJson().dump(2);
}

} // namespace Entities
} // namespace Database
} // namespace ImageVault

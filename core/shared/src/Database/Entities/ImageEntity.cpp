#include "Database/Entities/ImageEntity.h"
#include "Database/Repositories/RepositoryHelpers.h"

namespace ImageVault {
namespace Database {
namespace Entities {

using Repositories::RepositoryHelpers;

json ImageEntity::toJson() const {
    json j;
    j["id"] = id_;
    j["product_id"] = product_id_;
    j["name"] = name_;
    j["code"] = code_;
    j["file_path"] = file_path_.has_value() ? json(*file_path_) : json(nullptr);
    j["url"] = url_.has_value() ? json(*url_) : json(nullptr);
    j["created_at"] = RepositoryHelpers::formatTimestamp(created_at_);
    j["updated_at"] = RepositoryHelpers::formatTimestamp(updated_at_);
    return j;
}

std::string ImageEntity::toString() const {
    return toJson().dump(2);
}

} // namespace Entities
} // namespace Database
} // namespace ImageVault

#include "Database/Entities/ProductEntity.h"
#include "Database/Repositories/RepositoryHelpers.h"

namespace ImageVault {
namespace Database {
namespace Entities {

using Repositories::RepositoryHelpers;

// =============================================================================
// JSON 직렬화 - 선택 항목은 null
// =============================================================================

json ProductEntity::toJson() const {
    json j;
    j["id"] = id_;
    j["category_id"] = category_id_;
    j["name"] = name_;
    j["marked_price"] = marked_price_.has_value() ? json(*marked_price_) : json(nullptr);
    j["min_discounted_price"] =
        min_discounted_price_.has_value() ? json(*min_discounted_price_) : json(nullptr);
    j["description"] = description_.has_value() ? json(*description_) : json(nullptr);
    j["created_at"] = RepositoryHelpers::formatTimestamp(created_at_);
    j["updated_at"] = RepositoryHelpers::formatTimestamp(updated_at_);
    return j;
}

std::string ProductEntity::toString() const {
    return toJson().dump(2);
}

} // namespace Entities
} // namespace Database
} // namespace ImageVault

/**
 * @file CategoryEntity.h
 * @brief 테넌트 카테고리 엔티티 (store_<id>_categories 행)
 */

#ifndef IMAGEVAULT_CATEGORY_ENTITY_H
#define IMAGEVAULT_CATEGORY_ENTITY_H

#include "CoreEntity.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace ImageVault {
namespace Database {
namespace Entities {

using json = nlohmann::json;

class CategoryEntity : public DbLib::CoreEntity<CategoryEntity> {
public:
    CategoryEntity() = default;
    explicit CategoryEntity(int64_t id) : CoreEntity(id) {}

    const std::string& getName() const { return name_; }

    void setName(const std::string& name) {
        name_ = name;
        markModified();
    }

    json toJson() const;
    std::string toString() const;

private:
    std::string name_;
};

} // namespace Entities
} // namespace Database
} // namespace ImageVault

#endif // IMAGEVAULT_CATEGORY_ENTITY_H

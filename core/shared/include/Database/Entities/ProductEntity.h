/**
 * @file ProductEntity.h
 * @brief 테넌트 상품 엔티티 (store_<id>_products 행)
 *
 * 가격/설명은 선택 항목이며 NULL 로 저장된다.
 */

#ifndef IMAGEVAULT_PRODUCT_ENTITY_H
#define IMAGEVAULT_PRODUCT_ENTITY_H

#include "CoreEntity.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace ImageVault {
namespace Database {
namespace Entities {

using json = nlohmann::json;

class ProductEntity : public DbLib::CoreEntity<ProductEntity> {
public:
    ProductEntity() = default;
    explicit ProductEntity(int64_t id) : CoreEntity(id) {}

    // =======================================================================
    // Getter
    // =======================================================================

    int64_t getCategoryId() const { return category_id_; }
    const std::string& getName() const { return name_; }
    const std::optional<double>& getMarkedPrice() const { return marked_price_; }
    const std::optional<double>& getMinDiscountedPrice() const { return min_discounted_price_; }
    const std::optional<std::string>& getDescription() const { return description_; }

    // =======================================================================
    // Setter
    // =======================================================================

    void setCategoryId(int64_t category_id) {
        category_id_ = category_id;
        markModified();
    }

    void setName(const std::string& name) {
        name_ = name;
        markModified();
    }

    void setMarkedPrice(const std::optional<double>& price) {
        marked_price_ = price;
        markModified();
    }

    void setMinDiscountedPrice(const std::optional<double>& price) {
        min_discounted_price_ = price;
        markModified();
    }

    void setDescription(const std::optional<std::string>& description) {
        description_ = description;
        markModified();
    }

    json toJson() const;
    std::string toString() const;

private:
    int64_t category_id_ = 0;
    std::string name_;
    std::optional<double> marked_price_;
    std::optional<double> min_discounted_price_;
    std::optional<std::string> description_;
};

} // namespace Entities
} // namespace Database
} // namespace ImageVault

#endif // IMAGEVAULT_PRODUCT_ENTITY_H

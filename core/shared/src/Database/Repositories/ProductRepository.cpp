/**
 * @file ProductRepository.cpp
 */

#include "Database/Repositories/ProductRepository.h"
#include "Database/Repositories/RepositoryHelpers.h"

#include <stdexcept>

namespace ImageVault {
namespace Database {
namespace Repositories {

ProductRepository::ProductRepository(DbLib::SqlSession& session,
                                     const TenantTableSet& tables)
    : CoreRepository(session, "ProductRepository", tables.products(), &ProductRepository::mapRow) {}

// =============================================================================
// 쓰기
// =============================================================================

ProductEntity ProductRepository::insert(const ProductEntity& draft) {
    auto now = RepositoryHelpers::nowSeconds();
    std::string ts = RepositoryHelpers::formatTimestamp(now);

    session_.executeNonQuery(
        "INSERT INTO " + table_name_ +
        " (category_id, name, marked_price, min_discounted_price, description, created_at, updated_at)"
        " VALUES (?, ?, ?, ?, ?, ?, ?)",
        {draft.getCategoryId(),
         draft.getName(),
         RepositoryHelpers::toSqlValue(draft.getMarkedPrice()),
         RepositoryHelpers::toSqlValue(draft.getMinDiscountedPrice()),
         RepositoryHelpers::toSqlValue(draft.getDescription()),
         ts,
         ts});

    ProductEntity saved = draft;
    saved.markSaved(session_.lastInsertId(), now);
    return saved;
}

std::optional<ProductEntity> ProductRepository::update(const ProductEntity& entity) {
    std::string ts = RepositoryHelpers::formatTimestamp(RepositoryHelpers::nowSeconds());
    int changed = session_.executeNonQuery(
        "UPDATE " + table_name_ +
        " SET category_id = ?, name = ?, marked_price = ?, min_discounted_price = ?,"
        " description = ?, updated_at = ? WHERE id = ?",
        {entity.getCategoryId(),
         entity.getName(),
         RepositoryHelpers::toSqlValue(entity.getMarkedPrice()),
         RepositoryHelpers::toSqlValue(entity.getMinDiscountedPrice()),
         RepositoryHelpers::toSqlValue(entity.getDescription()),
         ts,
         entity.getId()});
    if (changed == 0) {
        return std::nullopt;
    }
    return findById(entity.getId());
}

int ProductRepository::deleteByCategory(int64_t category_id) {
    return session_.executeNonQuery(
        "DELETE FROM " + table_name_ + " WHERE category_id = ?", {category_id});
}

// =============================================================================
// 조회
// =============================================================================

std::vector<int64_t> ProductRepository::findIdsByCategory(int64_t category_id) {
    auto rows = session_.executeQuery(
        "SELECT id FROM " + table_name_ + " WHERE category_id = ? ORDER BY id ASC",
        {category_id});

    std::vector<int64_t> ids;
    ids.reserve(rows.size());
    for (const auto& row : rows) {
        ids.push_back(RepositoryHelpers::getRowValueAsInt64(row, "id"));
    }
    return ids;
}

DbLib::RowCursor<ProductEntity> ProductRepository::find(const TenantQuery& query) {
    return findByConditions(buildConditions(query), query.order_by, query.pagination);
}

int ProductRepository::count(const TenantQuery& query) {
    return countByConditions(buildConditions(query));
}

std::vector<QueryCondition> ProductRepository::buildConditions(const TenantQuery& query) const {
    if (query.code_contains.has_value()) {
        throw std::invalid_argument("ProductRepository: products have no code");
    }
    std::vector<QueryCondition> conditions;
    if (query.parent_id.has_value()) {
        conditions.push_back(QueryCondition::EqualInt("category_id", *query.parent_id));
    }
    if (query.name_contains.has_value()) {
        conditions.push_back(QueryCondition::Contains("name", *query.name_contains));
    }
    return conditions;
}

std::string ProductRepository::selectColumns() const {
    return "id, category_id, name, marked_price, min_discounted_price, description, "
           "created_at, updated_at";
}

std::vector<std::string> ProductRepository::sortableColumns() const {
    return {"id", "name", "updated_at"};
}

ProductEntity ProductRepository::mapRow(const Row& row) {
    ProductEntity entity(RepositoryHelpers::getRowValueAsInt64(row, "id"));
    entity.setCategoryId(RepositoryHelpers::getRowValueAsInt64(row, "category_id"));
    entity.setName(RepositoryHelpers::getRowValue(row, "name"));
    entity.setMarkedPrice(RepositoryHelpers::getOptionalDouble(row, "marked_price"));
    entity.setMinDiscountedPrice(RepositoryHelpers::getOptionalDouble(row, "min_discounted_price"));
    entity.setDescription(RepositoryHelpers::getOptionalString(row, "description"));
    entity.setCreatedAt(RepositoryHelpers::getRowValueAsTime(row, "created_at"));
    entity.setUpdatedAt(RepositoryHelpers::getRowValueAsTime(row, "updated_at"));
    entity.markSaved(entity.getId(), entity.getUpdatedAt());
    return entity;
}

} // namespace Repositories
} // namespace Database
} // namespace ImageVault

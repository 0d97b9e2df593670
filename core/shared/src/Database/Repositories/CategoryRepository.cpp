/**
 * @file CategoryRepository.cpp
 * @brief 테이블 이름은 TenantTableSet 에서, 값은 전부 바인드 파라미터
 */

#include "Database/Repositories/CategoryRepository.h"
#include "Database/Repositories/RepositoryHelpers.h"

#include <stdexcept>

namespace ImageVault {
namespace Database {
namespace Repositories {

CategoryRepository::CategoryRepository(DbLib::SqlSession& session,
                                       const TenantTableSet& tables)
    : CoreRepository(session, "CategoryRepository", tables.categories(), &CategoryRepository::mapRow) {}

// =============================================================================
// 쓰기
// =============================================================================

CategoryEntity CategoryRepository::insert(const std::string& name) {
    auto now = RepositoryHelpers::nowSeconds();
    std::string ts = RepositoryHelpers::formatTimestamp(now);

    session_.executeNonQuery(
        "INSERT INTO " + table_name_ + " (name, created_at, updated_at) VALUES (?, ?, ?)",
        {name, ts, ts});

    CategoryEntity entity;
    entity.setName(name);
    entity.markSaved(session_.lastInsertId(), now);
    return entity;
}

std::optional<CategoryEntity> CategoryRepository::updateName(int64_t id, const std::string& name) {
    std::string ts = RepositoryHelpers::formatTimestamp(RepositoryHelpers::nowSeconds());
    int changed = session_.executeNonQuery(
        "UPDATE " + table_name_ + " SET name = ?, updated_at = ? WHERE id = ?",
        {name, ts, id});
    if (changed == 0) {
        return std::nullopt;
    }
    return findById(id);
}

// =============================================================================
// 조회
// =============================================================================

DbLib::RowCursor<CategoryEntity> CategoryRepository::find(const TenantQuery& query) {
    return findByConditions(buildConditions(query), query.order_by, query.pagination);
}

int CategoryRepository::count(const TenantQuery& query) {
    return countByConditions(buildConditions(query));
}

std::vector<QueryCondition> CategoryRepository::buildConditions(const TenantQuery& query) const {
    if (query.parent_id.has_value() || query.code_contains.has_value()) {
        throw std::invalid_argument("CategoryRepository: categories have no parent or code");
    }
    std::vector<QueryCondition> conditions;
    if (query.name_contains.has_value()) {
        conditions.push_back(QueryCondition::Contains("name", *query.name_contains));
    }
    return conditions;
}

std::string CategoryRepository::selectColumns() const {
    return "id, name, created_at, updated_at";
}

std::vector<std::string> CategoryRepository::sortableColumns() const {
    return {"id", "name", "updated_at"};
}

CategoryEntity CategoryRepository::mapRow(const Row& row) {
    CategoryEntity entity(RepositoryHelpers::getRowValueAsInt64(row, "id"));
    entity.setName(RepositoryHelpers::getRowValue(row, "name"));
    entity.setCreatedAt(RepositoryHelpers::getRowValueAsTime(row, "created_at"));
    entity.setUpdatedAt(RepositoryHelpers::getRowValueAsTime(row, "updated_at"));
    // setName 이 MODIFIED 로 바꾸므로 로드 상태로 되돌린다
    entity.markSaved(entity.getId(), entity.getUpdatedAt());
    return entity;
}

} // namespace Repositories
} // namespace Database
} // namespace ImageVault

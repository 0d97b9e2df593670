/**
 * @file ImageRepository.cpp
 */

#include "Database/Repositories/ImageRepository.h"
#include "Database/Repositories/RepositoryHelpers.h"

namespace ImageVault {
namespace Database {
namespace Repositories {

ImageRepository::ImageRepository(DbLib::SqlSession& session,
                                 const TenantTableSet& tables)
    : CoreRepository(session, "ImageRepository", tables.images(), &ImageRepository::mapRow) {}

// =============================================================================
// 쓰기
// =============================================================================

ImageEntity ImageRepository::insert(const ImageEntity& draft) {
    auto now = RepositoryHelpers::nowSeconds();
    std::string ts = RepositoryHelpers::formatTimestamp(now);

    session_.executeNonQuery(
        "INSERT INTO " + table_name_ +
        " (product_id, name, code, file_path, url, created_at, updated_at)"
        " VALUES (?, ?, ?, ?, ?, ?, ?)",
        {draft.getProductId(),
         draft.getName(),
         draft.getCode(),
         RepositoryHelpers::toSqlValue(draft.getFilePath()),
         RepositoryHelpers::toSqlValue(draft.getUrl()),
         ts,
         ts});

    ImageEntity saved = draft;
    saved.markSaved(session_.lastInsertId(), now);
    return saved;
}

std::optional<ImageEntity> ImageRepository::update(const ImageEntity& entity) {
    std::string ts = RepositoryHelpers::formatTimestamp(RepositoryHelpers::nowSeconds());
    int changed = session_.executeNonQuery(
        "UPDATE " + table_name_ +
        " SET product_id = ?, name = ?, code = ?, file_path = ?, url = ?, updated_at = ?"
        " WHERE id = ?",
        {entity.getProductId(),
         entity.getName(),
         entity.getCode(),
         RepositoryHelpers::toSqlValue(entity.getFilePath()),
         RepositoryHelpers::toSqlValue(entity.getUrl()),
         ts,
         entity.getId()});
    if (changed == 0) {
        return std::nullopt;
    }
    return findById(entity.getId());
}

std::optional<ImageEntity> ImageRepository::updateCode(int64_t id, const std::string& code) {
    std::string ts = RepositoryHelpers::formatTimestamp(RepositoryHelpers::nowSeconds());
    int changed = session_.executeNonQuery(
        "UPDATE " + table_name_ + " SET code = ?, updated_at = ? WHERE id = ?",
        {code, ts, id});
    if (changed == 0) {
        return std::nullopt;
    }
    return findById(id);
}

int ImageRepository::deleteByProduct(int64_t product_id) {
    return session_.executeNonQuery(
        "DELETE FROM " + table_name_ + " WHERE product_id = ?", {product_id});
}

int ImageRepository::deleteByProducts(const std::vector<int64_t>& product_ids) {
    if (product_ids.empty()) {
        return 0;
    }
    std::vector<SqlValue> params;
    std::string in_clause = RepositoryHelpers::buildInClause(product_ids, params);
    return session_.executeNonQuery(
        "DELETE FROM " + table_name_ + " WHERE product_id IN " + in_clause, params);
}

// =============================================================================
// 조회
// =============================================================================

std::optional<ImageEntity> ImageRepository::findByCode(const std::string& code) {
    auto row = session_.executeQueryOne(
        "SELECT " + selectColumns() + " FROM " + table_name_ + " WHERE code = ?", {code});
    if (!row) {
        return std::nullopt;
    }
    return mapRow(*row);
}

bool ImageRepository::codeExists(const std::string& code, int64_t exclude_id) {
    if (exclude_id > 0) {
        return session_.executeQueryOne(
                   "SELECT 1 AS found FROM " + table_name_ + " WHERE code = ? AND id != ?",
                   {code, exclude_id})
            .has_value();
    }
    return session_.executeQueryOne(
               "SELECT 1 AS found FROM " + table_name_ + " WHERE code = ?", {code})
        .has_value();
}

DbLib::RowCursor<ImageEntity> ImageRepository::find(const TenantQuery& query) {
    return findByConditions(buildConditions(query), query.order_by, query.pagination);
}

int ImageRepository::count(const TenantQuery& query) {
    return countByConditions(buildConditions(query));
}

std::vector<QueryCondition> ImageRepository::buildConditions(const TenantQuery& query) const {
    std::vector<QueryCondition> conditions;
    if (query.parent_id.has_value()) {
        conditions.push_back(QueryCondition::EqualInt("product_id", *query.parent_id));
    }
    if (query.name_contains.has_value()) {
        conditions.push_back(QueryCondition::Contains("name", *query.name_contains));
    }
    if (query.code_contains.has_value()) {
        conditions.push_back(QueryCondition::Contains("code", *query.code_contains));
    }
    return conditions;
}

std::string ImageRepository::selectColumns() const {
    return "id, product_id, name, code, file_path, url, created_at, updated_at";
}

std::vector<std::string> ImageRepository::sortableColumns() const {
    return {"id", "name", "code", "updated_at"};
}

ImageEntity ImageRepository::mapRow(const Row& row) {
    ImageEntity entity(RepositoryHelpers::getRowValueAsInt64(row, "id"));
    entity.setProductId(RepositoryHelpers::getRowValueAsInt64(row, "product_id"));
    entity.setName(RepositoryHelpers::getRowValue(row, "name"));
    entity.setCode(RepositoryHelpers::getRowValue(row, "code"));
    entity.setFilePath(RepositoryHelpers::getOptionalString(row, "file_path"));
    entity.setUrl(RepositoryHelpers::getOptionalString(row, "url"));
    entity.setCreatedAt(RepositoryHelpers::getRowValueAsTime(row, "created_at"));
    entity.setUpdatedAt(RepositoryHelpers::getRowValueAsTime(row, "updated_at"));
    entity.markSaved(entity.getId(), entity.getUpdatedAt());
    return entity;
}

} // namespace Repositories
} // namespace Database
} // namespace ImageVault

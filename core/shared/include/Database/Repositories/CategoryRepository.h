#ifndef IMAGEVAULT_CATEGORY_REPOSITORY_H
#define IMAGEVAULT_CATEGORY_REPOSITORY_H

/**
 * @file CategoryRepository.h
 * @brief store_<id>_categories CRUD
 */

#include "CoreRepository.hpp"
#include "Database/Entities/CategoryEntity.h"
#include "Database/IdentifierSanitizer.h"
#include "Database/Repositories/RepositoryHelpers.h"
#include "Database/TenantQuery.h"

#include <optional>
#include <string>

namespace ImageVault {
namespace Database {
namespace Repositories {

using CategoryEntity = ImageVault::Database::Entities::CategoryEntity;

class CategoryRepository : public DbLib::CoreRepository<CategoryEntity> {
public:
    CategoryRepository(DbLib::SqlSession& session, const TenantTableSet& tables);

    CategoryEntity insert(const std::string& name);

    /**
     * @return 갱신된 행, 대상이 없으면 std::nullopt
     */
    std::optional<CategoryEntity> updateName(int64_t id, const std::string& name);

    /**
     * @throws std::invalid_argument parent_id/code_contains 지정 또는 허용되지 않은 정렬 컬럼
     */
    DbLib::RowCursor<CategoryEntity> find(const TenantQuery& query);
    int count(const TenantQuery& query = {});

protected:
    std::string selectColumns() const override;
    std::vector<std::string> sortableColumns() const override;

private:
    static CategoryEntity mapRow(const Row& row);
    std::vector<QueryCondition> buildConditions(const TenantQuery& query) const;
};

} // namespace Repositories
} // namespace Database
} // namespace ImageVault

#endif // IMAGEVAULT_CATEGORY_REPOSITORY_H

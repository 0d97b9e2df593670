#ifndef IMAGEVAULT_PRODUCT_REPOSITORY_H
#define IMAGEVAULT_PRODUCT_REPOSITORY_H

/**
 * @file ProductRepository.h
 * @brief store_<id>_products CRUD
 */

#include "CoreRepository.hpp"
#include "Database/Entities/ProductEntity.h"
#include "Database/IdentifierSanitizer.h"
#include "Database/Repositories/RepositoryHelpers.h"
#include "Database/TenantQuery.h"

#include <optional>
#include <vector>

namespace ImageVault {
namespace Database {
namespace Repositories {

using ProductEntity = ImageVault::Database::Entities::ProductEntity;

class ProductRepository : public DbLib::CoreRepository<ProductEntity> {
public:
    ProductRepository(DbLib::SqlSession& session, const TenantTableSet& tables);

    /**
     * @brief draft 의 id 는 무시된다
     * @throws DbLib::SqlError category_id 가 존재하지 않으면 FOREIGN_KEY_CONSTRAINT
     */
    ProductEntity insert(const ProductEntity& draft);

    /**
     * @brief entity.getId() 행의 모든 가변 필드를 덮어쓴다
     * @return 갱신된 행, 대상이 없으면 std::nullopt
     */
    std::optional<ProductEntity> update(const ProductEntity& entity);

    std::vector<int64_t> findIdsByCategory(int64_t category_id);
    int deleteByCategory(int64_t category_id);

    DbLib::RowCursor<ProductEntity> find(const TenantQuery& query);
    int count(const TenantQuery& query = {});

protected:
    std::string selectColumns() const override;
    std::vector<std::string> sortableColumns() const override;

private:
    static ProductEntity mapRow(const Row& row);
    std::vector<QueryCondition> buildConditions(const TenantQuery& query) const;
};

} // namespace Repositories
} // namespace Database
} // namespace ImageVault

#endif // IMAGEVAULT_PRODUCT_REPOSITORY_H

// =============================================================================
// core/shared/include/Database/TenantSQLQueries.h
// 테넌트 테이블 DDL - 테이블 이름은 TenantTableSet 에서만 가져온다
// =============================================================================

#ifndef IMAGEVAULT_TENANT_SQL_QUERIES_H
#define IMAGEVAULT_TENANT_SQL_QUERIES_H

#include "Database/IdentifierSanitizer.h"
#include "SQLDialect.hpp"

#include <string>
#include <vector>

namespace ImageVault {
namespace Database {
namespace SQL {
namespace Tenant {

constexpr int NAME_LENGTH = 200;
constexpr int CODE_LENGTH = 200;
constexpr int PATH_LENGTH = 500;

inline std::string cascadeClause(const DbLib::ISQLDialect &dialect) {
  return dialect.supportsForeignKeyCascade() ? " ON DELETE CASCADE" : "";
}

inline std::string createCategoriesTable(const TenantTableSet &tables,
                                         const DbLib::ISQLDialect &dialect) {
  return "CREATE TABLE " + tables.categories() + " (\n"
         "    id " + dialect.getAutoIncrementPrimaryKey() + ",\n"
         "    name " + dialect.getTextType(NAME_LENGTH) + " NOT NULL,\n"
         "    created_at " + dialect.getTimestampType() + " NOT NULL,\n"
         "    updated_at " + dialect.getTimestampType() + " NOT NULL\n"
         ")";
}

inline std::string createProductsTable(const TenantTableSet &tables,
                                       const DbLib::ISQLDialect &dialect) {
  return "CREATE TABLE " + tables.products() + " (\n"
         "    id " + dialect.getAutoIncrementPrimaryKey() + ",\n"
         "    category_id INTEGER NOT NULL,\n"
         "    name " + dialect.getTextType(NAME_LENGTH) + " NOT NULL,\n"
         "    marked_price " + dialect.getDecimalType() + ",\n"
         "    min_discounted_price " + dialect.getDecimalType() + ",\n"
         "    description " + dialect.getTextType(0) + ",\n"
         "    created_at " + dialect.getTimestampType() + " NOT NULL,\n"
         "    updated_at " + dialect.getTimestampType() + " NOT NULL,\n"
         "    FOREIGN KEY (category_id) REFERENCES " + tables.categories() +
         "(id)" + cascadeClause(dialect) + "\n"
         ")";
}

inline std::string createImagesTable(const TenantTableSet &tables,
                                     const DbLib::ISQLDialect &dialect) {
  return "CREATE TABLE " + tables.images() + " (\n"
         "    id " + dialect.getAutoIncrementPrimaryKey() + ",\n"
         "    product_id INTEGER NOT NULL,\n"
         "    name " + dialect.getTextType(NAME_LENGTH) + " NOT NULL,\n"
         "    code " + dialect.getTextType(CODE_LENGTH) + " NOT NULL,\n"
         "    file_path " + dialect.getTextType(PATH_LENGTH) + ",\n"
         "    url " + dialect.getTextType(0) + ",\n"
         "    created_at " + dialect.getTimestampType() + " NOT NULL,\n"
         "    updated_at " + dialect.getTimestampType() + " NOT NULL,\n"
         "    FOREIGN KEY (product_id) REFERENCES " + tables.products() +
         "(id)" + cascadeClause(dialect) + "\n"
         ")";
}

/**
 * @brief 테이블 3개 + 인덱스, 실행 순서대로
 */
inline std::vector<std::string>
buildProvisionStatements(const TenantTableSet &tables,
                         const DbLib::ISQLDialect &dialect) {
  return {
      createCategoriesTable(tables, dialect),
      createProductsTable(tables, dialect),
      createImagesTable(tables, dialect),
      // 코드 유일성의 최종 보증
      "CREATE UNIQUE INDEX " + tables.indexName("images_code_unique") +
          " ON " + tables.images() + "(code)",
      "CREATE INDEX " + tables.indexName("categories_name") + " ON " +
          tables.categories() + "(name)",
      "CREATE INDEX " + tables.indexName("products_category") + " ON " +
          tables.products() + "(category_id)",
      "CREATE INDEX " + tables.indexName("products_name") + " ON " +
          tables.products() + "(name)",
      "CREATE INDEX " + tables.indexName("images_product") + " ON " +
          tables.images() + "(product_id)",
  };
}

/**
 * @brief 자식 테이블부터 삭제
 */
inline std::vector<std::string> buildDropStatements(const TenantTableSet &tables) {
  return {
      "DROP TABLE IF EXISTS " + tables.images(),
      "DROP TABLE IF EXISTS " + tables.products(),
      "DROP TABLE IF EXISTS " + tables.categories(),
  };
}

} // namespace Tenant
} // namespace SQL
} // namespace Database
} // namespace ImageVault

#endif // IMAGEVAULT_TENANT_SQL_QUERIES_H

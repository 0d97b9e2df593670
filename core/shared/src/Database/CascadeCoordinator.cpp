#include "Database/CascadeCoordinator.h"
#include "Common/Exceptions.h"
#include "Database/Repositories/CategoryRepository.h"
#include "Database/Repositories/ImageRepository.h"
#include "Database/Repositories/ProductRepository.h"
#include "Logging/LogManager.h"

#include <string>
#include <vector>

namespace ImageVault {
namespace Database {

CascadeCoordinator::CascadeCoordinator(DbLib::SqlSession &session,
                                       const IdentifierSanitizer &sanitizer)
    : session_(session), sanitizer_(sanitizer) {}

CascadeReport CascadeCoordinator::deleteCategoryCascade(const TenantId &tenant_id,
                                                        int64_t category_id) {
  TenantTableSet tables(sanitizer_.sanitize(tenant_id), session_.dialect());
  Repositories::CategoryRepository categories(session_, tables);
  Repositories::ProductRepository products(session_, tables);
  Repositories::ImageRepository images(session_, tables);

  CascadeReport report;
  {
    DbLib::SqlTransaction tx(session_);

    if (!categories.exists(category_id)) {
      throw NotFound("category", category_id);
    }

    std::vector<int64_t> product_ids = products.findIdsByCategory(category_id);
    report.images_removed = images.deleteByProducts(product_ids);
    report.products_removed = products.deleteByCategory(category_id);
    report.categories_removed = categories.deleteById(category_id) ? 1 : 0;

    tx.commit();
  }

  LogManager::getInstance().logTenantOperation(
      tables.fragment().str(), "deleteCategoryCascade",
      "category=" + std::to_string(category_id) +
          " products=" + std::to_string(report.products_removed) +
          " images=" + std::to_string(report.images_removed));
  return report;
}

CascadeReport CascadeCoordinator::deleteProductCascade(const TenantId &tenant_id,
                                                       int64_t product_id) {
  TenantTableSet tables(sanitizer_.sanitize(tenant_id), session_.dialect());
  Repositories::ProductRepository products(session_, tables);
  Repositories::ImageRepository images(session_, tables);

  CascadeReport report;
  {
    DbLib::SqlTransaction tx(session_);

    if (!products.exists(product_id)) {
      throw NotFound("product", product_id);
    }

    report.images_removed = images.deleteByProduct(product_id);
    report.products_removed = products.deleteById(product_id) ? 1 : 0;

    tx.commit();
  }

  LogManager::getInstance().logTenantOperation(
      tables.fragment().str(), "deleteProductCascade",
      "product=" + std::to_string(product_id) +
          " images=" + std::to_string(report.images_removed));
  return report;
}

} // namespace Database
} // namespace ImageVault

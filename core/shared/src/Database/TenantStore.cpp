#include "Database/TenantStore.h"
#include "Common/Exceptions.h"
#include "Database/UniquenessEnforcer.h"
#include "Logging/LogManager.h"

#include <cctype>

namespace ImageVault {
namespace Database {

using Repositories::CategoryRepository;
using Repositories::ImageRepository;
using Repositories::ProductRepository;

TenantStore::TenantStore(DbLib::SqlSession &session,
                         const TenantStoreOptions &options)
    : session_(session), options_(options),
      sanitizer_(options.max_token_length) {}

// =============================================================================
// 테넌트 수명주기
// =============================================================================

ProvisionResult TenantStore::onTenantCreated(const TenantId &tenant_id) {
  SchemaProvisioner provisioner(session_, sanitizer_);
  return provisioner.provision(tenant_id);
}

bool TenantStore::onTenantDeleted(const TenantId &tenant_id) {
  SchemaProvisioner provisioner(session_, sanitizer_);
  return provisioner.deprovision(tenant_id);
}

bool TenantStore::isProvisioned(const TenantId &tenant_id) {
  SchemaProvisioner provisioner(session_, sanitizer_);
  return provisioner.isProvisioned(tenant_id);
}

std::vector<std::string> TenantStore::listProvisionedTenants() {
  SchemaProvisioner provisioner(session_, sanitizer_);
  return provisioner.listProvisionedTenants();
}

int TenantStore::provisionMissing(const std::vector<TenantId> &tenant_ids) {
  SchemaProvisioner provisioner(session_, sanitizer_);
  return provisioner.provisionMissing(tenant_ids);
}

// =============================================================================
// 카테고리
// =============================================================================

CategoryEntity TenantStore::createCategory(const TenantId &tenant_id,
                                           const std::string &name) {
  TenantTableSet tables = provisionedTables(tenant_id);
  validateName("category", name);

  CategoryEntity created;
  try {
    DbLib::SqlTransaction tx(session_);
    CategoryRepository categories(session_, tables);
    created = categories.insert(name);
    tx.commit();
  } catch (const DbLib::SqlError &e) {
    rethrowTranslated(e, tables.fragment().str(), "createCategory");
  }

  LogManager::getInstance().logTenantOperation(
      tables.fragment().str(), "createCategory",
      "id=" + std::to_string(created.getId()));
  return created;
}

std::optional<CategoryEntity> TenantStore::getCategory(const TenantId &tenant_id,
                                                       int64_t category_id) {
  TenantTableSet tables = provisionedTables(tenant_id);
  CategoryRepository categories(session_, tables);
  return categories.findById(category_id);
}

DbLib::RowCursor<CategoryEntity>
TenantStore::listCategories(const TenantId &tenant_id,
                            const TenantQuery &query) {
  TenantTableSet tables = provisionedTables(tenant_id);
  CategoryRepository categories(session_, tables);
  return categories.find(query);
}

CategoryEntity TenantStore::renameCategory(const TenantId &tenant_id,
                                           int64_t category_id,
                                           const std::string &name) {
  TenantTableSet tables = provisionedTables(tenant_id);
  validateName("category", name);

  std::optional<CategoryEntity> renamed;
  try {
    DbLib::SqlTransaction tx(session_);
    CategoryRepository categories(session_, tables);
    renamed = categories.updateName(category_id, name);
    if (!renamed) {
      throw NotFound("category", category_id);
    }
    tx.commit();
  } catch (const DbLib::SqlError &e) {
    rethrowTranslated(e, tables.fragment().str(), "renameCategory");
  }

  LogManager::getInstance().logTenantOperation(
      tables.fragment().str(), "renameCategory",
      "id=" + std::to_string(category_id));
  return *renamed;
}

CascadeReport TenantStore::deleteCategory(const TenantId &tenant_id,
                                          int64_t category_id) {
  TenantTableSet tables = provisionedTables(tenant_id);
  try {
    CascadeCoordinator cascade(session_, sanitizer_);
    return cascade.deleteCategoryCascade(tenant_id, category_id);
  } catch (const DbLib::SqlError &e) {
    rethrowTranslated(e, tables.fragment().str(), "deleteCategory");
  }
}

int TenantStore::countCategories(const TenantId &tenant_id,
                                 const TenantQuery &query) {
  TenantTableSet tables = provisionedTables(tenant_id);
  CategoryRepository categories(session_, tables);
  return categories.count(query);
}

// =============================================================================
// 상품
// =============================================================================

ProductEntity TenantStore::createProduct(const TenantId &tenant_id,
                                         const ProductEntity &draft) {
  TenantTableSet tables = provisionedTables(tenant_id);
  validateName("product", draft.getName());

  ProductEntity created;
  try {
    DbLib::SqlTransaction tx(session_);
    CategoryRepository categories(session_, tables);
    if (!categories.exists(draft.getCategoryId())) {
      throw ConstraintViolation("category " +
                                std::to_string(draft.getCategoryId()) +
                                " does not exist in this store");
    }
    ProductRepository products(session_, tables);
    created = products.insert(draft);
    tx.commit();
  } catch (const DbLib::SqlError &e) {
    rethrowTranslated(e, tables.fragment().str(), "createProduct");
  }

  LogManager::getInstance().logTenantOperation(
      tables.fragment().str(), "createProduct",
      "id=" + std::to_string(created.getId()) +
          " category=" + std::to_string(created.getCategoryId()));
  return created;
}

std::optional<ProductEntity> TenantStore::getProduct(const TenantId &tenant_id,
                                                     int64_t product_id) {
  TenantTableSet tables = provisionedTables(tenant_id);
  ProductRepository products(session_, tables);
  return products.findById(product_id);
}

DbLib::RowCursor<ProductEntity>
TenantStore::listProducts(const TenantId &tenant_id, const TenantQuery &query) {
  TenantTableSet tables = provisionedTables(tenant_id);
  ProductRepository products(session_, tables);
  return products.find(query);
}

DbLib::RowCursor<ProductEntity>
TenantStore::listProductsByCategory(const TenantId &tenant_id,
                                    int64_t category_id,
                                    const TenantQuery &query) {
  TenantQuery scoped = query;
  scoped.parent_id = category_id;
  return listProducts(tenant_id, scoped);
}

DbLib::RowCursor<ProductEntity>
TenantStore::searchProducts(const TenantId &tenant_id,
                            const std::string &needle,
                            const TenantQuery &query) {
  TenantQuery scoped = query;
  scoped.name_contains = needle;
  return listProducts(tenant_id, scoped);
}

ProductEntity TenantStore::updateProduct(const TenantId &tenant_id,
                                         const ProductEntity &product) {
  TenantTableSet tables = provisionedTables(tenant_id);
  validateName("product", product.getName());

  std::optional<ProductEntity> updated;
  try {
    DbLib::SqlTransaction tx(session_);
    ProductRepository products(session_, tables);
    if (!products.exists(product.getId())) {
      throw NotFound("product", product.getId());
    }
    CategoryRepository categories(session_, tables);
    if (!categories.exists(product.getCategoryId())) {
      throw ConstraintViolation("category " +
                                std::to_string(product.getCategoryId()) +
                                " does not exist in this store");
    }
    updated = products.update(product);
    if (!updated) {
      throw NotFound("product", product.getId());
    }
    tx.commit();
  } catch (const DbLib::SqlError &e) {
    rethrowTranslated(e, tables.fragment().str(), "updateProduct");
  }

  LogManager::getInstance().logTenantOperation(
      tables.fragment().str(), "updateProduct",
      "id=" + std::to_string(product.getId()));
  return *updated;
}

CascadeReport TenantStore::deleteProduct(const TenantId &tenant_id,
                                         int64_t product_id) {
  TenantTableSet tables = provisionedTables(tenant_id);
  try {
    CascadeCoordinator cascade(session_, sanitizer_);
    return cascade.deleteProductCascade(tenant_id, product_id);
  } catch (const DbLib::SqlError &e) {
    rethrowTranslated(e, tables.fragment().str(), "deleteProduct");
  }
}

int TenantStore::countProducts(const TenantId &tenant_id,
                               const TenantQuery &query) {
  TenantTableSet tables = provisionedTables(tenant_id);
  ProductRepository products(session_, tables);
  return products.count(query);
}

// =============================================================================
// 이미지
// =============================================================================

ImageEntity TenantStore::createImage(const TenantId &tenant_id,
                                     const ImageEntity &draft) {
  TenantTableSet tables = provisionedTables(tenant_id);
  validateName("image", draft.getName());

  UniquenessEnforcer enforcer(session_, sanitizer_, options_.max_code_length);
  ImageEntity pending = draft;
  pending.setCode(enforcer.resolveCode(draft.getCode(), draft.getFilePath(),
                                       draft.getUrl(), draft.getName()));

  ImageEntity created;
  try {
    // 확인과 INSERT 를 같은 쓰기 트랜잭션에서
    DbLib::SqlTransaction tx(session_);
    ProductRepository products(session_, tables);
    if (!products.exists(pending.getProductId())) {
      throw ConstraintViolation("product " +
                                std::to_string(pending.getProductId()) +
                                " does not exist in this store");
    }
    if (!enforcer.reserveCode(tenant_id, pending.getCode())) {
      throw DuplicateCode(pending.getCode());
    }
    ImageRepository images(session_, tables);
    created = images.insert(pending);
    tx.commit();
  } catch (const DbLib::SqlError &e) {
    rethrowTranslated(e, tables.fragment().str(), "createImage",
                      pending.getCode());
  }

  LogManager::getInstance().logTenantOperation(
      tables.fragment().str(), "createImage",
      "id=" + std::to_string(created.getId()) +
          " product=" + std::to_string(created.getProductId()));
  return created;
}

std::optional<ImageEntity> TenantStore::getImage(const TenantId &tenant_id,
                                                 int64_t image_id) {
  TenantTableSet tables = provisionedTables(tenant_id);
  ImageRepository images(session_, tables);
  return images.findById(image_id);
}

DbLib::RowCursor<ImageEntity>
TenantStore::listImagesByProduct(const TenantId &tenant_id, int64_t product_id,
                                 const TenantQuery &query) {
  TenantTableSet tables = provisionedTables(tenant_id);
  TenantQuery scoped = query;
  scoped.parent_id = product_id;
  ImageRepository images(session_, tables);
  return images.find(scoped);
}

DbLib::RowCursor<ImageEntity>
TenantStore::searchImages(const TenantId &tenant_id, const std::string &needle,
                          const TenantQuery &query) {
  TenantTableSet tables = provisionedTables(tenant_id);
  TenantQuery scoped = query;
  scoped.name_contains = needle;
  ImageRepository images(session_, tables);
  return images.find(scoped);
}

ImageEntity TenantStore::updateImage(const TenantId &tenant_id,
                                     const ImageEntity &image) {
  TenantTableSet tables = provisionedTables(tenant_id);
  validateName("image", image.getName());

  UniquenessEnforcer enforcer(session_, sanitizer_, options_.max_code_length);
  ImageEntity pending = image;
  pending.setCode(enforcer.resolveCode(image.getCode(), image.getFilePath(),
                                       image.getUrl(), image.getName()));

  std::optional<ImageEntity> updated;
  try {
    DbLib::SqlTransaction tx(session_);
    ImageRepository images(session_, tables);
    if (!images.exists(pending.getId())) {
      throw NotFound("image", pending.getId());
    }
    ProductRepository products(session_, tables);
    if (!products.exists(pending.getProductId())) {
      throw ConstraintViolation("product " +
                                std::to_string(pending.getProductId()) +
                                " does not exist in this store");
    }
    if (!enforcer.reserveCode(tenant_id, pending.getCode(), pending.getId())) {
      throw DuplicateCode(pending.getCode());
    }
    updated = images.update(pending);
    if (!updated) {
      throw NotFound("image", pending.getId());
    }
    tx.commit();
  } catch (const DbLib::SqlError &e) {
    rethrowTranslated(e, tables.fragment().str(), "updateImage",
                      pending.getCode());
  }

  LogManager::getInstance().logTenantOperation(
      tables.fragment().str(), "updateImage",
      "id=" + std::to_string(pending.getId()));
  return *updated;
}

ImageEntity TenantStore::updateImageCode(const TenantId &tenant_id,
                                         int64_t image_id,
                                         const std::string &code) {
  TenantTableSet tables = provisionedTables(tenant_id);

  UniquenessEnforcer enforcer(session_, sanitizer_, options_.max_code_length);
  std::string normalized = UniquenessEnforcer::normalizeCode(code);
  enforcer.validateCode(normalized);

  std::optional<ImageEntity> updated;
  try {
    DbLib::SqlTransaction tx(session_);
    ImageRepository images(session_, tables);
    if (!images.exists(image_id)) {
      throw NotFound("image", image_id);
    }
    if (!enforcer.reserveCode(tenant_id, normalized, image_id)) {
      throw DuplicateCode(normalized);
    }
    updated = images.updateCode(image_id, normalized);
    if (!updated) {
      throw NotFound("image", image_id);
    }
    tx.commit();
  } catch (const DbLib::SqlError &e) {
    rethrowTranslated(e, tables.fragment().str(), "updateImageCode", normalized);
  }

  LogManager::getInstance().logTenantOperation(
      tables.fragment().str(), "updateImageCode",
      "id=" + std::to_string(image_id));
  return *updated;
}

void TenantStore::deleteImage(const TenantId &tenant_id, int64_t image_id) {
  TenantTableSet tables = provisionedTables(tenant_id);
  try {
    DbLib::SqlTransaction tx(session_);
    ImageRepository images(session_, tables);
    if (!images.deleteById(image_id)) {
      throw NotFound("image", image_id);
    }
    tx.commit();
  } catch (const DbLib::SqlError &e) {
    rethrowTranslated(e, tables.fragment().str(), "deleteImage");
  }

  LogManager::getInstance().logTenantOperation(
      tables.fragment().str(), "deleteImage",
      "id=" + std::to_string(image_id));
}

std::optional<ImageEntity> TenantStore::findImageByCode(const TenantId &tenant_id,
                                                        const std::string &code) {
  TenantTableSet tables = provisionedTables(tenant_id);
  std::string normalized = UniquenessEnforcer::normalizeCode(code);
  if (normalized.empty()) {
    return std::nullopt;
  }
  ImageRepository images(session_, tables);
  return images.findByCode(normalized);
}

int TenantStore::countImages(const TenantId &tenant_id,
                             const TenantQuery &query) {
  TenantTableSet tables = provisionedTables(tenant_id);
  ImageRepository images(session_, tables);
  return images.count(query);
}

std::string TenantStore::suggestAvailableCode(const TenantId &tenant_id,
                                              const std::string &base) {
  provisionedTables(tenant_id);
  UniquenessEnforcer enforcer(session_, sanitizer_, options_.max_code_length);
  return enforcer.suggestAvailableCode(tenant_id, base);
}

// =============================================================================
// 내부 헬퍼
// =============================================================================

TenantTableSet TenantStore::provisionedTables(const TenantId &tenant_id) {
  TenantTableSet tables(sanitizer_.sanitize(tenant_id), session_.dialect());
  SchemaProvisioner provisioner(session_, sanitizer_);
  if (!provisioner.isProvisioned(tables)) {
    throw ProvisionError(tables.fragment().str(),
                         "table set is not provisioned");
  }
  return tables;
}

void TenantStore::validateName(const std::string &entity,
                               const std::string &name) const {
  bool blank = true;
  for (char c : name) {
    if (!std::isspace(static_cast<unsigned char>(c))) {
      blank = false;
      break;
    }
  }
  if (blank) {
    throw ConstraintViolation(entity + " name must not be empty");
  }
  if (name.size() > static_cast<size_t>(SQL::Tenant::NAME_LENGTH)) {
    throw ConstraintViolation(entity + " name exceeds " +
                              std::to_string(SQL::Tenant::NAME_LENGTH) +
                              " characters");
  }
}

void TenantStore::rethrowTranslated(const DbLib::SqlError &error,
                                    const std::string &fragment,
                                    const std::string &operation,
                                    const std::string &code) {
  auto &logger = LogManager::getInstance();
  switch (error.kind()) {
  case DbLib::SqlErrorKind::UNIQUE_CONSTRAINT:
    logger.logTenantOperation(fragment, operation, "unique constraint",
                              LogLevel::WARN);
    if (!code.empty()) {
      throw DuplicateCode(code);
    }
    throw ConstraintViolation(operation + ": unique constraint violated");
  case DbLib::SqlErrorKind::FOREIGN_KEY_CONSTRAINT:
    logger.logTenantOperation(fragment, operation, "foreign key constraint",
                              LogLevel::WARN);
    throw ConstraintViolation(operation + ": foreign key constraint violated");
  case DbLib::SqlErrorKind::OTHER_CONSTRAINT:
    logger.logTenantOperation(fragment, operation, "constraint",
                              LogLevel::WARN);
    throw ConstraintViolation(operation + ": " + error.what());
  default:
    // 다른 연결이 테이블 세트를 지운 경우
    if (std::string(error.what()).find("no such table") != std::string::npos) {
      logger.logTenantOperation(fragment, operation, error.what(),
                                LogLevel::WARN);
      throw ProvisionError(fragment, "table set is not provisioned");
    }
    logger.logTenantOperation(fragment, operation,
                              "engine error " +
                                  std::to_string(error.extendedCode()),
                              LogLevel::LOG_ERROR);
    throw error;
  }
}

} // namespace Database
} // namespace ImageVault

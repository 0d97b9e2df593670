#ifndef IMAGEVAULT_TENANT_STORE_H
#define IMAGEVAULT_TENANT_STORE_H

/**
 * @file TenantStore.h
 * @brief 테넌트별 카테고리/상품/이미지 저장소 진입점
 * @details 모든 호출은 tenant_id 를 명시적으로 받고 매번 테이블 이름을 새로
 * 유도한다. 쓰기 작업은 하나의 트랜잭션(중첩 시 세이브포인트)에서 실행되며,
 * 엔진 오류는 롤백 후 Common/Exceptions.h 의 예외로 변환된다.
 *
 * TenantStore 는 세션을 소유하지 않는다. 세션과 마찬가지로 스레드 간에
 * 공유하지 않는다.
 */

#include "Database/CascadeCoordinator.h"
#include "Database/IdentifierSanitizer.h"
#include "Database/Repositories/CategoryRepository.h"
#include "Database/Repositories/ImageRepository.h"
#include "Database/Repositories/ProductRepository.h"
#include "Database/SchemaProvisioner.h"
#include "Database/TenantQuery.h"
#include "Database/TenantStoreOptions.h"
#include "RowCursor.hpp"
#include "SqlSession.hpp"

#include <optional>
#include <string>
#include <vector>

namespace ImageVault {
namespace Database {

using CategoryEntity = Entities::CategoryEntity;
using ProductEntity = Entities::ProductEntity;
using ImageEntity = Entities::ImageEntity;

class TenantStore {
public:
  explicit TenantStore(DbLib::SqlSession &session,
                       const TenantStoreOptions &options = TenantStoreOptions());

  // ==========================================================================
  // 테넌트 수명주기
  // ==========================================================================

  ProvisionResult onTenantCreated(const TenantId &tenant_id);
  bool onTenantDeleted(const TenantId &tenant_id);
  bool isProvisioned(const TenantId &tenant_id);
  std::vector<std::string> listProvisionedTenants();
  int provisionMissing(const std::vector<TenantId> &tenant_ids);

  // ==========================================================================
  // 카테고리
  // ==========================================================================

  CategoryEntity createCategory(const TenantId &tenant_id,
                                const std::string &name);
  std::optional<CategoryEntity> getCategory(const TenantId &tenant_id,
                                            int64_t category_id);
  DbLib::RowCursor<CategoryEntity>
  listCategories(const TenantId &tenant_id,
                 const TenantQuery &query = TenantQuery());
  CategoryEntity renameCategory(const TenantId &tenant_id, int64_t category_id,
                                const std::string &name);
  CascadeReport deleteCategory(const TenantId &tenant_id, int64_t category_id);
  int countCategories(const TenantId &tenant_id,
                      const TenantQuery &query = TenantQuery());

  // ==========================================================================
  // 상품
  // ==========================================================================

  /**
   * @throws ConstraintViolation 카테고리가 이 테넌트에 없을 때
   */
  ProductEntity createProduct(const TenantId &tenant_id,
                              const ProductEntity &draft);
  std::optional<ProductEntity> getProduct(const TenantId &tenant_id,
                                          int64_t product_id);
  DbLib::RowCursor<ProductEntity>
  listProducts(const TenantId &tenant_id,
               const TenantQuery &query = TenantQuery());
  DbLib::RowCursor<ProductEntity>
  listProductsByCategory(const TenantId &tenant_id, int64_t category_id,
                         const TenantQuery &query = TenantQuery());
  DbLib::RowCursor<ProductEntity>
  searchProducts(const TenantId &tenant_id, const std::string &needle,
                 const TenantQuery &query = TenantQuery());
  ProductEntity updateProduct(const TenantId &tenant_id,
                              const ProductEntity &product);
  CascadeReport deleteProduct(const TenantId &tenant_id, int64_t product_id);
  int countProducts(const TenantId &tenant_id,
                    const TenantQuery &query = TenantQuery());

  // ==========================================================================
  // 이미지
  // ==========================================================================

  /**
   * @brief code 가 비어 있으면 파일명/URL/이름에서 생성한다
   * @throws DuplicateCode 같은 테넌트에 code 가 이미 있을 때
   * @throws ConstraintViolation 상품이 없거나 code 가 무효일 때
   */
  ImageEntity createImage(const TenantId &tenant_id, const ImageEntity &draft);
  std::optional<ImageEntity> getImage(const TenantId &tenant_id,
                                      int64_t image_id);
  DbLib::RowCursor<ImageEntity>
  listImagesByProduct(const TenantId &tenant_id, int64_t product_id,
                      const TenantQuery &query = TenantQuery());
  DbLib::RowCursor<ImageEntity>
  searchImages(const TenantId &tenant_id, const std::string &needle,
               const TenantQuery &query = TenantQuery());
  ImageEntity updateImage(const TenantId &tenant_id, const ImageEntity &image);
  ImageEntity updateImageCode(const TenantId &tenant_id, int64_t image_id,
                              const std::string &code);
  void deleteImage(const TenantId &tenant_id, int64_t image_id);
  std::optional<ImageEntity> findImageByCode(const TenantId &tenant_id,
                                             const std::string &code);
  int countImages(const TenantId &tenant_id,
                  const TenantQuery &query = TenantQuery());

  /**
   * @brief base, base_1, base_2 ... 중 이 테넌트에서 비어 있는 첫 code
   */
  std::string suggestAvailableCode(const TenantId &tenant_id,
                                   const std::string &base);

  const TenantStoreOptions &getOptions() const { return options_; }
  const IdentifierSanitizer &getSanitizer() const { return sanitizer_; }

private:
  /**
   * @throws ProvisionError 세 테이블이 모두 있지 않은 경우
   */
  TenantTableSet provisionedTables(const TenantId &tenant_id);
  void validateName(const std::string &entity, const std::string &name) const;

  /**
   * @brief 제약 위반과 사라진 테이블은 저장소 예외로, 그 외는 그대로 던진다.
   */
  [[noreturn]] static void rethrowTranslated(const DbLib::SqlError &error,
                                             const std::string &fragment,
                                             const std::string &operation,
                                             const std::string &code = "");

  DbLib::SqlSession &session_;
  TenantStoreOptions options_;
  IdentifierSanitizer sanitizer_;
};

} // namespace Database
} // namespace ImageVault

#endif // IMAGEVAULT_TENANT_STORE_H

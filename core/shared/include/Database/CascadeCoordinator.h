#ifndef IMAGEVAULT_CASCADE_COORDINATOR_H
#define IMAGEVAULT_CASCADE_COORDINATOR_H

/**
 * @file CascadeCoordinator.h
 * @brief 카테고리/상품 삭제 시 하위 행을 명시적으로 삭제
 * @details images -> products -> category 순서로 한 트랜잭션에서 처리한다.
 * 선언적 ON DELETE CASCADE 는 보조 수단이며 이 경로가 기준이다.
 */

#include "Database/IdentifierSanitizer.h"
#include "SqlSession.hpp"

#include <cstdint>

namespace ImageVault {
namespace Database {

struct CascadeReport {
  int categories_removed = 0;
  int products_removed = 0;
  int images_removed = 0;
};

class CascadeCoordinator {
public:
  CascadeCoordinator(DbLib::SqlSession &session,
                     const IdentifierSanitizer &sanitizer);

  /**
   * @throws NotFound 카테고리가 없을 때 (아무것도 삭제되지 않음)
   */
  CascadeReport deleteCategoryCascade(const TenantId &tenant_id,
                                      int64_t category_id);

  /**
   * @throws NotFound 상품이 없을 때
   */
  CascadeReport deleteProductCascade(const TenantId &tenant_id,
                                     int64_t product_id);

private:
  DbLib::SqlSession &session_;
  const IdentifierSanitizer &sanitizer_;
};

} // namespace Database
} // namespace ImageVault

#endif // IMAGEVAULT_CASCADE_COORDINATOR_H

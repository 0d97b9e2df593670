#ifndef IMAGEVAULT_SCHEMA_PROVISIONER_H
#define IMAGEVAULT_SCHEMA_PROVISIONER_H

/**
 * @file SchemaProvisioner.h
 * @brief 테넌트 테이블 세트 생성/삭제
 * @details 모든 DDL 은 하나의 트랜잭션(또는 세이브포인트)에서 실행된다.
 * 실패하면 전체가 롤백되고 ProvisionError 가 발생한다.
 */

#include "Database/IdentifierSanitizer.h"
#include "SqlSession.hpp"

#include <string>
#include <vector>

namespace ImageVault {
namespace Database {

struct ProvisionResult {
  std::string fragment;
  bool created = false;             // false: 이미 존재 (no-op)
  bool declarative_cascade = false; // false: 명시적 cascade 만 사용
};

class SchemaProvisioner {
public:
  SchemaProvisioner(DbLib::SqlSession &session,
                    const IdentifierSanitizer &sanitizer);

  /**
   * @brief 테이블 3개와 인덱스 생성. 이미 모두 있으면 no-op.
   * @throws InvalidIdentifier, ProvisionError (부분 세트 / DDL 실패)
   */
  ProvisionResult provision(const TenantId &tenant_id);

  /**
   * @brief images, products, categories 순으로 삭제
   * @return 삭제한 테이블이 있으면 true, 미프로비저닝 테넌트면 false
   * @throws ProvisionError 외부 테이블이 이 세트를 참조하는 경우
   */
  bool deprovision(const TenantId &tenant_id);

  bool isProvisioned(const TenantId &tenant_id);
  bool isProvisioned(const TenantTableSet &tables);

  /**
   * @brief 카탈로그에서 세 테이블이 모두 있는 테넌트 fragment 목록 (정렬됨)
   */
  std::vector<std::string> listProvisionedTenants();

  /**
   * @return 새로 생성된 테넌트 수
   */
  int provisionMissing(const std::vector<TenantId> &tenant_ids);

private:
  int countExistingTables(const TenantTableSet &tables);
  void ensureNoInboundReferences(const TenantTableSet &tables);

  DbLib::SqlSession &session_;
  const IdentifierSanitizer &sanitizer_;
};

} // namespace Database
} // namespace ImageVault

#endif // IMAGEVAULT_SCHEMA_PROVISIONER_H

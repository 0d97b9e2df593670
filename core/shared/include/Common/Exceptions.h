#ifndef IMAGEVAULT_COMMON_EXCEPTIONS_H
#define IMAGEVAULT_COMMON_EXCEPTIONS_H

/**
 * @file Exceptions.h
 * @brief TenantStore 예외 계층
 * @details 모든 예외는 TenantStoreError 에서 파생된다. 엔진 오류
 * (DbLib::SqlError)는 트랜잭션 롤백 후 이 계층으로 변환된다.
 */

#include <cstdint>
#include <stdexcept>
#include <string>

namespace ImageVault {

class TenantStoreError : public std::runtime_error {
public:
  explicit TenantStoreError(const std::string &message)
      : std::runtime_error(message) {}
};

/**
 * @brief 테넌트 식별자가 허용 형식이 아님 (호출 자체가 무효)
 */
class InvalidIdentifier : public TenantStoreError {
public:
  InvalidIdentifier(const std::string &reason)
      : TenantStoreError("invalid tenant identifier: " + reason) {}
};

/**
 * @brief DDL 실패, 부분 테이블 세트, 외부 참조 존재
 */
class ProvisionError : public TenantStoreError {
public:
  ProvisionError(const std::string &fragment, const std::string &reason)
      : TenantStoreError("provisioning store_" + fragment + " failed: " +
                         reason),
        fragment_(fragment) {}

  const std::string &fragment() const { return fragment_; }

private:
  std::string fragment_;
};

class NotFound : public TenantStoreError {
public:
  NotFound(const std::string &entity, int64_t id)
      : TenantStoreError(entity + " " + std::to_string(id) + " not found"),
        entity_(entity), id_(id) {}

  const std::string &entity() const { return entity_; }
  int64_t id() const { return id_; }

private:
  std::string entity_;
  int64_t id_;
};

/**
 * @brief 외래키/유일성 위반 또는 값 검증 실패
 */
class ConstraintViolation : public TenantStoreError {
public:
  explicit ConstraintViolation(const std::string &message)
      : TenantStoreError(message) {}
};

class DuplicateCode : public ConstraintViolation {
public:
  explicit DuplicateCode(const std::string &code)
      : ConstraintViolation("image code already in use: " + code),
        code_(code) {}

  const std::string &code() const { return code_; }

private:
  std::string code_;
};

} // namespace ImageVault

#endif // IMAGEVAULT_COMMON_EXCEPTIONS_H

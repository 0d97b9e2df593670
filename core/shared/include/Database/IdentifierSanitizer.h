#ifndef IMAGEVAULT_IDENTIFIER_SANITIZER_H
#define IMAGEVAULT_IDENTIFIER_SANITIZER_H

/**
 * @file IdentifierSanitizer.h
 * @brief 테넌트 식별자 검증 및 테넌트 테이블 이름 유도
 * @details 동적 테이블 이름은 모두 SafeTableFragment 에서만 만들어진다.
 * SafeTableFragment 는 IdentifierSanitizer 만 생성할 수 있다.
 */

#include "Common/Enums.h"
#include "SQLDialect.hpp"

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace ImageVault {
namespace Database {

/**
 * @brief 테넌트 식별자: 양의 정수 또는 [a-z0-9_]+ 토큰
 */
using TenantId = std::variant<int64_t, std::string>;

class IdentifierSanitizer;

/**
 * @brief 검증을 통과한 테이블 이름 조각 (store_<fragment>_*)
 */
class SafeTableFragment {
public:
  const std::string &str() const { return value_; }

  bool operator==(const SafeTableFragment &other) const {
    return value_ == other.value_;
  }
  bool operator!=(const SafeTableFragment &other) const {
    return value_ != other.value_;
  }
  bool operator<(const SafeTableFragment &other) const {
    return value_ < other.value_;
  }

private:
  friend class IdentifierSanitizer;
  explicit SafeTableFragment(std::string value) : value_(std::move(value)) {}

  std::string value_;
};

class IdentifierSanitizer {
public:
  static constexpr size_t DEFAULT_MAX_TOKEN_LENGTH = 32;

  explicit IdentifierSanitizer(
      size_t max_token_length = DEFAULT_MAX_TOKEN_LENGTH);

  /**
   * @throws InvalidIdentifier 0 이하 정수, 빈 문자열, 허용 외 문자, 길이 초과
   */
  SafeTableFragment sanitize(const TenantId &tenant_id) const;
  SafeTableFragment sanitize(int64_t tenant_id) const;
  SafeTableFragment sanitize(const std::string &token) const;

  bool isValidToken(const std::string &token) const;

  size_t getMaxTokenLength() const { return max_token_length_; }

private:
  size_t max_token_length_;
};

/**
 * @brief 한 테넌트의 테이블 세트. 이름은 fragment 에서만 결정된다.
 */
class TenantTableSet {
public:
  using TenantTable = Enums::TenantTable;

  TenantTableSet(SafeTableFragment fragment, const DbLib::ISQLDialect &dialect);

  const SafeTableFragment &fragment() const { return fragment_; }

  // 카탈로그 조회용 (바인드 파라미터로만 사용)
  std::string rawName(TenantTable table) const;
  std::vector<std::string> rawNames() const;

  // SQL 문에 삽입되는 인용된 이름
  std::string quoted(TenantTable table) const;
  std::string categories() const { return quoted(TenantTable::CATEGORIES); }
  std::string products() const { return quoted(TenantTable::PRODUCTS); }
  std::string images() const { return quoted(TenantTable::IMAGES); }

  /**
   * @brief idx_store_<fragment>_<suffix> (인용됨)
   */
  std::string indexName(const std::string &suffix) const;

private:
  SafeTableFragment fragment_;
  const DbLib::ISQLDialect &dialect_;
};

} // namespace Database
} // namespace ImageVault

#endif // IMAGEVAULT_IDENTIFIER_SANITIZER_H

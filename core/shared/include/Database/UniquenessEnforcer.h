#ifndef IMAGEVAULT_UNIQUENESS_ENFORCER_H
#define IMAGEVAULT_UNIQUENESS_ENFORCER_H

/**
 * @file UniquenessEnforcer.h
 * @brief 이미지 code 정규화 / 생성 / 테넌트 내 유일성 확인
 * @details reserveCode() 는 호출자가 연 쓰기 트랜잭션 안에서만 의미가 있다.
 * 확인과 INSERT 사이의 경합은 images_code_unique 인덱스가 막는다.
 */

#include "Database/IdentifierSanitizer.h"
#include "Database/TenantSQLQueries.h"
#include "SqlSession.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace ImageVault {
namespace Database {

class UniquenessEnforcer {
public:
  static constexpr int MAX_SUGGESTION_ATTEMPTS = 10000;

  UniquenessEnforcer(DbLib::SqlSession &session,
                     const IdentifierSanitizer &sanitizer,
                     size_t max_code_length = SQL::Tenant::CODE_LENGTH);

  /**
   * @brief code 가 비어 있으면 true (사용 가능)
   * @param exclude_id 자기 자신을 갱신할 때 그 행은 제외
   * @throws std::logic_error 열린 트랜잭션이 없을 때
   */
  bool reserveCode(const TenantId &tenant_id, const std::string &code,
                   int64_t exclude_id = 0);

  /**
   * @brief base, base_1, base_2 ... 중 첫 번째 빈 code
   * @throws ConstraintViolation 정규화 결과가 비었거나 너무 긴 경우
   */
  std::string suggestAvailableCode(const TenantId &tenant_id,
                                   const std::string &base);

  /**
   * @brief 요청 code 를 정규화한다. 비어 있으면 파일명, URL, 이름 순으로 생성.
   * @throws ConstraintViolation
   */
  std::string resolveCode(const std::string &requested,
                          const std::optional<std::string> &file_path,
                          const std::optional<std::string> &url,
                          const std::string &name) const;

  /**
   * @throws ConstraintViolation 빈 code, 길이 초과, 정규형이 아닌 code
   */
  void validateCode(const std::string &code) const;

  size_t getMaxCodeLength() const { return max_code_length_; }

  /**
   * @brief trim, 소문자, 공백 -> '_', [a-z0-9_] 외 제거, '_' 연속 축약,
   * 앞뒤 '_' 제거
   */
  static std::string normalizeCode(const std::string &raw);

  /**
   * @brief code 생성 원본: 파일명(확장자 제외) > URL 마지막 경로 > 이름
   */
  static std::string deriveCodeSource(const std::optional<std::string> &file_path,
                                      const std::optional<std::string> &url,
                                      const std::string &name);

private:
  bool isTaken(const TenantTableSet &tables, const std::string &code,
               int64_t exclude_id);

  DbLib::SqlSession &session_;
  const IdentifierSanitizer &sanitizer_;
  size_t max_code_length_;
};

} // namespace Database
} // namespace ImageVault

#endif // IMAGEVAULT_UNIQUENESS_ENFORCER_H

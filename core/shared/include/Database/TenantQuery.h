#ifndef IMAGEVAULT_TENANT_QUERY_H
#define IMAGEVAULT_TENANT_QUERY_H

/**
 * @file TenantQuery.h
 * @brief 목록/검색 조건
 * @details 기본 정렬은 삽입 순서(id ASC). order_by 필드는 각 Repository 의
 * 허용 목록(id, name, updated_at)에 있어야 한다.
 */

#include "DatabaseTypes.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace ImageVault {
namespace Database {

struct TenantQuery {
  std::optional<std::string> name_contains; // 대소문자 무시 부분 일치
  std::optional<std::string> code_contains; // 이미지 전용
  std::optional<int64_t> parent_id;         // 상품: category_id, 이미지: product_id
  std::optional<DbLib::OrderBy> order_by;
  std::optional<DbLib::Pagination> pagination;

  static TenantQuery byName(const std::string &needle) {
    TenantQuery query;
    query.name_contains = needle;
    return query;
  }

  static TenantQuery byParent(int64_t parent) {
    TenantQuery query;
    query.parent_id = parent;
    return query;
  }
};

} // namespace Database
} // namespace ImageVault

#endif // IMAGEVAULT_TENANT_QUERY_H

#include "Database/IdentifierSanitizer.h"
#include "Common/Exceptions.h"

namespace ImageVault {
namespace Database {

IdentifierSanitizer::IdentifierSanitizer(size_t max_token_length)
    : max_token_length_(max_token_length) {}

SafeTableFragment IdentifierSanitizer::sanitize(const TenantId &tenant_id) const {
  if (const int64_t *numeric = std::get_if<int64_t>(&tenant_id))
    return sanitize(*numeric);
  return sanitize(std::get<std::string>(tenant_id));
}

SafeTableFragment IdentifierSanitizer::sanitize(int64_t tenant_id) const {
  if (tenant_id <= 0) {
    throw InvalidIdentifier("numeric id must be positive, got " +
                            std::to_string(tenant_id));
  }
  return SafeTableFragment(std::to_string(tenant_id));
}

SafeTableFragment IdentifierSanitizer::sanitize(const std::string &token) const {
  if (token.empty())
    throw InvalidIdentifier("empty token");
  if (token.size() > max_token_length_) {
    throw InvalidIdentifier("token longer than " +
                            std::to_string(max_token_length_) + " characters");
  }
  if (!isValidToken(token)) {
    // 원문은 메시지에 넣지 않는다
    throw InvalidIdentifier("token may only contain [a-z0-9_]");
  }
  return SafeTableFragment(token);
}

bool IdentifierSanitizer::isValidToken(const std::string &token) const {
  if (token.empty() || token.size() > max_token_length_)
    return false;
  for (char c : token) {
    bool allowed = (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '_';
    if (!allowed)
      return false;
  }
  return true;
}

// =============================================================================
// TenantTableSet
// =============================================================================

TenantTableSet::TenantTableSet(SafeTableFragment fragment,
                               const DbLib::ISQLDialect &dialect)
    : fragment_(std::move(fragment)), dialect_(dialect) {}

std::string TenantTableSet::rawName(TenantTable table) const {
  return "store_" + fragment_.str() + "_" + Enums::tenantTableSuffix(table);
}

std::vector<std::string> TenantTableSet::rawNames() const {
  return {rawName(TenantTable::CATEGORIES), rawName(TenantTable::PRODUCTS),
          rawName(TenantTable::IMAGES)};
}

std::string TenantTableSet::quoted(TenantTable table) const {
  return dialect_.quoteIdentifier(rawName(table));
}

std::string TenantTableSet::indexName(const std::string &suffix) const {
  return dialect_.quoteIdentifier("idx_store_" + fragment_.str() + "_" + suffix);
}

} // namespace Database
} // namespace ImageVault

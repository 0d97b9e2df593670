#include "Database/UniquenessEnforcer.h"
#include "Common/Exceptions.h"
#include "Database/Repositories/ImageRepository.h"

#include <cctype>
#include <stdexcept>

namespace ImageVault {
namespace Database {

namespace {

std::string stripExtension(const std::string &segment) {
  auto dot = segment.find_last_of('.');
  if (dot == std::string::npos || dot == 0)
    return segment;
  return segment.substr(0, dot);
}

std::string lastPathSegment(std::string path) {
  auto cut = path.find_first_of("?#");
  if (cut != std::string::npos)
    path.erase(cut);
  while (!path.empty() && (path.back() == '/' || path.back() == '\\'))
    path.pop_back();
  auto slash = path.find_last_of("/\\");
  return slash == std::string::npos ? path : path.substr(slash + 1);
}

bool hasText(const std::optional<std::string> &value) {
  if (!value.has_value())
    return false;
  for (char c : *value) {
    if (!std::isspace(static_cast<unsigned char>(c)))
      return true;
  }
  return false;
}

} // namespace

UniquenessEnforcer::UniquenessEnforcer(DbLib::SqlSession &session,
                                       const IdentifierSanitizer &sanitizer,
                                       size_t max_code_length)
    : session_(session), sanitizer_(sanitizer),
      max_code_length_(max_code_length) {}

// =============================================================================
// 유일성
// =============================================================================

bool UniquenessEnforcer::reserveCode(const TenantId &tenant_id,
                                     const std::string &code,
                                     int64_t exclude_id) {
  if (!session_.inTransaction()) {
    throw std::logic_error("reserveCode requires an open write transaction");
  }
  TenantTableSet tables(sanitizer_.sanitize(tenant_id), session_.dialect());
  validateCode(code);
  return !isTaken(tables, code, exclude_id);
}

std::string UniquenessEnforcer::suggestAvailableCode(const TenantId &tenant_id,
                                                     const std::string &base) {
  TenantTableSet tables(sanitizer_.sanitize(tenant_id), session_.dialect());
  std::string normalized = normalizeCode(base);
  validateCode(normalized);

  if (!isTaken(tables, normalized, 0))
    return normalized;

  for (int counter = 1; counter <= MAX_SUGGESTION_ATTEMPTS; ++counter) {
    std::string candidate = normalized + "_" + std::to_string(counter);
    if (candidate.size() > max_code_length_) {
      throw ConstraintViolation("no free code derivable from '" + normalized +
                                "' within " + std::to_string(max_code_length_) +
                                " characters");
    }
    if (!isTaken(tables, candidate, 0))
      return candidate;
  }
  throw ConstraintViolation("no free code derivable from '" + normalized + "'");
}

bool UniquenessEnforcer::isTaken(const TenantTableSet &tables,
                                 const std::string &code, int64_t exclude_id) {
  Repositories::ImageRepository images(session_, tables);
  return images.codeExists(code, exclude_id);
}

// =============================================================================
// 정규화 / 생성
// =============================================================================

std::string UniquenessEnforcer::resolveCode(
    const std::string &requested, const std::optional<std::string> &file_path,
    const std::optional<std::string> &url, const std::string &name) const {
  std::string code = normalizeCode(requested);
  if (code.empty())
    code = normalizeCode(deriveCodeSource(file_path, url, name));
  validateCode(code);
  return code;
}

void UniquenessEnforcer::validateCode(const std::string &code) const {
  if (code.empty()) {
    throw ConstraintViolation("image code is empty after normalization");
  }
  if (code.size() > max_code_length_) {
    throw ConstraintViolation("image code exceeds " +
                              std::to_string(max_code_length_) + " characters");
  }
  if (normalizeCode(code) != code) {
    throw ConstraintViolation("image code is not in normalized form: " + code);
  }
}

std::string UniquenessEnforcer::normalizeCode(const std::string &raw) {
  std::string code;
  code.reserve(raw.size());
  bool pending_underscore = false;

  for (char ch : raw) {
    unsigned char c = static_cast<unsigned char>(ch);
    if (std::isspace(c) || c == '_') {
      pending_underscore = true;
      continue;
    }
    if (!std::isalnum(c) || c >= 0x80)
      continue;
    if (pending_underscore && !code.empty())
      code += '_';
    pending_underscore = false;
    code += static_cast<char>(std::tolower(c));
  }
  return code;
}

std::string UniquenessEnforcer::deriveCodeSource(
    const std::optional<std::string> &file_path,
    const std::optional<std::string> &url, const std::string &name) {
  if (hasText(file_path)) {
    std::string stem = stripExtension(lastPathSegment(*file_path));
    if (!normalizeCode(stem).empty())
      return stem;
  }
  if (hasText(url)) {
    std::string stem = stripExtension(lastPathSegment(*url));
    if (!normalizeCode(stem).empty())
      return stem;
  }
  return name;
}

} // namespace Database
} // namespace ImageVault

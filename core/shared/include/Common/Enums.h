#ifndef IMAGEVAULT_COMMON_ENUMS_H
#define IMAGEVAULT_COMMON_ENUMS_H

#include <cstdint>
#include <string>

// =============================================================================
// Windows / 시스템 헤더 매크로 충돌 방지 - 반드시 enum 정의 전에!
// =============================================================================
#ifdef _WIN32
#ifdef ERROR
#undef ERROR
#endif
#ifdef FATAL
#undef FATAL
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#endif

#ifdef INFO
#undef INFO
#endif

#ifdef DEBUG
#undef DEBUG
#endif

#ifdef WARN
#undef WARN
#endif

namespace ImageVault {
namespace Enums {

// =========================================================================
// 로그 레벨
// =========================================================================
enum class LogLevel : uint8_t {
  TRACE = 0,
  DEBUG = 1,
  INFO = 2,
  WARN = 3,
  LOG_ERROR = 4, // ERROR 매크로 충돌 방지
  LOG_FATAL = 5,
  OFF = 255
};

// =========================================================================
// 테넌트 테이블 종류
// =========================================================================
enum class TenantTable : uint8_t { CATEGORIES = 0, PRODUCTS = 1, IMAGES = 2 };

inline std::string tenantTableSuffix(TenantTable table) {
  switch (table) {
  case TenantTable::CATEGORIES:
    return "categories";
  case TenantTable::PRODUCTS:
    return "products";
  case TenantTable::IMAGES:
    return "images";
  }
  return "unknown";
}

inline std::string logLevelToString(LogLevel level) {
  switch (level) {
  case LogLevel::TRACE:
    return "TRACE";
  case LogLevel::DEBUG:
    return "DEBUG";
  case LogLevel::INFO:
    return "INFO";
  case LogLevel::WARN:
    return "WARN";
  case LogLevel::LOG_ERROR:
    return "ERROR";
  case LogLevel::LOG_FATAL:
    return "FATAL";
  case LogLevel::OFF:
    return "OFF";
  }
  return "UNKNOWN";
}

} // namespace Enums
} // namespace ImageVault

#endif // IMAGEVAULT_COMMON_ENUMS_H

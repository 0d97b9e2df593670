#ifndef IMAGEVAULT_TENANT_STORE_OPTIONS_H
#define IMAGEVAULT_TENANT_STORE_OPTIONS_H

#include "Database/IdentifierSanitizer.h"
#include "Database/TenantSQLQueries.h"

#include <cstddef>

class ConfigManager;

namespace ImageVault {
namespace Database {

struct TenantStoreOptions {
  size_t max_token_length = IdentifierSanitizer::DEFAULT_MAX_TOKEN_LENGTH;
  size_t max_code_length = SQL::Tenant::CODE_LENGTH;

  /**
   * @brief TENANT_TOKEN_MAX_LENGTH, IMAGE_CODE_MAX_LENGTH 를 읽는다
   * @details 0 이하 또는 컬럼 길이를 넘는 값은 기본값으로 대체된다
   */
  static TenantStoreOptions fromConfig(const ConfigManager &config);
};

} // namespace Database
} // namespace ImageVault

#endif // IMAGEVAULT_TENANT_STORE_OPTIONS_H

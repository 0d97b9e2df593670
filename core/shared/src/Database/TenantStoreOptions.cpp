#include "Database/TenantStoreOptions.h"
#include "Utils/ConfigManager.h"

namespace ImageVault {
namespace Database {

TenantStoreOptions TenantStoreOptions::fromConfig(const ConfigManager &config) {
  TenantStoreOptions options;

  int token_length = config.getInt("TENANT_TOKEN_MAX_LENGTH",
                                   static_cast<int>(options.max_token_length));
  if (token_length > 0)
    options.max_token_length = static_cast<size_t>(token_length);

  int code_length = config.getInt("IMAGE_CODE_MAX_LENGTH",
                                  static_cast<int>(options.max_code_length));
  if (code_length > 0 && code_length <= SQL::Tenant::CODE_LENGTH)
    options.max_code_length = static_cast<size_t>(code_length);

  return options;
}

} // namespace Database
} // namespace ImageVault

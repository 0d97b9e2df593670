#include "Logging/DbLogBridge.h"
#include "Logging/LogManager.h"

namespace ImageVault {
namespace Logging {

DbLogBridge &DbLogBridge::getInstance() {
  static DbLogBridge instance;
  return instance;
}

// DbLib 레벨: 0 debug, 1 info, 2 warn, 3 error
void DbLogBridge::log(const std::string &category, int level,
                      const std::string &message) {
  LogLevel mapped = LogLevel::DEBUG;
  switch (level) {
  case 1:
    mapped = LogLevel::INFO;
    break;
  case 2:
    mapped = LogLevel::WARN;
    break;
  case 3:
    mapped = LogLevel::LOG_ERROR;
    break;
  default:
    break;
  }
  LogManager::getInstance().log(category, mapped, message);
}

} // namespace Logging
} // namespace ImageVault

#ifndef IMAGEVAULT_DB_LOG_BRIDGE_H
#define IMAGEVAULT_DB_LOG_BRIDGE_H

/**
 * @file DbLogBridge.h
 * @brief DbLib::IDbLogger -> LogManager 연결
 */

#include "DatabaseManager.hpp"

namespace ImageVault {
namespace Logging {

class DbLogBridge : public DbLib::IDbLogger {
public:
  static DbLogBridge &getInstance();

  void log(const std::string &category, int level,
           const std::string &message) override;
};

} // namespace Logging
} // namespace ImageVault

#endif // IMAGEVAULT_DB_LOG_BRIDGE_H

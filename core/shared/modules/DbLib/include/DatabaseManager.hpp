#ifndef DBLIB_DATABASE_MANAGER_HPP
#define DBLIB_DATABASE_MANAGER_HPP

#include "DbExport.hpp"
#include "SQLDialect.hpp"
#include "SqlSession.hpp"

#include <sqlite3.h>

#include <atomic>
#include <map>
#include <memory>
#include <string>

namespace DbLib {

/**
 * @brief Configuration for Database connections
 */
struct DBLIB_API DatabaseConfig {
  std::string type = "SQLITE";
  std::string sqlite_path = "imagevault.db";

  int busy_timeout_ms = 5000;
  std::string journal_mode = "WAL";
  bool foreign_keys = true;
};

/**
 * @brief Logger interface for DbLib
 * @details level: 0 debug, 1 info, 2 warn, 3 error
 */
class DBLIB_API IDbLogger {
public:
  virtual ~IDbLogger() = default;
  virtual void log(const std::string &category, int level,
                   const std::string &message) = 0;
};

/**
 * @brief Connection factory. Every caller gets its own SqlSession; nothing is
 * shared between sessions except the database file.
 */
class DBLIB_API DatabaseManager {
public:
  enum class DatabaseType { SQLITE };

  explicit DatabaseManager(const DatabaseConfig &config,
                           IDbLogger *logger = nullptr);
  ~DatabaseManager() = default;

  DatabaseManager(const DatabaseManager &) = delete;
  DatabaseManager &operator=(const DatabaseManager &) = delete;

  /**
   * @brief Opens a new connection with the configured pragmas applied
   * @throws SqlError when the database cannot be opened
   */
  std::unique_ptr<SqlSession> openSession();

  const DatabaseConfig &getConfig() const { return current_config_; }
  const ISQLDialect &getDialect() const { return *dialect_; }
  DatabaseType getDatabaseType() const { return primary_rdb_; }
  uint64_t getOpenedSessionCount() const { return sessions_opened_.load(); }

  static std::string getDatabaseTypeName(DatabaseType type);
  static DatabaseType parseDatabaseType(const std::string &name);

  void log(int level, const std::string &message);

private:
  sqlite3 *connectSQLite();
  void applyPragmas(SqlSession &session);

  DatabaseConfig current_config_;
  IDbLogger *logger_ = nullptr;
  DatabaseType primary_rdb_ = DatabaseType::SQLITE;
  std::unique_ptr<ISQLDialect> dialect_;
  std::atomic<uint64_t> sessions_opened_{0};
};

} // namespace DbLib

#endif // DBLIB_DATABASE_MANAGER_HPP

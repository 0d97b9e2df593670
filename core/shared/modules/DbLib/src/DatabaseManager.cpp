#include "DatabaseManager.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace DbLib {

namespace {

std::string toUpper(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return value;
}

} // namespace

DatabaseManager::DatabaseManager(const DatabaseConfig &config,
                                 IDbLogger *logger)
    : current_config_(config), logger_(logger) {
  primary_rdb_ = parseDatabaseType(current_config_.type);
  dialect_ = std::make_unique<SQLiteDialect>(current_config_.foreign_keys);

  log(1, "DatabaseManager ready: " + getDatabaseTypeName(primary_rdb_) + " " +
             current_config_.sqlite_path);
}

std::unique_ptr<SqlSession> DatabaseManager::openSession() {
  sqlite3 *conn = connectSQLite();
  auto session = std::make_unique<SqlSession>(conn, *dialect_, logger_);
  applyPragmas(*session);
  sessions_opened_.fetch_add(1);
  return session;
}

// ========================================================================
// SQLite Implementation
// ========================================================================
sqlite3 *DatabaseManager::connectSQLite() {
  const std::string &db_path = current_config_.sqlite_path;
  log(0, "Attempting SQLite connection: " + db_path);

  sqlite3 *conn = nullptr;
  int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_NOMUTEX;
  int result = sqlite3_open_v2(db_path.c_str(), &conn, flags, nullptr);
  if (result == SQLITE_OK) {
    sqlite3_extended_result_codes(conn, 1);
    // wait for locks held by other sessions instead of failing fast
    sqlite3_busy_timeout(conn, current_config_.busy_timeout_ms);
    return conn;
  }

  std::string error_msg =
      conn ? sqlite3_errmsg(conn) : "out of memory opening SQLite";
  log(3, "SQLite connection failed: " + error_msg);
  if (conn)
    sqlite3_close(conn);
  throw SqlError(SqlErrorKind::GENERAL, result, error_msg);
}

void DatabaseManager::applyPragmas(SqlSession &session) {
  session.executeScript(std::string("PRAGMA foreign_keys=") +
                        (current_config_.foreign_keys ? "ON" : "OFF") + ";");

  if (!current_config_.journal_mode.empty()) {
    std::string mode = current_config_.journal_mode;
    mode = toUpper(mode);
    if (mode != "WAL" && mode != "DELETE" && mode != "TRUNCATE" &&
        mode != "PERSIST" && mode != "MEMORY" && mode != "OFF") {
      throw std::invalid_argument("Unsupported SQLite journal mode: " + mode);
    }

    // in-memory databases answer "memory" and keep going
    auto row = session.executeQueryOne("PRAGMA journal_mode=" + mode + ";");
    if (row && !row->empty()) {
      std::string actual = row->begin()->second;
      actual = toUpper(actual);
      if (actual != mode)
        log(2, "SQLite journal mode " + mode + " not applied, using " + actual);
    }
  }

  // Set synchronous mode to NORMAL (safe with WAL)
  session.executeScript("PRAGMA synchronous=NORMAL;");
}

// ========================================================================
// Utilities
// ========================================================================
std::string DatabaseManager::getDatabaseTypeName(DatabaseType type) {
  switch (type) {
  case DatabaseType::SQLITE:
    return "SQLite";
  default:
    return "Unknown";
  }
}

DatabaseManager::DatabaseType
DatabaseManager::parseDatabaseType(const std::string &name) {
  std::string db_type = name;
  db_type = toUpper(db_type);

  if (db_type.empty() || db_type == "SQLITE" || db_type == "SQLITE3")
    return DatabaseType::SQLITE;

  throw std::invalid_argument("Unsupported database type: " + name);
}

void DatabaseManager::log(int level, const std::string &message) {
  if (logger_)
    logger_->log("DbLib", level, message);
}

} // namespace DbLib

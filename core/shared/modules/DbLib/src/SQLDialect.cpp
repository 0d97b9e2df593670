#include "SQLDialect.hpp"

namespace DbLib {

// ========================================================================
// ISQLDialect helpers
// ========================================================================

std::string ISQLDialect::quoteIdentifier(const std::string &identifier) const {
  std::string quoted = "\"";
  for (char c : identifier) {
    if (c == '"')
      quoted += "\"\"";
    else
      quoted += c;
  }
  quoted += "\"";
  return quoted;
}

std::string ISQLDialect::joinStrings(const std::vector<std::string> &strings,
                                     const std::string &delimiter) const {
  std::string result;
  for (size_t i = 0; i < strings.size(); ++i) {
    if (i > 0)
      result += delimiter;
    result += strings[i];
  }
  return result;
}

// ========================================================================
// SQLite
// ========================================================================

SQLiteDialect::SQLiteDialect(bool foreign_keys_enforced)
    : foreign_keys_enforced_(foreign_keys_enforced) {}

std::string SQLiteDialect::getAutoIncrementPrimaryKey() const {
  return "INTEGER PRIMARY KEY AUTOINCREMENT";
}

std::string SQLiteDialect::getTimestampType() const { return "DATETIME"; }

std::string SQLiteDialect::getDecimalType() const { return "DECIMAL(10, 2)"; }

std::string SQLiteDialect::getTextType(int max_length) const {
  if (max_length <= 0)
    return "TEXT";
  return "VARCHAR(" + std::to_string(max_length) + ")";
}

// ON DELETE CASCADE is only honoured while PRAGMA foreign_keys is on
bool SQLiteDialect::supportsForeignKeyCascade() const {
  return foreign_keys_enforced_;
}

std::string SQLiteDialect::buildBeginTransaction(TransactionMode mode) const {
  return mode == TransactionMode::IMMEDIATE ? "BEGIN IMMEDIATE TRANSACTION"
                                            : "BEGIN DEFERRED TRANSACTION";
}

std::string SQLiteDialect::buildTableExistsQuery() const {
  return "SELECT name FROM sqlite_master WHERE type = 'table' AND name = ?";
}

std::string SQLiteDialect::buildTableListQuery() const {
  return "SELECT name FROM sqlite_master WHERE type = 'table' AND name LIKE ? "
         "ESCAPE '\\' ORDER BY name";
}

std::string SQLiteDialect::buildInboundForeignKeyQuery(size_t table_count) const {
  // pragma_foreign_key_list() needs SQLite 3.16+
  // FK target names resolve case-insensitively
  const std::string list =
      joinStrings(std::vector<std::string>(table_count, "lower(?)"), ", ");
  return "SELECT m.name AS source_table, f.\"table\" AS target_table "
         "FROM sqlite_master m, pragma_foreign_key_list(m.name) f "
         "WHERE m.type = 'table' AND lower(f.\"table\") IN (" +
         list + ") AND lower(m.name) NOT IN (" + list + ")";
}

} // namespace DbLib

#ifndef DBLIB_SQL_DIALECT_HPP
#define DBLIB_SQL_DIALECT_HPP

/**
 * @file SQLDialect.hpp
 * @brief SQL dialect handling for DbLib
 */

#include "DbExport.hpp"
#include <string>
#include <vector>

namespace DbLib {

/**
 * @brief How a top-level transaction acquires its locks
 */
enum class TransactionMode {
  DEFERRED, // lock on first access
  IMMEDIATE // take the write lock at BEGIN
};

/**
 * @brief Interface for database-specific SQL dialects
 */
class DBLIB_API ISQLDialect {
public:
  virtual ~ISQLDialect() = default;

  virtual std::string getName() const = 0;

  // Type conversions
  virtual std::string getAutoIncrementPrimaryKey() const = 0;
  virtual std::string getTimestampType() const = 0;
  virtual std::string getDecimalType() const = 0;
  virtual std::string getTextType(int max_length) const = 0;

  // Capabilities
  virtual bool supportsForeignKeyCascade() const = 0;
  virtual bool supportsTransactionalDDL() const = 0;

  // Transaction control
  virtual std::string buildBeginTransaction(TransactionMode mode) const = 0;

  // Catalog
  virtual std::string buildTableExistsQuery() const = 0;
  virtual std::string buildTableListQuery() const = 0;
  virtual std::string buildInboundForeignKeyQuery(size_t table_count) const = 0;

  /**
   * @brief Wraps an already validated identifier in the dialect's quotes
   */
  virtual std::string quoteIdentifier(const std::string &identifier) const;

protected:
  std::string joinStrings(const std::vector<std::string> &strings,
                          const std::string &delimiter) const;
};

/**
 * @brief SQLite dialect implementation
 */
class DBLIB_API SQLiteDialect : public ISQLDialect {
public:
  explicit SQLiteDialect(bool foreign_keys_enforced = true);

  std::string getName() const override { return "SQLITE"; }

  std::string getAutoIncrementPrimaryKey() const override;
  std::string getTimestampType() const override;
  std::string getDecimalType() const override;
  std::string getTextType(int max_length) const override;

  bool supportsForeignKeyCascade() const override;
  bool supportsTransactionalDDL() const override { return true; }

  std::string buildBeginTransaction(TransactionMode mode) const override;

  std::string buildTableExistsQuery() const override;
  std::string buildTableListQuery() const override;
  std::string buildInboundForeignKeyQuery(size_t table_count) const override;

private:
  bool foreign_keys_enforced_;
};

} // namespace DbLib

#endif // DBLIB_SQL_DIALECT_HPP

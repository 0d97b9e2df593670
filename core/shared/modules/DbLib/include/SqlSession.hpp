#ifndef DBLIB_SQL_SESSION_HPP
#define DBLIB_SQL_SESSION_HPP

/**
 * @file SqlSession.hpp
 * @brief Explicit connection handle, prepared statements and transactions
 * @details A session owns one SQLite connection. It is not thread safe: use one
 * session per thread / request and pass it to every repository call.
 */

#include "DatabaseTypes.hpp"
#include "DbExport.hpp"
#include "SQLDialect.hpp"

#include <sqlite3.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace DbLib {

class IDbLogger;

/**
 * @brief Engine error classification
 */
enum class SqlErrorKind {
  UNIQUE_CONSTRAINT,
  FOREIGN_KEY_CONSTRAINT,
  OTHER_CONSTRAINT,
  BUSY,
  GENERAL
};

/**
 * @brief Exception thrown by every failing DbLib call
 */
class DBLIB_API SqlError : public std::runtime_error {
public:
  SqlError(SqlErrorKind kind, int extended_code, const std::string &message)
      : std::runtime_error(message), kind_(kind),
        extended_code_(extended_code) {}

  SqlErrorKind kind() const { return kind_; }
  int extendedCode() const { return extended_code_; }

  bool isConstraint() const {
    return kind_ == SqlErrorKind::UNIQUE_CONSTRAINT ||
           kind_ == SqlErrorKind::FOREIGN_KEY_CONSTRAINT ||
           kind_ == SqlErrorKind::OTHER_CONSTRAINT;
  }

  static SqlErrorKind classify(int extended_code);

private:
  SqlErrorKind kind_;
  int extended_code_;
};

class SqlSession;

/**
 * @brief RAII wrapper over a prepared statement
 */
class DBLIB_API SqlStatement {
public:
  SqlStatement(SqlSession &session, sqlite3_stmt *stmt);
  ~SqlStatement();

  SqlStatement(const SqlStatement &) = delete;
  SqlStatement &operator=(const SqlStatement &) = delete;

  /**
   * @brief Advances to the next row
   * @return true while a row is available, false once done
   */
  bool step();
  bool isDone() const { return done_; }

  Row currentRow() const;

private:
  SqlSession &session_;
  sqlite3_stmt *stmt_;
  bool done_ = false;
};

class DBLIB_API SqlSession {
public:
  SqlSession(sqlite3 *connection, const ISQLDialect &dialect,
             IDbLogger *logger = nullptr);
  ~SqlSession();

  SqlSession(const SqlSession &) = delete;
  SqlSession &operator=(const SqlSession &) = delete;

  /**
   * @brief Runs one statement that returns no rows
   * @return number of rows changed
   */
  int executeNonQuery(const std::string &query,
                      const std::vector<SqlValue> &params = {});

  std::vector<Row> executeQuery(const std::string &query,
                                const std::vector<SqlValue> &params = {});
  std::optional<Row> executeQueryOne(const std::string &query,
                                     const std::vector<SqlValue> &params = {});

  /**
   * @brief Prepares and binds a statement for incremental reading
   */
  std::unique_ptr<SqlStatement> prepare(const std::string &query,
                                        const std::vector<SqlValue> &params = {});

  /**
   * @brief Executes parameterless SQL (pragmas, transaction control)
   */
  void executeScript(const std::string &sql);

  int64_t lastInsertId() const;
  bool inTransaction() const;
  std::string nextSavepointName();

  const ISQLDialect &dialect() const { return dialect_; }
  sqlite3 *getSQLiteConnection() { return conn_; }

  void log(int level, const std::string &message);

  [[noreturn]] void throwError(int rc, const std::string &context);

private:
  sqlite3 *conn_;
  const ISQLDialect &dialect_;
  IDbLogger *logger_;
  uint64_t savepoint_seq_ = 0;
};

/**
 * @brief Scope guard for a transaction or, when one is already open, a
 * savepoint. Rolls back on destruction unless committed.
 */
class DBLIB_API SqlTransaction {
public:
  explicit SqlTransaction(SqlSession &session,
                          TransactionMode mode = TransactionMode::IMMEDIATE);
  ~SqlTransaction();

  SqlTransaction(const SqlTransaction &) = delete;
  SqlTransaction &operator=(const SqlTransaction &) = delete;

  void commit();
  void rollback();

  bool isActive() const { return active_; }
  bool isNested() const { return !savepoint_.empty(); }

private:
  void rollbackQuietly() noexcept;

  SqlSession &session_;
  std::string savepoint_;
  bool active_ = false;
};

} // namespace DbLib

#endif // DBLIB_SQL_SESSION_HPP

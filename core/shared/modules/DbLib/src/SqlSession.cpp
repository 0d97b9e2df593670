#include "SqlSession.hpp"
#include "DatabaseManager.hpp"

namespace DbLib {

// ========================================================================
// SqlError
// ========================================================================

SqlErrorKind SqlError::classify(int extended_code) {
  switch (extended_code) {
  case SQLITE_CONSTRAINT_UNIQUE:
  case SQLITE_CONSTRAINT_PRIMARYKEY:
    return SqlErrorKind::UNIQUE_CONSTRAINT;
  case SQLITE_CONSTRAINT_FOREIGNKEY:
    return SqlErrorKind::FOREIGN_KEY_CONSTRAINT;
  default:
    break;
  }

  switch (extended_code & 0xff) {
  case SQLITE_CONSTRAINT:
    return SqlErrorKind::OTHER_CONSTRAINT;
  case SQLITE_BUSY:
  case SQLITE_LOCKED:
    return SqlErrorKind::BUSY;
  default:
    return SqlErrorKind::GENERAL;
  }
}

// ========================================================================
// SqlStatement
// ========================================================================

SqlStatement::SqlStatement(SqlSession &session, sqlite3_stmt *stmt)
    : session_(session), stmt_(stmt) {}

SqlStatement::~SqlStatement() {
  if (stmt_)
    sqlite3_finalize(stmt_);
}

bool SqlStatement::step() {
  if (done_)
    return false;

  int rc = sqlite3_step(stmt_);
  if (rc == SQLITE_ROW)
    return true;

  done_ = true;
  if (rc == SQLITE_DONE)
    return false;

  // the statement must be reset before the connection reports the real error
  sqlite3_reset(stmt_);
  session_.throwError(rc, "step");
}

Row SqlStatement::currentRow() const {
  Row row;
  int columns = sqlite3_column_count(stmt_);
  for (int i = 0; i < columns; ++i) {
    if (sqlite3_column_type(stmt_, i) == SQLITE_NULL)
      continue;
    const char *name = sqlite3_column_name(stmt_, i);
    const unsigned char *text = sqlite3_column_text(stmt_, i);
    row[name ? name : std::to_string(i)] =
        text ? reinterpret_cast<const char *>(text) : "";
  }
  return row;
}

// ========================================================================
// SqlSession
// ========================================================================

SqlSession::SqlSession(sqlite3 *connection, const ISQLDialect &dialect,
                       IDbLogger *logger)
    : conn_(connection), dialect_(dialect), logger_(logger) {}

SqlSession::~SqlSession() {
  if (conn_) {
    if (inTransaction()) {
      log(2, "Session closed with an open transaction, rolling back");
      sqlite3_exec(conn_, "ROLLBACK", nullptr, nullptr, nullptr);
    }
    sqlite3_close_v2(conn_);
    conn_ = nullptr;
  }
}

std::unique_ptr<SqlStatement>
SqlSession::prepare(const std::string &query,
                    const std::vector<SqlValue> &params) {
  sqlite3_stmt *raw = nullptr;
  int rc = sqlite3_prepare_v2(conn_, query.c_str(),
                              static_cast<int>(query.size()), &raw, nullptr);
  if (rc != SQLITE_OK) {
    if (raw)
      sqlite3_finalize(raw);
    throwError(rc, "prepare");
  }

  auto statement = std::make_unique<SqlStatement>(*this, raw);

  for (size_t i = 0; i < params.size(); ++i) {
    const int index = static_cast<int>(i) + 1;
    const SqlValue &value = params[i];

    switch (valueTypeOf(value)) {
    case ValueType::INTEGER:
      rc = sqlite3_bind_int64(raw, index, std::get<int64_t>(value));
      break;
    case ValueType::REAL:
      rc = sqlite3_bind_double(raw, index, std::get<double>(value));
      break;
    case ValueType::STRING: {
      const std::string &text = std::get<std::string>(value);
      rc = sqlite3_bind_text(raw, index, text.c_str(),
                             static_cast<int>(text.size()), SQLITE_TRANSIENT);
      break;
    }
    case ValueType::NULL_VALUE:
      rc = sqlite3_bind_null(raw, index);
      break;
    }

    if (rc != SQLITE_OK)
      throwError(rc, "bind parameter " + std::to_string(index));
  }

  return statement;
}

int SqlSession::executeNonQuery(const std::string &query,
                                const std::vector<SqlValue> &params) {
  auto statement = prepare(query, params);
  while (statement->step()) {
  }
  return sqlite3_changes(conn_);
}

std::vector<Row> SqlSession::executeQuery(const std::string &query,
                                          const std::vector<SqlValue> &params) {
  auto statement = prepare(query, params);
  std::vector<Row> rows;
  while (statement->step()) {
    rows.push_back(statement->currentRow());
  }
  return rows;
}

std::optional<Row>
SqlSession::executeQueryOne(const std::string &query,
                            const std::vector<SqlValue> &params) {
  auto statement = prepare(query, params);
  if (statement->step())
    return statement->currentRow();
  return std::nullopt;
}

void SqlSession::executeScript(const std::string &sql) {
  char *error_msg = nullptr;
  int rc = sqlite3_exec(conn_, sql.c_str(), nullptr, nullptr, &error_msg);
  if (rc != SQLITE_OK) {
    std::string error_str =
        error_msg ? std::string(error_msg) : "Unknown SQLite error";
    if (error_msg)
      sqlite3_free(error_msg);
    int extended = sqlite3_extended_errcode(conn_);
    log(3, "SQLite error: " + error_str);
    throw SqlError(SqlError::classify(extended), extended, error_str);
  }
}

int64_t SqlSession::lastInsertId() const {
  return static_cast<int64_t>(sqlite3_last_insert_rowid(conn_));
}

bool SqlSession::inTransaction() const {
  return conn_ && sqlite3_get_autocommit(conn_) == 0;
}

std::string SqlSession::nextSavepointName() {
  return "dblib_sp_" + std::to_string(++savepoint_seq_);
}

void SqlSession::log(int level, const std::string &message) {
  if (logger_)
    logger_->log("DbLib", level, message);
}

void SqlSession::throwError(int rc, const std::string &context) {
  int extended = sqlite3_extended_errcode(conn_);
  if ((extended & 0xff) != (rc & 0xff))
    extended = rc;

  std::string message = sqlite3_errmsg(conn_);
  SqlErrorKind kind = SqlError::classify(extended);

  // constraint failures are expected traffic, the caller decides how loud
  log(kind == SqlErrorKind::GENERAL ? 3 : 0,
      "SQLite " + context + " failed (" + std::to_string(extended) +
          "): " + message);
  throw SqlError(kind, extended, message);
}

// ========================================================================
// SqlTransaction
// ========================================================================

SqlTransaction::SqlTransaction(SqlSession &session, TransactionMode mode)
    : session_(session) {
  if (session_.inTransaction()) {
    savepoint_ = session_.nextSavepointName();
    session_.executeScript("SAVEPOINT " + savepoint_);
  } else {
    session_.executeScript(session_.dialect().buildBeginTransaction(mode));
  }
  active_ = true;
}

SqlTransaction::~SqlTransaction() {
  if (active_)
    rollbackQuietly();
}

void SqlTransaction::commit() {
  if (!active_)
    throw SqlError(SqlErrorKind::GENERAL, SQLITE_MISUSE,
                   "commit on an inactive transaction");

  if (isNested())
    session_.executeScript("RELEASE SAVEPOINT " + savepoint_);
  else
    session_.executeScript("COMMIT");
  active_ = false;
}

void SqlTransaction::rollback() {
  if (!active_)
    return;
  active_ = false;

  if (isNested()) {
    session_.executeScript("ROLLBACK TO SAVEPOINT " + savepoint_);
    session_.executeScript("RELEASE SAVEPOINT " + savepoint_);
  } else if (session_.inTransaction()) {
    session_.executeScript("ROLLBACK");
  }
}

void SqlTransaction::rollbackQuietly() noexcept {
  active_ = false;
  sqlite3 *conn = session_.getSQLiteConnection();

  // the engine may already have rolled back on its own (e.g. SQLITE_FULL)
  if (!session_.inTransaction())
    return;

  int rc = SQLITE_OK;
  if (isNested()) {
    const std::string rollback_to = "ROLLBACK TO SAVEPOINT " + savepoint_;
    const std::string release = "RELEASE SAVEPOINT " + savepoint_;
    rc = sqlite3_exec(conn, rollback_to.c_str(), nullptr, nullptr, nullptr);
    if (rc == SQLITE_OK)
      rc = sqlite3_exec(conn, release.c_str(), nullptr, nullptr, nullptr);
  } else {
    rc = sqlite3_exec(conn, "ROLLBACK", nullptr, nullptr, nullptr);
  }

  if (rc != SQLITE_OK) {
    session_.log(3, "Transaction rollback failed: " +
                        std::string(sqlite3_errmsg(conn)));
  } else {
    session_.log(0, isNested() ? "Savepoint rolled back"
                               : "Transaction rolled back");
  }
}

} // namespace DbLib

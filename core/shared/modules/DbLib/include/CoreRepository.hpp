#ifndef DBLIB_CORE_REPOSITORY_HPP
#define DBLIB_CORE_REPOSITORY_HPP

#include "DatabaseTypes.hpp"
#include "DbExport.hpp"
#include "RowCursor.hpp"
#include "SqlSession.hpp"

#include <algorithm>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace DbLib {

/**
 * @brief Generic Repository base for DbLib
 * @tparam EntityType The entity type managed by this repository
 * @details `table_name` is spliced into SQL as-is; it must already be a
 * validated, quoted identifier. Values always travel as bound parameters.
 */
template <typename EntityType> class CoreRepository {
public:
  using Mapper = typename RowCursor<EntityType>::Mapper;

  /**
   * @param mapper row -> entity conversion; it must not capture the
   * repository, cursors may outlive it
   */
  CoreRepository(SqlSession &session, const std::string &repository_name,
                 const std::string &table_name, Mapper mapper)
      : session_(session), repository_name_(repository_name),
        table_name_(table_name), mapper_(std::move(mapper)) {}

  virtual ~CoreRepository() = default;

  std::optional<EntityType> findById(int64_t id) {
    auto row = session_.executeQueryOne(
        "SELECT " + selectColumns() + " FROM " + table_name_ + " WHERE id = ?",
        {id});
    if (!row)
      return std::nullopt;
    return mapper_(*row);
  }

  bool exists(int64_t id) {
    return session_
        .executeQueryOne("SELECT 1 AS found FROM " + table_name_ +
                             " WHERE id = ?",
                         {id})
        .has_value();
  }

  /**
   * @return true when a row was deleted
   */
  bool deleteById(int64_t id) {
    return session_.executeNonQuery(
               "DELETE FROM " + table_name_ + " WHERE id = ?", {id}) > 0;
  }

  int countByConditions(const std::vector<QueryCondition> &conditions) {
    std::vector<SqlValue> params;
    std::string query = "SELECT COUNT(*) AS count FROM " + table_name_ +
                        buildWhereClause(conditions, params);
    auto row = session_.executeQueryOne(query, params);
    if (!row || row->find("count") == row->end())
      return 0;
    return std::stoi(row->at("count"));
  }

  /**
   * @brief Lazy filtered scan. Default order is insertion order (id ASC).
   */
  RowCursor<EntityType>
  findByConditions(const std::vector<QueryCondition> &conditions,
                   const std::optional<OrderBy> &order_by = std::nullopt,
                   const std::optional<Pagination> &pagination = std::nullopt) {
    std::vector<SqlValue> params;
    std::string query = "SELECT " + selectColumns() + " FROM " + table_name_;
    query += buildWhereClause(conditions, params);
    query += buildOrderByClause(order_by);
    query += buildLimitClause(pagination, params);

    return RowCursor<EntityType>(session_.prepare(query, params), mapper_);
  }

  std::vector<EntityType> findAll() {
    return findByConditions({}).toVector();
  }

protected:
  virtual std::string selectColumns() const = 0;
  virtual std::vector<std::string> sortableColumns() const { return {"id"}; }

  std::string buildOrderByClause(const std::optional<OrderBy> &order_by) const {
    OrderBy order = order_by.value_or(OrderBy::Asc("id"));
    auto allowed = sortableColumns();
    if (std::find(allowed.begin(), allowed.end(), order.field) ==
        allowed.end()) {
      throw std::invalid_argument(repository_name_ +
                                  ": unsupported sort column " + order.field);
    }
    // id breaks ties so equal sort keys keep insertion order
    std::string clause = " ORDER BY " + order.toSql();
    if (order.field != "id")
      clause += ", id ASC";
    return clause;
  }

  std::string buildLimitClause(const std::optional<Pagination> &pagination,
                               std::vector<SqlValue> &params) const {
    if (!pagination.has_value())
      return "";
    params.push_back(static_cast<int64_t>(pagination->limit));
    params.push_back(static_cast<int64_t>(std::max(pagination->offset, 0)));
    return " LIMIT ? OFFSET ?";
  }

  SqlSession &session_;
  std::string repository_name_;
  std::string table_name_;
  Mapper mapper_;
};

} // namespace DbLib

#endif // DBLIB_CORE_REPOSITORY_HPP

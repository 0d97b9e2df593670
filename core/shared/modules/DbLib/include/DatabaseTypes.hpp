#ifndef DBLIB_DATABASE_TYPES_HPP
#define DBLIB_DATABASE_TYPES_HPP

/**
 * @file DatabaseTypes.hpp
 * @brief Generic Database Type Definitions for DbLib
 */

#include "DbExport.hpp"
#include <cstdint>
#include <map>
#include <sstream>
#include <string>
#include <variant>
#include <vector>

// Matro conflict prevention
#ifdef max
#undef max
#endif
#ifdef min
#undef min
#endif

namespace DbLib {

/**
 * @brief A bound parameter value. Values never become part of SQL text.
 */
using SqlValue = std::variant<std::nullptr_t, int64_t, double, std::string>;

/**
 * @brief One result row, column name -> text value.
 * @details NULL columns are absent from the map.
 */
using Row = std::map<std::string, std::string>;

/**
 * @brief Type of query value
 */
enum class ValueType {
  STRING,     // String
  INTEGER,    // Integer
  REAL,       // Real/Double
  NULL_VALUE, // NULL
};

inline ValueType valueTypeOf(const SqlValue &value) {
  switch (value.index()) {
  case 1:
    return ValueType::INTEGER;
  case 2:
    return ValueType::REAL;
  case 3:
    return ValueType::STRING;
  default:
    return ValueType::NULL_VALUE;
  }
}

/**
 * @brief Parameterized SQL condition
 * @details `field` must come from a column allow-list in code. The value is
 * always emitted as a `?` placeholder and appended to the bind list.
 */
struct DBLIB_API QueryCondition {
  std::string field;     // Column name (trusted)
  std::string operation; // =, !=, >, <, >=, <=, LIKE
  SqlValue value;

  QueryCondition() : field(""), operation("="), value(nullptr) {}

  QueryCondition(const std::string &f, const std::string &op, SqlValue v)
      : field(f), operation(op), value(std::move(v)) {}

  static QueryCondition Equal(const std::string &field,
                              const std::string &value) {
    return QueryCondition(field, "=", value);
  }

  static QueryCondition EqualInt(const std::string &field, int64_t value) {
    return QueryCondition(field, "=", value);
  }

  /**
   * @brief Case-insensitive substring match, LIKE wildcards in the needle
   * are escaped with '\'.
   */
  static QueryCondition Contains(const std::string &field,
                                 const std::string &needle) {
    return QueryCondition(field, "LIKE", "%" + escapeLike(needle) + "%");
  }

  std::string toSql() const {
    std::ostringstream sql;
    sql << field << " " << operation << " ?";
    if (operation == "LIKE") {
      sql << " ESCAPE '\\'";
    }
    return sql.str();
  }

  static std::string escapeLike(const std::string &str) {
    std::string result;
    result.reserve(str.size());
    for (char c : str) {
      if (c == '%' || c == '_' || c == '\\') {
        result += '\\';
      }
      result += c;
    }
    return result;
  }
};

/**
 * @brief SQL ORDER BY structure
 */
struct DBLIB_API OrderBy {
  std::string field;
  bool ascending;

  OrderBy() : field("id"), ascending(true) {}

  OrderBy(const std::string &f, bool asc = true) : field(f), ascending(asc) {}

  static OrderBy Asc(const std::string &field) { return OrderBy(field, true); }

  static OrderBy Desc(const std::string &field) {
    return OrderBy(field, false);
  }

  std::string toSql() const { return field + (ascending ? " ASC" : " DESC"); }
};

/**
 * @brief Pagination structure
 */
struct DBLIB_API Pagination {
  int limit;
  int offset;

  Pagination() : limit(100), offset(0) {}

  Pagination(int lim, int off = 0) : limit(lim), offset(off) {}
};

/**
 * @brief Builds " WHERE a = ? AND b LIKE ? ..." and appends the values
 */
inline std::string buildWhereClause(const std::vector<QueryCondition> &conditions,
                                    std::vector<SqlValue> &params) {
  if (conditions.empty())
    return "";
  std::ostringstream ss;
  ss << " WHERE ";
  for (size_t i = 0; i < conditions.size(); ++i) {
    if (i > 0)
      ss << " AND ";
    ss << conditions[i].toSql();
    params.push_back(conditions[i].value);
  }
  return ss.str();
}

} // namespace DbLib

#endif // DBLIB_DATABASE_TYPES_HPP

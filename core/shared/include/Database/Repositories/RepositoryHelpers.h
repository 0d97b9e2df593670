// =============================================================================
// core/shared/include/Database/Repositories/RepositoryHelpers.h
// Repository 공통 헬퍼 - 행 접근, 시간 변환, 바인드 값 변환
// =============================================================================

#ifndef IMAGEVAULT_REPOSITORY_HELPERS_H
#define IMAGEVAULT_REPOSITORY_HELPERS_H

#include "DatabaseTypes.hpp"

#include <chrono>
#include <cstdint>
#include <ctime>
#include <optional>
#include <string>
#include <vector>

namespace ImageVault {
namespace Database {

using ValueType = DbLib::ValueType;
using QueryCondition = DbLib::QueryCondition;
using OrderBy = DbLib::OrderBy;
using Pagination = DbLib::Pagination;
using SqlValue = DbLib::SqlValue;
using Row = DbLib::Row;

namespace Repositories {

/**
 * @brief Repository 공통 헬퍼 함수들
 */
class RepositoryHelpers {
public:
    using TimePoint = std::chrono::system_clock::time_point;

    // =========================================================================
    // 행 데이터 안전 접근 (NULL 컬럼은 행에 없음)
    // =========================================================================
    static std::string getRowValue(const Row& row,
                                   const std::string& column_name,
                                   const std::string& default_value = "");
    static int64_t getRowValueAsInt64(const Row& row,
                                      const std::string& column_name,
                                      int64_t default_value = 0);
    static std::optional<std::string> getOptionalString(const Row& row,
                                                        const std::string& column_name);
    static std::optional<double> getOptionalDouble(const Row& row,
                                                   const std::string& column_name);
    static TimePoint getRowValueAsTime(const Row& row,
                                       const std::string& column_name);

    // =========================================================================
    // 바인드 값 변환
    // =========================================================================
    static SqlValue toSqlValue(const std::optional<std::string>& value);
    static SqlValue toSqlValue(const std::optional<double>& value);

    // =========================================================================
    // 시간 변환 (UTC, "YYYY-MM-DD HH:MM:SS")
    // =========================================================================
    static std::string formatTimestamp(const TimePoint& timestamp);
    static TimePoint parseTimestamp(const std::string& timestamp_str);
    static TimePoint nowSeconds();

    // =========================================================================
    // IN 절 헬퍼 (placeholder 만 생성, 값은 params 에 추가)
    // =========================================================================
    static std::string buildInClause(const std::vector<int64_t>& ids,
                                     std::vector<SqlValue>& params);
};

} // namespace Repositories
} // namespace Database
} // namespace ImageVault

#endif // IMAGEVAULT_REPOSITORY_HELPERS_H

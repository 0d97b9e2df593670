// =============================================================================
// core/shared/src/Database/Repositories/RepositoryHelpers.cpp
// =============================================================================

#include "Database/Repositories/RepositoryHelpers.h"

#include <iomanip>
#include <sstream>

namespace ImageVault {
namespace Database {
namespace Repositories {

// =============================================================================
// 행 데이터 안전 접근
// =============================================================================

std::string RepositoryHelpers::getRowValue(const Row& row,
                                           const std::string& column_name,
                                           const std::string& default_value) {
    auto it = row.find(column_name);
    return it != row.end() ? it->second : default_value;
}

int64_t RepositoryHelpers::getRowValueAsInt64(const Row& row,
                                              const std::string& column_name,
                                              int64_t default_value) {
    auto it = row.find(column_name);
    if (it == row.end() || it->second.empty()) {
        return default_value;
    }
    try {
        return std::stoll(it->second);
    } catch (const std::exception&) {
        return default_value;
    }
}

std::optional<std::string> RepositoryHelpers::getOptionalString(const Row& row,
                                                                const std::string& column_name) {
    auto it = row.find(column_name);
    if (it == row.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<double> RepositoryHelpers::getOptionalDouble(const Row& row,
                                                           const std::string& column_name) {
    auto it = row.find(column_name);
    if (it == row.end() || it->second.empty()) {
        return std::nullopt;
    }
    try {
        return std::stod(it->second);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

RepositoryHelpers::TimePoint RepositoryHelpers::getRowValueAsTime(const Row& row,
                                                                  const std::string& column_name) {
    auto it = row.find(column_name);
    if (it == row.end()) {
        return TimePoint{};
    }
    return parseTimestamp(it->second);
}

// =============================================================================
// 바인드 값 변환
// =============================================================================

SqlValue RepositoryHelpers::toSqlValue(const std::optional<std::string>& value) {
    if (!value.has_value()) {
        return nullptr;
    }
    return *value;
}

SqlValue RepositoryHelpers::toSqlValue(const std::optional<double>& value) {
    if (!value.has_value()) {
        return nullptr;
    }
    return *value;
}

// =============================================================================
// 시간 변환
// =============================================================================

std::string RepositoryHelpers::formatTimestamp(const TimePoint& timestamp) {
    std::time_t t = std::chrono::system_clock::to_time_t(timestamp);
    std::tm tm_buf{};
#ifdef _WIN32
    gmtime_s(&tm_buf, &t);
#else
    gmtime_r(&t, &tm_buf);
#endif
    std::ostringstream ss;
    ss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    return ss.str();
}

RepositoryHelpers::TimePoint RepositoryHelpers::parseTimestamp(const std::string& timestamp_str) {
    std::tm tm{};
    std::istringstream ss(timestamp_str);
    ss >> std::get_time(&tm, "%Y-%m-%d %H:%M:%S");
    if (ss.fail()) {
        return TimePoint{};
    }
#ifdef _WIN32
    std::time_t t = _mkgmtime(&tm);
#else
    std::time_t t = timegm(&tm);
#endif
    return std::chrono::system_clock::from_time_t(t);
}

// 저장 포맷이 초 단위이므로 엔티티 값도 초 단위로 맞춘다
RepositoryHelpers::TimePoint RepositoryHelpers::nowSeconds() {
    return std::chrono::time_point_cast<std::chrono::seconds>(
        std::chrono::system_clock::now());
}

// =============================================================================
// IN 절 헬퍼
// =============================================================================

std::string RepositoryHelpers::buildInClause(const std::vector<int64_t>& ids,
                                             std::vector<SqlValue>& params) {
    std::ostringstream ss;
    ss << "(";
    for (size_t i = 0; i < ids.size(); ++i) {
        if (i > 0) {
            ss << ", ";
        }
        ss << "?";
        params.emplace_back(ids[i]);
    }
    ss << ")";
    return ss.str();
}

} // namespace Repositories
} // namespace Database
} // namespace ImageVault

#ifndef LOG_MANAGER_H
#define LOG_MANAGER_H

/**
 * @file LogManager.h
 * @brief ImageVault 통합 로그 관리자 - LogLib 기반 Delegation Wrapper
 * @details
 * 실제 로깅 로직(파일 관리, 로테이션 등)은 독립 라이브러리인
 * LogLib::LoggerEngine 이 수행한다. 설정은 ConfigManager 에서 읽는다.
 *
 * 포맷 템플릿(Info("{}", x))의 첫 인자는 항상 코드에 고정된 문자열이어야
 * 한다. 사용자 입력은 인자로만 전달한다.
 */

#include "Common/Enums.h"

// LogLib (독립 라이브러리) 포함
#include "LoggerEngine.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>

using LogLevel = ImageVault::Enums::LogLevel;

/**
 * @brief ImageVault 전용 로그 관리자 (Wrapper)
 */
class LogManager {
public:
  static LogManager &getInstance() {
    static LogManager instance;
    instance.ensureInitialized();
    return instance;
  }

  bool isInitialized() const {
    return initialized_.load(std::memory_order_acquire);
  }

  // =============================================================================
  // 기본 로그 메소드들
  // =============================================================================
  void Info(const std::string &message);
  void Warn(const std::string &message);
  void Error(const std::string &message);
  void Fatal(const std::string &message);
  void Debug(const std::string &message);
  void Trace(const std::string &message);

  // 포맷 문자열 지원 템플릿
  template <typename... Args>
  void Info(const std::string &format, Args &&...args) {
    Info(formatString(format, std::forward<Args>(args)...));
  }
  template <typename... Args>
  void Warn(const std::string &format, Args &&...args) {
    Warn(formatString(format, std::forward<Args>(args)...));
  }
  template <typename... Args>
  void Error(const std::string &format, Args &&...args) {
    Error(formatString(format, std::forward<Args>(args)...));
  }
  template <typename... Args>
  void Debug(const std::string &format, Args &&...args) {
    Debug(formatString(format, std::forward<Args>(args)...));
  }

  // 확장 로그 메소드들
  void log(const std::string &category, LogLevel level,
           const std::string &message);
  void log(const std::string &category, const std::string &level,
           const std::string &message);

  /**
   * @brief 테넌트 테이블 작업 로그 ("tenant" 카테고리)
   * @param fragment 검증된 테이블 이름 조각 (store_<fragment>_*)
   * @param operation 작업 이름 (createImage 등)
   * @details SQL 원문은 절대 기록하지 않는다.
   */
  void logTenantOperation(const std::string &fragment,
                          const std::string &operation,
                          const std::string &detail = "",
                          LogLevel level = LogLevel::DEBUG);

  /**
   * @brief 테넌트 프로비저닝/삭제 감사 기록 (레벨과 무관하게 기록)
   */
  void logTenantLifecycle(const std::string &fragment,
                          const std::string &action,
                          const std::string &outcome);

  // 설정 및 제어 (LoggerEngine 으로 위임)
  void setLogLevel(LogLevel level);
  LogLevel getLogLevel() const;

  void reloadSettings();
  void setConsoleOutput(bool enabled);
  void setFileOutput(bool enabled);
  void setLogBasePath(const std::string &path);
  void setMaxLogSizeMB(size_t size_mb);
  void setMaxLogFiles(int count);

  // Log Retention
  size_t cleanupOldLogs(int retentionDays);

  LogLib::LogStatistics getStatistics() const;
  void resetStatistics();
  void flushAll();
  void rotateLogs();

private:
  LogManager();
  ~LogManager() = default;

  void ensureInitialized();
  bool doInitialize();
  void loadLogSettingsFromConfig();

  // 포맷팅 지원
  template <typename... Args>
  std::string formatString(const std::string &format, Args &&...args) {
    std::stringstream ss;
    size_t pos = 0;
    formatRecursive(ss, format, pos, std::forward<Args>(args)...);
    return ss.str();
  }

  template <typename T>
  void formatHelper(std::stringstream &ss, const std::string &format,
                    size_t &pos, const T &value) {
    size_t placeholder = format.find("{}", pos);
    if (placeholder != std::string::npos) {
      ss << format.substr(pos, placeholder - pos) << value;
      pos = placeholder + 2;
    } else {
      ss << format.substr(pos);
      pos = format.size();
    }
  }
  void formatRecursive(std::stringstream &ss, const std::string &format,
                       size_t &pos) {
    if (pos < format.size())
      ss << format.substr(pos);
  }
  template <typename T, typename... Args>
  void formatRecursive(std::stringstream &ss, const std::string &format,
                       size_t &pos, const T &value, Args &&...args) {
    formatHelper(ss, format, pos, value);
    formatRecursive(ss, format, pos, std::forward<Args>(args)...);
  }

  std::atomic<bool> initialized_;
  mutable std::recursive_mutex init_mutex_;
};

// 전역 편의 함수들
inline LogManager &Logger() { return LogManager::getInstance(); }
inline void ReloadLogSettings() { LogManager::getInstance().reloadSettings(); }

#endif // LOG_MANAGER_H

#include "Logging/LogManager.h"
#include "Utils/ConfigManager.h"
#include <algorithm>
#include <iostream>

// ImageVault 레벨 <-> LogLib 레벨 변환
static LogLib::LogLevel MapToLogLibLevel(LogLevel level) {
  switch (level) {
  case LogLevel::TRACE:
    return LogLib::LogLevel::TRACE;
  case LogLevel::DEBUG:
    return LogLib::LogLevel::DEBUG;
  case LogLevel::INFO:
    return LogLib::LogLevel::INFO;
  case LogLevel::WARN:
    return LogLib::LogLevel::WARN;
  case LogLevel::LOG_ERROR:
    return LogLib::LogLevel::LOG_ERROR;
  case LogLevel::LOG_FATAL:
    return LogLib::LogLevel::LOG_FATAL;
  case LogLevel::OFF:
    return LogLib::LogLevel::OFF;
  default:
    return LogLib::LogLevel::INFO;
  }
}

static LogLevel MapFromLogLibLevel(LogLib::LogLevel level) {
  switch (level) {
  case LogLib::LogLevel::TRACE:
    return LogLevel::TRACE;
  case LogLib::LogLevel::DEBUG:
    return LogLevel::DEBUG;
  case LogLib::LogLevel::INFO:
    return LogLevel::INFO;
  case LogLib::LogLevel::WARN:
    return LogLevel::WARN;
  case LogLib::LogLevel::LOG_ERROR:
    return LogLevel::LOG_ERROR;
  case LogLib::LogLevel::LOG_FATAL:
    return LogLevel::LOG_FATAL;
  default:
    return LogLevel::OFF;
  }
}

LogManager::LogManager() : initialized_(false) {}

void LogManager::ensureInitialized() {
  if (initialized_.load(std::memory_order_acquire))
    return;

  static thread_local bool in_log_init = false;
  if (in_log_init)
    return; // 재진입 방지

  std::lock_guard<std::recursive_mutex> lock(init_mutex_);
  if (initialized_.load(std::memory_order_relaxed))
    return;

  in_log_init = true;
  doInitialize();
  in_log_init = false;

  initialized_.store(true, std::memory_order_release);
}

bool LogManager::doInitialize() {
  loadLogSettingsFromConfig();
  return true;
}

void LogManager::loadLogSettingsFromConfig() {
  auto &config = ConfigManager::getInstance();
  auto &engine = LogLib::LoggerEngine::getInstance();

  engine.setLogLevel(LogLib::LoggerEngine::stringToLogLevel(
      config.getOrDefault("LOG_LEVEL", "INFO")));
  engine.setConsoleOutput(config.getBool("LOG_TO_CONSOLE", true));
  engine.setFileOutput(config.getBool("LOG_TO_FILE", true));
  engine.setLogBasePath(config.getOrDefault("LOG_FILE_PATH", "./logs/"));

  int max_size_mb = config.getInt("LOG_MAX_SIZE_MB", 100);
  engine.setMaxLogSizeMB(static_cast<size_t>(std::max(max_size_mb, 1)));
  engine.setMaxLogFiles(config.getInt("LOG_MAX_FILES", 30));
}

void LogManager::Info(const std::string &message) {
  log("", LogLevel::INFO, message);
}
void LogManager::Warn(const std::string &message) {
  log("", LogLevel::WARN, message);
}
void LogManager::Error(const std::string &message) {
  log("", LogLevel::LOG_ERROR, message);
}
void LogManager::Fatal(const std::string &message) {
  log("", LogLevel::LOG_FATAL, message);
}
void LogManager::Debug(const std::string &message) {
  log("", LogLevel::DEBUG, message);
}
void LogManager::Trace(const std::string &message) {
  log("", LogLevel::TRACE, message);
}

void LogManager::log(const std::string &category, LogLevel level,
                     const std::string &message) {
  LogLib::LoggerEngine::getInstance().log(category, MapToLogLibLevel(level),
                                          message);
}

void LogManager::log(const std::string &category, const std::string &level,
                     const std::string &message) {
  LogLib::LoggerEngine::getInstance().log(
      category, LogLib::LoggerEngine::stringToLogLevel(level), message);
}

void LogManager::logTenantOperation(const std::string &fragment,
                                    const std::string &operation,
                                    const std::string &detail,
                                    LogLevel level) {
  std::ostringstream oss;
  oss << "[store_" << fragment << "] " << operation;
  if (!detail.empty())
    oss << " - " << detail;
  log("tenant", level, oss.str());
}

void LogManager::logTenantLifecycle(const std::string &fragment,
                                    const std::string &action,
                                    const std::string &outcome) {
  LogLib::LoggerEngine::getInstance().logAudit(
      "tenant_lifecycle", "store_" + fragment, action, outcome);
}

void LogManager::setLogLevel(LogLevel level) {
  LogLib::LoggerEngine::getInstance().setLogLevel(MapToLogLibLevel(level));
}
LogLevel LogManager::getLogLevel() const {
  return MapFromLogLibLevel(LogLib::LoggerEngine::getInstance().getLogLevel());
}

void LogManager::reloadSettings() { loadLogSettingsFromConfig(); }
void LogManager::setConsoleOutput(bool enabled) {
  LogLib::LoggerEngine::getInstance().setConsoleOutput(enabled);
}
void LogManager::setFileOutput(bool enabled) {
  LogLib::LoggerEngine::getInstance().setFileOutput(enabled);
}
void LogManager::setLogBasePath(const std::string &path) {
  LogLib::LoggerEngine::getInstance().setLogBasePath(path);
}
void LogManager::setMaxLogSizeMB(size_t size_mb) {
  LogLib::LoggerEngine::getInstance().setMaxLogSizeMB(size_mb);
}
void LogManager::setMaxLogFiles(int count) {
  LogLib::LoggerEngine::getInstance().setMaxLogFiles(count);
}

size_t LogManager::cleanupOldLogs(int retentionDays) {
  return LogLib::LoggerEngine::getInstance().cleanupOldLogs(retentionDays);
}

LogLib::LogStatistics LogManager::getStatistics() const {
  return LogLib::LoggerEngine::getInstance().getStatistics();
}

void LogManager::resetStatistics() {
  LogLib::LoggerEngine::getInstance().resetStatistics();
}
void LogManager::flushAll() { LogLib::LoggerEngine::getInstance().flushAll(); }
void LogManager::rotateLogs() {
  LogLib::LoggerEngine::getInstance().rotateLogs();
}

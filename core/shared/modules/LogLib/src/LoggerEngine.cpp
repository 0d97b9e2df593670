#include "LoggerEngine.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <sstream>

#ifdef _WIN32
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#include <windows.h>
#endif

namespace LogLib {

LoggerEngine::LoggerEngine()
    : minLevel_(LogLevel::INFO), log_base_path_("./logs/"),
      console_output_enabled_(true), file_output_enabled_(true),
      max_log_size_mb_(100), max_log_files_(30) {
#ifdef _WIN32
  SetConsoleOutputCP(CP_UTF8);
#endif
}

LoggerEngine::~LoggerEngine() { flushAll(); }

LoggerEngine &LoggerEngine::getInstance() {
  static LoggerEngine instance;
  return instance;
}

void LoggerEngine::setLogLevel(LogLevel level) {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  minLevel_ = level;
}

LogLevel LoggerEngine::getLogLevel() const {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  if (log_level_provider_) {
    // provider wins over the static level; caller owns its cost
    const_cast<LoggerEngine *>(this)->minLevel_ = log_level_provider_();
  }
  return minLevel_;
}

void LoggerEngine::setLogLevelProvider(LogLevelProvider provider) {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  log_level_provider_ = std::move(provider);
}

void LoggerEngine::setLogBasePath(const std::string &path) {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  flushAll();
  log_base_path_ = path;
  if (!log_base_path_.empty() && log_base_path_.back() != '/' &&
      log_base_path_.back() != '\\') {
    log_base_path_ += std::filesystem::path::preferred_separator;
  }
}

std::string LoggerEngine::getLogBasePath() const {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  return log_base_path_;
}

void LoggerEngine::setConsoleOutput(bool enabled) {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  console_output_enabled_ = enabled;
}

void LoggerEngine::setFileOutput(bool enabled) {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  file_output_enabled_ = enabled;
}

void LoggerEngine::setMaxLogSizeMB(size_t size_mb) {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  max_log_size_mb_ = size_mb;
}

void LoggerEngine::setMaxLogFiles(int count) {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  max_log_files_ = count;
}

void LoggerEngine::log(const std::string &category, LogLevel level,
                       const std::string &message) {
  LogLevel threshold = getLogLevel();
  if (threshold == LogLevel::OFF ||
      static_cast<int>(level) < static_cast<int>(threshold))
    return;

  updateStatistics(level);

  std::ostringstream oss;
  oss << "[" << getCurrentTimestamp() << "]"
      << "[" << LogLevelToString(level) << "]";

  if (!category.empty()) {
    oss << "[" << category << "]";
  }

  oss << " " << message;

  writeToFile(ensureDirectory(buildLogFilePath(category)), oss.str());
}

void LoggerEngine::logAudit(const std::string &stream,
                            const std::string &subject,
                            const std::string &action,
                            const std::string &outcome) {
  {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    statistics_.audit_count++;
    statistics_.last_log_time = std::chrono::system_clock::now();
  }

  std::ostringstream oss;
  oss << "[" << getCurrentTimestamp() << "][AUDIT] subject=" << subject
      << " action=" << action << " outcome=" << outcome;

  writeToFile(ensureDirectory(buildAuditFilePath(stream)), oss.str());
}

void LoggerEngine::flushAll() {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  for (auto &kv : logFiles_) {
    if (kv.second.is_open()) {
      kv.second.flush();
      kv.second.close();
    }
  }
  logFiles_.clear();
}

void LoggerEngine::rotateLogs() { flushAll(); }

// =============================================================================
// Log Retention
// =============================================================================

size_t LoggerEngine::cleanupOldLogs(int retentionDays) {
  if (retentionDays <= 0)
    return 0;

  std::lock_guard<std::recursive_mutex> lock(mutex_);
  size_t deleted_count = 0;

  try {
    namespace fs = std::filesystem;
    auto cutoff = fs::file_time_type::clock::now() -
                  std::chrono::hours(24 * retentionDays);

    if (!fs::exists(log_base_path_))
      return 0;

    std::vector<fs::path> expired;
    for (const auto &entry : fs::recursive_directory_iterator(
             log_base_path_, fs::directory_options::skip_permission_denied)) {
      if (!entry.is_regular_file() || entry.path().extension() != ".log")
        continue;
      if (entry.last_write_time() < cutoff)
        expired.push_back(entry.path());
    }

    for (const auto &path : expired) {
      auto it = logFiles_.find(path.string());
      if (it != logFiles_.end()) {
        it->second.close();
        logFiles_.erase(it);
      }
      if (fs::remove(path))
        ++deleted_count;
    }

    if (deleted_count > 0 && console_output_enabled_) {
      std::cout << "[" << getCurrentTimestamp() << "][INFO] Log cleanup: deleted "
                << deleted_count << " file(s) older than " << retentionDays
                << " days" << std::endl;
    }
  } catch (const std::exception &e) {
    if (console_output_enabled_)
      std::cout << "[LoggerEngine] cleanupOldLogs error: " << e.what()
                << std::endl;
  }
  return deleted_count;
}

LogStatistics LoggerEngine::getStatistics() const {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  return statistics_;
}

void LoggerEngine::resetStatistics() {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  statistics_ = LogStatistics{};
}

bool LoggerEngine::loadFromConfigFile(const std::string &path) {
  std::ifstream file(path);
  if (!file.is_open())
    return false;

  std::string line;
  while (std::getline(file, line)) {
    line = trim(line);
    if (line.empty() || line[0] == '#')
      continue;

    size_t sep = line.find('=');
    if (sep != std::string::npos) {
      std::string key = trim(line.substr(0, sep));
      std::string value = trim(line.substr(sep + 1));
      applyConfig(key, value);
    }
  }
  return true;
}

// Internal Utilities

std::string LoggerEngine::trim(const std::string &s) {
  auto first = s.find_first_not_of(" \t\r\n\"");
  if (first == std::string::npos)
    return "";
  auto last = s.find_last_not_of(" \t\r\n\"");
  return s.substr(first, (last - first + 1));
}

void LoggerEngine::applyConfig(const std::string &key,
                               const std::string &value) {
  try {
    if (key == "LOG_LEVEL") {
      setLogLevel(stringToLogLevel(value));
    } else if (key == "LOG_FILE_PATH") {
      setLogBasePath(value);
    } else if (key == "LOG_TO_CONSOLE") {
      setConsoleOutput(value == "true" || value == "1");
    } else if (key == "LOG_TO_FILE") {
      setFileOutput(value == "true" || value == "1");
    } else if (key == "LOG_MAX_SIZE_MB") {
      setMaxLogSizeMB(static_cast<size_t>(std::stoul(value)));
    } else if (key == "LOG_MAX_FILES") {
      setMaxLogFiles(std::stoi(value));
    }
  } catch (const std::exception &e) {
    std::cerr << "[LoggerEngine] ignoring invalid " << key << ": " << e.what()
              << std::endl;
  }
}

LogLevel LoggerEngine::stringToLogLevel(const std::string &level) {
  std::string s = level;
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

  if (s == "TRACE")
    return LogLevel::TRACE;
  if (s == "DEBUG")
    return LogLevel::DEBUG;
  if (s == "INFO")
    return LogLevel::INFO;
  if (s == "WARN" || s == "WARNING")
    return LogLevel::WARN;
  if (s == "ERROR")
    return LogLevel::LOG_ERROR;
  if (s == "FATAL")
    return LogLevel::LOG_FATAL;
  if (s == "OFF")
    return LogLevel::OFF;
  return LogLevel::INFO;
}

std::string LoggerEngine::ensureDirectory(const std::filesystem::path &file_path) {
  std::error_code ec;
  std::filesystem::create_directories(file_path.parent_path(), ec);
  if (ec && console_output_enabled_) {
    std::cerr << "[LoggerEngine] cannot create " << file_path.parent_path()
              << ": " << ec.message() << std::endl;
  }
  return file_path.string();
}

std::filesystem::path
LoggerEngine::buildLogFilePath(const std::string &category) {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  std::filesystem::path base_path(log_base_path_);
  std::string name = category.empty() ? "general" : category;
  std::replace(name.begin(), name.end(), '/', '_');
  return base_path / getCurrentDate() / (name + ".log");
}

std::filesystem::path
LoggerEngine::buildAuditFilePath(const std::string &stream) {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  std::filesystem::path base_path(log_base_path_);
  std::string name = stream.empty() ? "audit" : stream;
  std::replace(name.begin(), name.end(), '/', '_');
  return base_path / "audit" / getCurrentDate() / (name + ".log");
}

void LoggerEngine::writeToFile(const std::string &filePath,
                               const std::string &message) {
  std::lock_guard<std::recursive_mutex> lock(mutex_);

  if (console_output_enabled_) {
    std::cout << message << std::endl;
  }

  if (file_output_enabled_) {
    std::ofstream &stream = logFiles_[filePath];
    if (!stream.is_open()) {
      stream.open(filePath, std::ios::app);
    }
    if (stream.is_open()) {
      stream << message << std::endl;
      stream.flush();
      checkAndRotateLogFile(filePath, stream);
    }
  }
}

void LoggerEngine::checkAndRotateLogFile(const std::string &filePath,
                                         std::ofstream &stream) {
  if (!stream.is_open())
    return;

  auto current_pos = stream.tellp();
  if (current_pos <= 0)
    return;

  size_t current_size_mb = static_cast<size_t>(current_pos) / (1024 * 1024);
  if (current_size_mb < max_log_size_mb_)
    return;

  stream.close();

  std::filesystem::path original_path(filePath);
  std::string backup_name = original_path.stem().string() + "_" +
                            getCurrentTimestamp() +
                            original_path.extension().string();
  std::replace(backup_name.begin(), backup_name.end(), ':', '-');
  std::replace(backup_name.begin(), backup_name.end(), ' ', '_');

  std::error_code ec;
  std::filesystem::rename(original_path,
                          original_path.parent_path() / backup_name, ec);
  if (ec && console_output_enabled_) {
    std::cerr << "[LoggerEngine] rotate failed for " << filePath << ": "
              << ec.message() << std::endl;
  }

  pruneBackups(original_path);
  stream.open(filePath, std::ios::app);
}

void LoggerEngine::pruneBackups(const std::filesystem::path &original_path) {
  if (max_log_files_ <= 0)
    return;

  namespace fs = std::filesystem;
  const std::string prefix = original_path.stem().string() + "_";
  std::vector<fs::path> backups;

  std::error_code ec;
  for (const auto &entry :
       fs::directory_iterator(original_path.parent_path(), ec)) {
    const std::string name = entry.path().filename().string();
    if (name.rfind(prefix, 0) == 0 && entry.path().extension() == ".log")
      backups.push_back(entry.path());
  }

  if (backups.size() <= static_cast<size_t>(max_log_files_))
    return;

  // timestamped names sort oldest first
  std::sort(backups.begin(), backups.end());
  size_t excess = backups.size() - static_cast<size_t>(max_log_files_);
  for (size_t i = 0; i < excess; ++i)
    fs::remove(backups[i], ec);
}

std::string LoggerEngine::getCurrentDate() {
  auto now = std::chrono::system_clock::now();
  std::time_t t = std::chrono::system_clock::to_time_t(now);
  std::tm tm_buf;
#ifdef _WIN32
  localtime_s(&tm_buf, &t);
#else
  localtime_r(&t, &tm_buf);
#endif
  std::ostringstream oss;
  oss << std::put_time(&tm_buf, "%Y%m%d");
  return oss.str();
}

std::string LoggerEngine::getCurrentTimestamp() {
  auto now = std::chrono::system_clock::now();
  std::time_t t = std::chrono::system_clock::to_time_t(now);
  std::tm tm_buf;
#ifdef _WIN32
  localtime_s(&tm_buf, &t);
#else
  localtime_r(&t, &tm_buf);
#endif
  std::ostringstream oss;
  oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
  return oss.str();
}

void LoggerEngine::updateStatistics(LogLevel level) {
  std::lock_guard<std::recursive_mutex> lock(mutex_);

  switch (level) {
  case LogLevel::TRACE:
    statistics_.trace_count++;
    break;
  case LogLevel::DEBUG:
    statistics_.debug_count++;
    break;
  case LogLevel::INFO:
    statistics_.info_count++;
    break;
  case LogLevel::WARN:
    statistics_.warn_count++;
    break;
  case LogLevel::LOG_ERROR:
    statistics_.error_count++;
    break;
  case LogLevel::LOG_FATAL:
    statistics_.fatal_count++;
    break;
  default:
    break;
  }

  statistics_.total_logs++;
  statistics_.last_log_time = std::chrono::system_clock::now();
}

} // namespace LogLib

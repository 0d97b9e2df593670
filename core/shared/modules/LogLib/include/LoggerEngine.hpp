#ifndef LOGGER_ENGINE_HPP
#define LOGGER_ENGINE_HPP

#include "LogExport.hpp"
#include "LogTypes.hpp"

#include <atomic>
#include <filesystem>
#include <fstream>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace LogLib {

/**
 * @brief Core logging engine responsible for file management and rotation.
 * @details Project-agnostic, can be distributed as a DLL/SO. Regular logs go
 * to <base>/<date>/<category>.log, audit records to
 * <base>/audit/<date>/<stream>.log.
 */
class LOGLIB_API LoggerEngine {
public:
  static LoggerEngine &getInstance();

  // Configuration
  void setLogLevel(LogLevel level);
  LogLevel getLogLevel() const;

  // Dynamic Configuration
  using LogLevelProvider = std::function<LogLevel()>;
  void setLogLevelProvider(LogLevelProvider provider);

  void setLogBasePath(const std::string &path);
  std::string getLogBasePath() const;

  void setConsoleOutput(bool enabled);
  void setFileOutput(bool enabled);

  void setMaxLogSizeMB(size_t size_mb);
  void setMaxLogFiles(int count);

  // Logging
  void log(const std::string &category, LogLevel level,
           const std::string &message);

  /**
   * @brief Writes one audit record regardless of the current log level
   * @param stream audit file name, e.g. "tenant_lifecycle"
   * @param subject who/what the record is about (tenant fragment)
   * @param action operation name
   * @param outcome "ok", "noop", "failed: ..."
   */
  void logAudit(const std::string &stream, const std::string &subject,
                const std::string &action, const std::string &outcome);

  // Maintenance & Stats
  void flushAll();
  void rotateLogs();
  LogStatistics getStatistics() const;
  void resetStatistics();

  /**
   * @brief Deletes .log files older than the given number of days
   * @return number of removed files
   */
  size_t cleanupOldLogs(int retentionDays);

  // Built-in Config Loader (Simple Key=Value parser)
  bool loadFromConfigFile(const std::string &path);
  void applyConfig(const std::string &key, const std::string &value);

  static LogLevel stringToLogLevel(const std::string &level);

  std::filesystem::path buildLogFilePath(const std::string &category);
  std::filesystem::path buildAuditFilePath(const std::string &stream);

private:
  LoggerEngine();
  ~LoggerEngine();

  LoggerEngine(const LoggerEngine &) = delete;
  LoggerEngine &operator=(const LoggerEngine &) = delete;

  // Internal Utilities
  std::string ensureDirectory(const std::filesystem::path &file_path);

  void writeToFile(const std::string &filePath, const std::string &message);
  void checkAndRotateLogFile(const std::string &filePath,
                             std::ofstream &stream);
  void pruneBackups(const std::filesystem::path &original_path);

  // Config Parser Helpers
  static std::string trim(const std::string &s);

  std::string getCurrentDate();
  std::string getCurrentTimestamp();
  void updateStatistics(LogLevel level);

  // Member Variables
  mutable std::recursive_mutex mutex_;
  std::map<std::string, std::ofstream> logFiles_;

  LogLevel minLevel_;
  std::string log_base_path_;
  bool console_output_enabled_;
  bool file_output_enabled_;

  size_t max_log_size_mb_;
  int max_log_files_;

  LogLevelProvider log_level_provider_;

  mutable LogStatistics statistics_;
};

} // namespace LogLib

#endif // LOGGER_ENGINE_HPP

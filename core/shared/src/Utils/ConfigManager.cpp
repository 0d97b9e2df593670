/**
 * @file ConfigManager.cpp
 * @brief ImageVault 설정 관리자 구현
 */

#include "Utils/ConfigManager.h"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <regex>
#include <sstream>

namespace fs = std::filesystem;

namespace {

const char *MAIN_CONFIG_FILE = "imagevault.env";

const char *MAIN_CONFIG_TEMPLATE = R"(# ImageVault 기본 설정
# 이 파일이 없으면 기본값으로 자동 생성됩니다.

# Database
DB_TYPE=SQLITE
SQLITE_DB_PATH=./data/imagevault.db
DB_BUSY_TIMEOUT_MS=5000
DB_JOURNAL_MODE=WAL
DB_FOREIGN_KEYS=true

# Tenant tables
TENANT_TOKEN_MAX_LENGTH=32
IMAGE_CODE_MAX_LENGTH=200

# Logging
LOG_LEVEL=INFO
LOG_FILE_PATH=./logs/
LOG_TO_CONSOLE=true
LOG_TO_FILE=true
LOG_MAX_SIZE_MB=100
LOG_MAX_FILES=30

# 추가 설정 파일 (쉼표 구분, 설정 디렉토리 기준)
CONFIG_FILES=
)";

std::string trimCopy(const std::string &s) {
  auto first = s.find_first_not_of(" \t\r\n");
  if (first == std::string::npos)
    return "";
  auto last = s.find_last_not_of(" \t\r\n");
  return s.substr(first, last - first + 1);
}

} // namespace

// =============================================================================
// ConfigManager 생성자
// =============================================================================

ConfigManager::ConfigManager() : initialized_(false) {}

ConfigManager &ConfigManager::getInstance() {
  static ConfigManager instance;
  instance.ensureInitialized();
  return instance;
}

// =============================================================================
// 초기화 관련
// =============================================================================

bool ConfigManager::doInitialize() {
  // 1. 설정 디렉토리 찾기
  configDir_ = findConfigDirectory();
  if (configDir_.empty()) {
    // 환경변수만 사용
    initialized_.store(true);
    return false;
  }

  // 2. 기본 템플릿 생성
  createMainEnvFile();

  // 3. 설정 파일들 로드
  loadConfigFile((fs::path(configDir_) / MAIN_CONFIG_FILE).string());
  loadAdditionalConfigs();

  initialized_.store(true);
  return true;
}

void ConfigManager::ensureInitialized() {
  if (initialized_.load(std::memory_order_acquire)) {
    return;
  }

  static thread_local bool in_config_init = false;
  if (in_config_init) {
    return; // 재진입 방지
  }

  std::lock_guard<std::recursive_mutex> lock(init_mutex_);
  if (initialized_.load(std::memory_order_relaxed)) {
    return;
  }

  in_config_init = true;
  doInitialize();
  in_config_init = false;

  initialized_.store(true, std::memory_order_release);
}

void ConfigManager::reload() {
  clear();
  initialized_.store(false);
  doInitialize();
}

void ConfigManager::clear() {
  std::lock_guard<std::mutex> lock(configMutex);
  configMap.clear();
  loadedFiles_.clear();
  searchLog_.clear();
}

// =============================================================================
// 경로 및 파일 관련
// =============================================================================

std::string ConfigManager::findConfigDirectory() {
  searchLog_.clear();

  const char *env_config = std::getenv("IMAGEVAULT_CONFIG_DIR");
  if (env_config && fs::is_directory(env_config)) {
    searchLog_.push_back("환경변수: " + std::string(env_config));
    return std::string(env_config);
  }

  const std::vector<std::string> search_paths = {"./config", "../config",
                                                 "../../config"};
  for (const auto &path : search_paths) {
    std::error_code ec;
    if (fs::is_directory(path, ec)) {
      std::string absolute_path = fs::absolute(path, ec).string();
      if (ec)
        absolute_path = path;
      searchLog_.push_back("발견: " + path + " -> " + absolute_path);
      return absolute_path;
    }
    searchLog_.push_back("없음: " + path);
  }

  searchLog_.push_back("설정 디렉토리를 찾을 수 없음");
  return "";
}

void ConfigManager::createMainEnvFile() {
  fs::path main_file = fs::path(configDir_) / MAIN_CONFIG_FILE;
  std::error_code ec;
  if (fs::exists(main_file, ec))
    return;

  std::ofstream out(main_file);
  if (!out.is_open()) {
    searchLog_.push_back("템플릿 생성 실패: " + main_file.string());
    return;
  }
  out << MAIN_CONFIG_TEMPLATE;
  searchLog_.push_back("템플릿 생성: " + main_file.string());
}

void ConfigManager::loadAdditionalConfigs() {
  std::string files = get("CONFIG_FILES");
  if (files.empty())
    return;

  std::stringstream ss(files);
  std::string name;
  while (std::getline(ss, name, ',')) {
    name = trimCopy(name);
    if (name.empty())
      continue;
    fs::path path(name);
    if (path.is_relative())
      path = fs::path(configDir_) / path;
    loadConfigFile(path.string());
  }
}

bool ConfigManager::loadConfigFile(const std::string &filepath) {
  std::ifstream file(filepath);
  if (!file.is_open()) {
    std::lock_guard<std::mutex> lock(configMutex);
    searchLog_.push_back("파일 열기 실패: " + filepath);
    return false;
  }

  std::string line;
  int line_count = 0;
  {
    std::lock_guard<std::mutex> lock(configMutex);
    while (std::getline(file, line)) {
      line_count++;
      parseLine(line);
    }
    loadedFiles_.push_back(filepath);
    searchLog_.push_back(fs::path(filepath).filename().string() + " - " +
                         std::to_string(line_count) + " 라인 파싱됨");
  }
  return true;
}

void ConfigManager::parseLine(const std::string &raw_line) {
  std::string line = trimCopy(raw_line);
  if (line.empty() || line[0] == '#') {
    return;
  }

  size_t pos = line.find('=');
  if (pos == std::string::npos) {
    return;
  }

  std::string key = trimCopy(line.substr(0, pos));
  std::string value = trimCopy(line.substr(pos + 1));

  if (value.length() >= 2 &&
      ((value.front() == '"' && value.back() == '"') ||
       (value.front() == '\'' && value.back() == '\''))) {
    value = value.substr(1, value.length() - 2);
  }

  if (!key.empty()) {
    configMap[key] = value;
  }
}

// =============================================================================
// 읽기 인터페이스
// =============================================================================

std::string ConfigManager::get(const std::string &key) const {
  // 1. 메모리 설정 확인 (set() 또는 파일)
  std::string raw;
  {
    std::lock_guard<std::mutex> lock(configMutex);
    auto it = configMap.find(key);
    if (it != configMap.end())
      raw = it->second;
  }
  if (!raw.empty()) {
    return expandVariables(raw);
  }

  // 2. 환경변수 확인
  const char *env_val = std::getenv(key.c_str());
  if (env_val) {
    return std::string(env_val);
  }

  return "";
}

std::string ConfigManager::getOrDefault(const std::string &key,
                                        const std::string &defaultValue) const {
  std::string value = get(key);
  if (!value.empty()) {
    return value;
  }
  return defaultValue;
}

void ConfigManager::set(const std::string &key, const std::string &value) {
  std::lock_guard<std::mutex> lock(configMutex);
  configMap[key] = value;
}

bool ConfigManager::hasKey(const std::string &key) const {
  std::lock_guard<std::mutex> lock(configMutex);
  return configMap.find(key) != configMap.end();
}

std::map<std::string, std::string> ConfigManager::listAll() const {
  std::lock_guard<std::mutex> lock(configMutex);
  return configMap;
}

int ConfigManager::getInt(const std::string &key, int defaultValue) const {
  std::string value = get(key);
  if (value.empty())
    return defaultValue;
  try {
    return std::stoi(value);
  } catch (const std::exception &) {
    return defaultValue;
  }
}

bool ConfigManager::getBool(const std::string &key, bool defaultValue) const {
  std::string value = get(key);
  if (value.empty())
    return defaultValue;

  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return (value == "true" || value == "yes" || value == "1" || value == "on");
}

double ConfigManager::getDouble(const std::string &key,
                                double defaultValue) const {
  std::string value = get(key);
  if (value.empty())
    return defaultValue;
  try {
    return std::stod(value);
  } catch (const std::exception &) {
    return defaultValue;
  }
}

std::string ConfigManager::expandVariables(const std::string &value) const {
  if (value.find("${") == std::string::npos)
    return value;

  static const std::regex var_pattern(R"(\$\{([A-Za-z0-9_]+)\})");
  std::string result;
  auto begin = std::sregex_iterator(value.begin(), value.end(), var_pattern);
  auto end = std::sregex_iterator();
  size_t last = 0;

  for (auto it = begin; it != end; ++it) {
    const std::smatch &match = *it;
    result += value.substr(last, match.position(0) - last);

    std::string name = match[1].str();
    std::string replacement;
    {
      std::lock_guard<std::mutex> lock(configMutex);
      auto found = configMap.find(name);
      if (found != configMap.end())
        replacement = found->second;
    }
    if (!replacement.empty()) {
      result += replacement;
    } else if (const char *env_val = std::getenv(name.c_str())) {
      result += env_val;
    }
    last = match.position(0) + match.length(0);
  }
  result += value.substr(last);
  return result;
}

std::string ConfigManager::getSQLiteDbPath() const {
  return getOrDefault("SQLITE_DB_PATH", "./data/imagevault.db");
}

std::string ConfigManager::getActiveDatabaseType() const {
  std::string type = getOrDefault("DB_TYPE", "SQLITE");
  std::transform(type.begin(), type.end(), type.begin(), [](unsigned char c) {
    return static_cast<char>(std::toupper(c));
  });
  return type;
}

std::vector<std::string> ConfigManager::getLoadedFiles() const {
  std::lock_guard<std::mutex> lock(configMutex);
  return loadedFiles_;
}

void ConfigManager::printConfigSearchLog() const {
  std::lock_guard<std::mutex> lock(configMutex);
  std::cout << "=== ConfigManager 검색 로그 ===" << std::endl;
  for (const auto &entry : searchLog_) {
    std::cout << "  " << entry << std::endl;
  }
}

DbLib::DatabaseConfig ConfigManager::getDatabaseConfig() const {
  DbLib::DatabaseConfig config;
  config.type = getActiveDatabaseType();
  config.sqlite_path = getSQLiteDbPath();
  config.busy_timeout_ms = getInt("DB_BUSY_TIMEOUT_MS", 5000);
  config.journal_mode = getOrDefault("DB_JOURNAL_MODE", "WAL");
  config.foreign_keys = getBool("DB_FOREIGN_KEYS", true);
  return config;
}

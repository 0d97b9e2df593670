#pragma once

/**
 * @file ConfigManager.h
 * @brief ImageVault 설정 관리자
 *
 * 설계 원칙:
 * - KEY=VALUE 형식 설정 파일 (# 주석, 따옴표 값 허용)
 * - 파일/코드(set)에서 지정된 값이 우선, 없으면 환경변수
 * - ${VAR} 변수 확장
 * - 멀티스레드 안전성
 */

#include "DatabaseManager.hpp"

#include <atomic>
#include <cstdlib>
#include <map>
#include <mutex>
#include <string>
#include <vector>

class ConfigManager {
public:
  // ==========================================================================
  // 전역 싱글톤 패턴
  // ==========================================================================

  static ConfigManager &getInstance();

  bool isInitialized() const {
    return initialized_.load(std::memory_order_acquire);
  }

  // ==========================================================================
  // 읽기 인터페이스
  // ==========================================================================

  void initialize() { doInitialize(); }
  void reload();
  bool load(const std::string &filepath) { return loadConfigFile(filepath); }

  /**
   * @brief 메모리 설정 초기화 (테스트용, 파일 재로딩 없음)
   */
  void clear();

  std::string get(const std::string &key) const;
  std::string getOrDefault(const std::string &key,
                           const std::string &defaultValue) const;
  void set(const std::string &key, const std::string &value);
  bool hasKey(const std::string &key) const;
  std::map<std::string, std::string> listAll() const;

  // 편의 기능들
  int getInt(const std::string &key, int defaultValue = 0) const;
  bool getBool(const std::string &key, bool defaultValue = false) const;
  double getDouble(const std::string &key, double defaultValue = 0.0) const;

  // 변수 확장
  std::string expandVariables(const std::string &value) const;

  // 경로 관련
  std::string getConfigDirectory() const { return configDir_; }
  std::string getSQLiteDbPath() const;
  std::string getActiveDatabaseType() const;

  // 파일 관리
  std::vector<std::string> getLoadedFiles() const;
  void printConfigSearchLog() const;

  /**
   * @brief DB_* 키로부터 DbLib 연결 설정 생성
   */
  DbLib::DatabaseConfig getDatabaseConfig() const;

private:
  // ==========================================================================
  // 생성자/소멸자 (싱글톤)
  // ==========================================================================

  ConfigManager();
  ~ConfigManager() = default;
  ConfigManager(const ConfigManager &) = delete;
  ConfigManager &operator=(const ConfigManager &) = delete;

  void ensureInitialized();
  bool doInitialize();

  // 설정 파일 처리
  void parseLine(const std::string &line);
  bool loadConfigFile(const std::string &filepath);
  void loadAdditionalConfigs();

  // 경로 탐색 / 템플릿
  std::string findConfigDirectory();
  void createMainEnvFile();

  std::map<std::string, std::string> configMap;
  mutable std::mutex configMutex;
  mutable std::recursive_mutex init_mutex_;
  std::atomic<bool> initialized_;

  std::string configDir_;
  std::vector<std::string> loadedFiles_;
  std::vector<std::string> searchLog_;
};

/**
 * @file test_standalone.cpp
 * @brief LogLib standalone tests: config file, filtering, audit stream
 */

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

#include "LoggerEngine.hpp"

namespace fs = std::filesystem;

class LogLibStandaloneTest : public ::testing::Test {
protected:
  void SetUp() override {
    base_ = fs::temp_directory_path() / "imagevault_loglib_test";
    fs::remove_all(base_);

    auto &logger = LogLib::LoggerEngine::getInstance();
    logger.setLogLevelProvider(nullptr);
    logger.setLogBasePath(base_.string());
    logger.setConsoleOutput(false);
    logger.setFileOutput(true);
    logger.setLogLevel(LogLib::LogLevel::DEBUG);
    logger.resetStatistics();
  }

  void TearDown() override {
    auto &logger = LogLib::LoggerEngine::getInstance();
    logger.setLogLevelProvider(nullptr);
    logger.flushAll();
    fs::remove_all(base_);
  }

  static std::string readFile(const fs::path &path) {
    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
  }

  fs::path base_;
};

TEST_F(LogLibStandaloneTest, LoadsKeyValueConfig) {
  fs::create_directories(base_);
  fs::path env = base_ / "test.env";
  {
    std::ofstream out(env);
    out << "# comment\n"
        << "LOG_LEVEL=warn\n"
        << "LOG_TO_CONSOLE=false\n"
        << "LOG_MAX_FILES=3\n"
        << "LOG_LEVEL=\"TRACE\"\n";
  }

  auto &logger = LogLib::LoggerEngine::getInstance();
  ASSERT_TRUE(logger.loadFromConfigFile(env.string()));
  EXPECT_EQ(logger.getLogLevel(), LogLib::LogLevel::TRACE); // last one wins
  EXPECT_FALSE(logger.loadFromConfigFile((base_ / "missing.env").string()));
}

TEST_F(LogLibStandaloneTest, FiltersBelowThreshold) {
  auto &logger = LogLib::LoggerEngine::getInstance();
  logger.log("test", LogLib::LogLevel::INFO, "visible info");
  logger.log("test", LogLib::LogLevel::TRACE, "hidden trace");
  logger.flushAll();

  std::string content = readFile(logger.buildLogFilePath("test"));
  EXPECT_NE(content.find("[INFO][test] visible info"), std::string::npos);
  EXPECT_EQ(content.find("hidden trace"), std::string::npos);

  auto stats = logger.getStatistics();
  EXPECT_EQ(stats.total_logs, 1u);
  EXPECT_EQ(stats.info_count, 1u);
}

TEST_F(LogLibStandaloneTest, AuditIgnoresLevel) {
  auto &logger = LogLib::LoggerEngine::getInstance();
  logger.setLogLevel(LogLib::LogLevel::OFF);
  logger.logAudit("tenant_lifecycle", "store_7", "provision", "ok");
  logger.log("test", LogLib::LogLevel::LOG_FATAL, "dropped");
  logger.flushAll();

  fs::path audit = logger.buildAuditFilePath("tenant_lifecycle");
  EXPECT_NE(audit.string().find("audit"), std::string::npos);
  std::string content = readFile(audit);
  EXPECT_NE(content.find("subject=store_7 action=provision outcome=ok"),
            std::string::npos);
  EXPECT_EQ(logger.getStatistics().audit_count, 1u);
  EXPECT_FALSE(fs::exists(logger.buildLogFilePath("test")));
}

TEST_F(LogLibStandaloneTest, DynamicLevelProvider) {
  auto &logger = LogLib::LoggerEngine::getInstance();
  int calls = 0;
  logger.setLogLevelProvider([&calls]() {
    return (calls++ % 2 == 0) ? LogLib::LogLevel::LOG_ERROR
                              : LogLib::LogLevel::TRACE;
  });

  logger.log("dynamic", LogLib::LogLevel::INFO, "hidden (current=ERROR)");
  logger.log("dynamic", LogLib::LogLevel::INFO, "visible (current=TRACE)");
  logger.setLogLevelProvider(nullptr);
  logger.flushAll();

  std::string content = readFile(logger.buildLogFilePath("dynamic"));
  EXPECT_EQ(content.find("hidden"), std::string::npos);
  EXPECT_NE(content.find("visible"), std::string::npos);
}

TEST_F(LogLibStandaloneTest, StringToLogLevel) {
  using LogLib::LogLevel;
  EXPECT_EQ(LogLib::LoggerEngine::stringToLogLevel("warning"), LogLevel::WARN);
  EXPECT_EQ(LogLib::LoggerEngine::stringToLogLevel("Error"),
            LogLevel::LOG_ERROR);
  EXPECT_EQ(LogLib::LoggerEngine::stringToLogLevel("bogus"), LogLevel::INFO);
}

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}

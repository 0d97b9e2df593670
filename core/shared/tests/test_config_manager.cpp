/**
 * @file test_config_manager.cpp
 * @brief ConfigManager 파일 로드, 변수 확장, 파생 설정 테스트
 */

#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>

#include "Database/TenantStoreOptions.h"
#include "Utils/ConfigManager.h"

namespace fs = std::filesystem;
using namespace ImageVault::Database;

namespace {

fs::path g_config_dir;

void writeFile(const fs::path& path, const std::string& content) {
    std::ofstream out(path);
    out << content;
}

} // namespace

class ConfigManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        // 각 테스트는 템플릿만 있는 상태에서 시작
        ConfigManager::getInstance().reload();
    }
};

// =============================================================================
// 초기화
// =============================================================================

TEST_F(ConfigManagerTest, CreatesTemplateInConfigDirectory) {
    auto& config = ConfigManager::getInstance();
    EXPECT_TRUE(fs::exists(g_config_dir / "imagevault.env"));
    EXPECT_EQ(fs::path(config.getConfigDirectory()), g_config_dir);

    EXPECT_EQ(config.getActiveDatabaseType(), "SQLITE");
    EXPECT_EQ(config.getInt("IMAGE_CODE_MAX_LENGTH"), 200);
    EXPECT_TRUE(config.getBool("DB_FOREIGN_KEYS"));
}

TEST_F(ConfigManagerTest, ParsesQuotesAndComments) {
    auto& config = ConfigManager::getInstance();
    fs::path extra = g_config_dir / "extra.env";
    writeFile(extra,
              "# comment line\n"
              "QUOTED=\"hello world\"\n"
              "SINGLE='x'\n"
              "  SPACED  =  value  \n"
              "no_equals_line\n");
    ASSERT_TRUE(config.load(extra.string()));

    EXPECT_EQ(config.get("QUOTED"), "hello world");
    EXPECT_EQ(config.get("SINGLE"), "x");
    EXPECT_EQ(config.get("SPACED"), "value");
    EXPECT_FALSE(config.hasKey("no_equals_line"));
    EXPECT_FALSE(config.load((g_config_dir / "missing.env").string()));
}

TEST_F(ConfigManagerTest, ExpandsVariables) {
    auto& config = ConfigManager::getInstance();
    config.set("DATA_ROOT", "/srv/imagevault");
    config.set("SQLITE_DB_PATH", "${DATA_ROOT}/db/store.db");
    EXPECT_EQ(config.getSQLiteDbPath(), "/srv/imagevault/db/store.db");
    EXPECT_EQ(config.expandVariables("${UNDEFINED_IMAGEVAULT_VAR}x"), "x");
}

TEST_F(ConfigManagerTest, EnvironmentIsFallbackOnly) {
    auto& config = ConfigManager::getInstance();
    setenv("IMAGEVAULT_TEST_ONLY_ENV", "from-env", 1);
    EXPECT_EQ(config.get("IMAGEVAULT_TEST_ONLY_ENV"), "from-env");

    config.set("IMAGEVAULT_TEST_ONLY_ENV", "from-file");
    EXPECT_EQ(config.get("IMAGEVAULT_TEST_ONLY_ENV"), "from-file");
    unsetenv("IMAGEVAULT_TEST_ONLY_ENV");
}

TEST_F(ConfigManagerTest, TypedGettersFallBackOnGarbage) {
    auto& config = ConfigManager::getInstance();
    config.set("NOT_A_NUMBER", "abc");
    EXPECT_EQ(config.getInt("NOT_A_NUMBER", 7), 7);
    EXPECT_DOUBLE_EQ(config.getDouble("NOT_A_NUMBER", 1.5), 1.5);
    config.set("YES_FLAG", "Yes");
    EXPECT_TRUE(config.getBool("YES_FLAG"));
}

TEST_F(ConfigManagerTest, LoadsAdditionalConfigFiles) {
    writeFile(g_config_dir / "tenants.env", "TENANT_TOKEN_MAX_LENGTH=16\n");
    writeFile(g_config_dir / "imagevault.env",
              "DB_TYPE=sqlite\nCONFIG_FILES=tenants.env\n");

    auto& config = ConfigManager::getInstance();
    config.reload();
    EXPECT_EQ(config.getInt("TENANT_TOKEN_MAX_LENGTH"), 16);
    EXPECT_EQ(config.getLoadedFiles().size(), 2u);

    fs::remove(g_config_dir / "imagevault.env");
    fs::remove(g_config_dir / "tenants.env");
}

// =============================================================================
// 파생 설정
// =============================================================================

TEST_F(ConfigManagerTest, BuildsDatabaseConfig) {
    auto& config = ConfigManager::getInstance();
    config.set("DB_TYPE", "sqlite3");
    config.set("SQLITE_DB_PATH", "/tmp/iv.db");
    config.set("DB_BUSY_TIMEOUT_MS", "250");
    config.set("DB_JOURNAL_MODE", "DELETE");
    config.set("DB_FOREIGN_KEYS", "false");

    auto db = config.getDatabaseConfig();
    EXPECT_EQ(db.type, "SQLITE3");
    EXPECT_EQ(db.sqlite_path, "/tmp/iv.db");
    EXPECT_EQ(db.busy_timeout_ms, 250);
    EXPECT_EQ(db.journal_mode, "DELETE");
    EXPECT_FALSE(db.foreign_keys);
}

TEST_F(ConfigManagerTest, BuildsTenantStoreOptions) {
    auto& config = ConfigManager::getInstance();
    config.set("TENANT_TOKEN_MAX_LENGTH", "12");
    config.set("IMAGE_CODE_MAX_LENGTH", "64");
    auto options = TenantStoreOptions::fromConfig(config);
    EXPECT_EQ(options.max_token_length, 12u);
    EXPECT_EQ(options.max_code_length, 64u);

    // 컬럼 길이를 넘는 값은 무시
    config.set("IMAGE_CODE_MAX_LENGTH", "5000");
    config.set("TENANT_TOKEN_MAX_LENGTH", "-1");
    options = TenantStoreOptions::fromConfig(config);
    EXPECT_EQ(options.max_token_length, 32u);
    EXPECT_EQ(options.max_code_length, 200u);
}

int main(int argc, char** argv) {
    g_config_dir = fs::temp_directory_path() / "imagevault_config_test";
    std::error_code ec;
    fs::remove_all(g_config_dir, ec);
    fs::create_directories(g_config_dir);
    setenv("IMAGEVAULT_CONFIG_DIR", g_config_dir.c_str(), 1);

    ::testing::InitGoogleTest(&argc, argv);
    int result = RUN_ALL_TESTS();

    fs::remove_all(g_config_dir, ec);
    return result;
}

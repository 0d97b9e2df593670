/**
 * @file test_tenant_store_scenario.cpp
 * @brief 테넌트 2, 3 운영 시나리오 + 로그 기록 확인
 */

#include "TenantTestSupport.h"

#include <fstream>
#include <sstream>

#include "Common/Exceptions.h"
#include "Database/TenantStore.h"
#include "LoggerEngine.hpp"

using namespace ImageVault;
using namespace ImageVault::Database;

class TenantStoreScenarioTest : public TenantDbTest {
protected:
    void SetUp() override {
        TenantDbTest::SetUp();
        log_dir_ = fs::temp_directory_path() / "imagevault_scenario_logs";
        std::error_code ec;
        fs::remove_all(log_dir_, ec);

        auto& logger = LogManager::getInstance();
        logger.setLogBasePath(log_dir_.string());
        logger.setFileOutput(true);
        logger.setLogLevel(LogLevel::DEBUG);

        store_ = std::make_unique<TenantStore>(*session_);
    }

    void TearDown() override {
        store_.reset();
        auto& logger = LogManager::getInstance();
        logger.flushAll();
        logger.setFileOutput(false);
        logger.setLogLevel(LogLevel::INFO);
        std::error_code ec;
        fs::remove_all(log_dir_, ec);
        TenantDbTest::TearDown();
    }

    static std::string readAll(const fs::path& path) {
        std::ifstream in(path);
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

    ImageEntity logoDraft(int64_t product_id) {
        ImageEntity draft;
        draft.setProductId(product_id);
        draft.setName("Logo");
        draft.setCode("logo");
        draft.setFilePath(std::string("media/logo.png"));
        return draft;
    }

    fs::path log_dir_;
    std::unique_ptr<TenantStore> store_;
};

TEST_F(TenantStoreScenarioTest, TwoStoresShareNothing) {
    const TenantId store2 = int64_t{2};
    const TenantId store3 = int64_t{3};

    EXPECT_TRUE(store_->onTenantCreated(store2).created);
    EXPECT_TRUE(store_->onTenantCreated(store3).created);
    EXPECT_FALSE(store_->onTenantCreated(store2).created);

    // 두 스토어 모두 "Shoes"
    auto shoes2 = store_->createCategory(store2, "Shoes");
    auto shoes3 = store_->createCategory(store3, "Shoes");

    ProductEntity runner;
    runner.setName("Runner");
    runner.setCategoryId(shoes2.getId());
    auto runner2 = store_->createProduct(store2, runner);
    runner.setCategoryId(shoes3.getId());
    auto runner3 = store_->createProduct(store3, runner);

    // 두 스토어 모두 "logo"
    EXPECT_EQ(store_->createImage(store2, logoDraft(runner2.getId())).getCode(), "logo");
    EXPECT_EQ(store_->createImage(store3, logoDraft(runner3.getId())).getCode(), "logo");

    // 스토어 2 의 두 번째 "logo" 는 실패
    EXPECT_THROW(store_->createImage(store2, logoDraft(runner2.getId())), DuplicateCode);
    EXPECT_EQ(store_->suggestAvailableCode(store2, "logo"), "logo_1");

    // 스토어 2 의 카테고리 삭제는 스토어 3 에 영향 없음
    auto report = store_->deleteCategory(store2, shoes2.getId());
    EXPECT_EQ(report.products_removed, 1);
    EXPECT_EQ(report.images_removed, 1);

    EXPECT_EQ(store_->countCategories(store2), 0);
    EXPECT_EQ(store_->countImages(store2), 0);
    EXPECT_EQ(store_->countCategories(store3), 1);
    EXPECT_EQ(store_->countProducts(store3), 1);
    ASSERT_TRUE(store_->findImageByCode(store3, "logo").has_value());
    EXPECT_FALSE(store_->findImageByCode(store2, "logo").has_value());

    std::vector<std::string> expected = {"2", "3"};
    EXPECT_EQ(store_->listProvisionedTenants(), expected);
}

TEST_F(TenantStoreScenarioTest, OperationsAreLoggedWithoutSql) {
    const TenantId store2 = int64_t{2};
    store_->onTenantCreated(store2);
    auto category = store_->createCategory(store2, "Shoes {} %s");
    EXPECT_THROW(store_->renameCategory(store2, category.getId() + 1, "x"), NotFound);

    auto& engine = LogLib::LoggerEngine::getInstance();
    LogManager::getInstance().flushAll();

    std::string tenant_log = readAll(engine.buildLogFilePath("tenant"));
    EXPECT_NE(tenant_log.find("[store_2] provision"), std::string::npos);
    EXPECT_NE(tenant_log.find("[store_2] createCategory - id=1"), std::string::npos);
    EXPECT_EQ(tenant_log.find("INSERT"), std::string::npos);
    EXPECT_EQ(tenant_log.find("CREATE TABLE"), std::string::npos);

    std::string audit_log = readAll(engine.buildAuditFilePath("tenant_lifecycle"));
    EXPECT_NE(audit_log.find("subject=store_2 action=provision outcome=ok"), std::string::npos);
}

TEST_F(TenantStoreScenarioTest, DeletedTenantCanBeRecreatedEmpty) {
    const TenantId tenant = std::string("pop_up");
    store_->onTenantCreated(tenant);
    store_->createCategory(tenant, "Seasonal");

    EXPECT_TRUE(store_->onTenantDeleted(tenant));
    EXPECT_FALSE(store_->onTenantDeleted(tenant));
    EXPECT_TRUE(store_->onTenantCreated(tenant).created);
    EXPECT_EQ(store_->countCategories(tenant), 0);
}

TEST_F(TenantStoreScenarioTest, InvalidTenantIsRejectedEverywhere) {
    const TenantId bad = std::string("Store-2");
    EXPECT_THROW(store_->onTenantCreated(bad), InvalidIdentifier);
    EXPECT_THROW(store_->createCategory(bad, "x"), InvalidIdentifier);
    EXPECT_THROW(store_->listProducts(bad), InvalidIdentifier);
    EXPECT_THROW(store_->findImageByCode(bad, "logo"), InvalidIdentifier);
    EXPECT_THROW(store_->onTenantDeleted(int64_t{-1}), InvalidIdentifier);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}

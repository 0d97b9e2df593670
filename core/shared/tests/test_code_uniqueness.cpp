/**
 * @file test_code_uniqueness.cpp
 * @brief 이미지 code 정규화, 유일성, 동시 삽입 테스트
 */

#include "TenantTestSupport.h"

#include <atomic>
#include <thread>
#include <vector>

#include "Common/Exceptions.h"
#include "Database/TenantStore.h"
#include "Database/UniquenessEnforcer.h"

using namespace ImageVault;
using namespace ImageVault::Database;

// =============================================================================
// 정규화 (DB 불필요)
// =============================================================================

TEST(CodeNormalizationTest, NormalizesLikeTheUploadForm) {
    EXPECT_EQ(UniquenessEnforcer::normalizeCode("  Summer Sale  "), "summer_sale");
    EXPECT_EQ(UniquenessEnforcer::normalizeCode("a - b"), "a_b");
    EXPECT_EQ(UniquenessEnforcer::normalizeCode("a-b"), "ab");
    EXPECT_EQ(UniquenessEnforcer::normalizeCode("__x___y__"), "x_y");
    EXPECT_EQ(UniquenessEnforcer::normalizeCode("Logo\t2\n"), "logo_2");
    EXPECT_EQ(UniquenessEnforcer::normalizeCode("!!!"), "");
}

TEST(CodeNormalizationTest, DerivesSourceInPriorityOrder) {
    EXPECT_EQ(UniquenessEnforcer::deriveCodeSource(std::string("a/b/Photo.final.png"),
                                                   std::string("https://x/y/z.png"), "n"),
              "Photo.final");
    EXPECT_EQ(UniquenessEnforcer::deriveCodeSource(std::nullopt,
                                                   std::string("https://x/y/banner.webp#top"), "n"),
              "banner");
    EXPECT_EQ(UniquenessEnforcer::deriveCodeSource(std::string("   "), std::nullopt, "Name"),
              "Name");
    EXPECT_EQ(UniquenessEnforcer::deriveCodeSource(std::nullopt, std::string("https://x/"), "Name"),
              "x");
}

// =============================================================================
// 유일성 (단일 세션)
// =============================================================================

class CodeUniquenessTest : public TenantDbTest {
protected:
    void SetUp() override {
        TenantDbTest::SetUp();
        store_ = std::make_unique<TenantStore>(*session_);
        for (const auto& tenant : {kStoreA, kStoreB}) {
            store_->onTenantCreated(tenant);
            auto category = store_->createCategory(tenant, "Shoes");
            ProductEntity draft;
            draft.setCategoryId(category.getId());
            draft.setName("Runner");
            product_ids_.push_back(store_->createProduct(tenant, draft).getId());
        }
    }

    void TearDown() override {
        store_.reset();
        TenantDbTest::TearDown();
    }

    ImageEntity imageDraft(int64_t product_id, const std::string& code) {
        ImageEntity draft;
        draft.setProductId(product_id);
        draft.setName("image " + code);
        draft.setCode(code);
        return draft;
    }

    const TenantId kStoreA = TenantId{int64_t{2}};
    const TenantId kStoreB = TenantId{int64_t{3}};
    std::unique_ptr<TenantStore> store_;
    std::vector<int64_t> product_ids_;
};

TEST_F(CodeUniquenessTest, DuplicateWithinTenantFails) {
    store_->createImage(kStoreA, imageDraft(product_ids_[0], "logo"));
    try {
        store_->createImage(kStoreA, imageDraft(product_ids_[0], "Logo"));
        FAIL() << "expected DuplicateCode";
    } catch (const DuplicateCode& e) {
        EXPECT_EQ(e.code(), "logo");
    }
    EXPECT_EQ(store_->countImages(kStoreA), 1);
}

TEST_F(CodeUniquenessTest, SameCodeInOtherTenantSucceeds) {
    store_->createImage(kStoreA, imageDraft(product_ids_[0], "logo"));
    EXPECT_NO_THROW(store_->createImage(kStoreB, imageDraft(product_ids_[1], "logo")));
}

TEST_F(CodeUniquenessTest, UniqueIndexIsTheBackstop) {
    store_->createImage(kStoreA, imageDraft(product_ids_[0], "logo"));
    TenantTableSet tables(store_->getSanitizer().sanitize(kStoreA), session_->dialect());

    // 사전 확인을 건너뛴 직접 INSERT 도 엔진이 거부한다
    EXPECT_THROW(
        {
            Repositories::ImageRepository images(*session_, tables);
            images.insert(imageDraft(product_ids_[0], "logo"));
        },
        DbLib::SqlError);
}

TEST_F(CodeUniquenessTest, ReserveCodeNeedsOpenTransaction) {
    UniquenessEnforcer enforcer(*session_, store_->getSanitizer());
    EXPECT_THROW(enforcer.reserveCode(kStoreA, "logo"), std::logic_error);

    store_->createImage(kStoreA, imageDraft(product_ids_[0], "logo"));
    DbLib::SqlTransaction tx(*session_);
    EXPECT_FALSE(enforcer.reserveCode(kStoreA, "logo"));
    EXPECT_TRUE(enforcer.reserveCode(kStoreA, "logo_new"));
    EXPECT_TRUE(enforcer.reserveCode(kStoreB, "logo"));
}

TEST_F(CodeUniquenessTest, SuggestsNextFreeCode) {
    EXPECT_EQ(store_->suggestAvailableCode(kStoreA, "Logo"), "logo");

    store_->createImage(kStoreA, imageDraft(product_ids_[0], "logo"));
    store_->createImage(kStoreA, imageDraft(product_ids_[0], "logo_1"));
    EXPECT_EQ(store_->suggestAvailableCode(kStoreA, "Logo"), "logo_2");
    EXPECT_EQ(store_->suggestAvailableCode(kStoreB, "Logo"), "logo");

    EXPECT_THROW(store_->suggestAvailableCode(kStoreA, "???"), ConstraintViolation);
}

TEST_F(CodeUniquenessTest, ConfiguredMaxLengthApplies) {
    TenantStoreOptions options;
    options.max_code_length = 8;
    TenantStore strict(*session_, options);

    EXPECT_NO_THROW(strict.createImage(kStoreA, imageDraft(product_ids_[0], "abcdefgh")));
    EXPECT_THROW(strict.createImage(kStoreA, imageDraft(product_ids_[0], "abcdefghi")),
                 ConstraintViolation);
}

// =============================================================================
// 동시성: 세션 2개, 같은 파일, 같은 code
// =============================================================================

TEST_F(CodeUniquenessTest, ConcurrentSameCodeInsertsExactlyOneWins) {
    constexpr int kRounds = 10;
    const int64_t product_id = product_ids_[0];

    for (int round = 0; round < kRounds; ++round) {
        const std::string code = "race_" + std::to_string(round);
        std::atomic<int> successes{0};
        std::atomic<int> duplicates{0};
        std::atomic<int> others{0};
        std::atomic<bool> go{false};

        auto worker = [&]() {
            auto session = manager_->openSession();
            TenantStore store(*session);
            while (!go.load()) {
                std::this_thread::yield();
            }
            try {
                store.createImage(kStoreA, imageDraft(product_id, code));
                successes.fetch_add(1);
            } catch (const DuplicateCode&) {
                duplicates.fetch_add(1);
            } catch (const std::exception& e) {
                ADD_FAILURE() << "unexpected error: " << e.what();
                others.fetch_add(1);
            }
        };

        std::thread first(worker);
        std::thread second(worker);
        go.store(true);
        first.join();
        second.join();

        EXPECT_EQ(successes.load(), 1) << code;
        EXPECT_EQ(duplicates.load(), 1) << code;
        EXPECT_EQ(others.load(), 0) << code;
    }

    EXPECT_EQ(store_->countImages(kStoreA), kRounds);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}

/**
 * @file test_identifier_sanitizer.cpp
 * @brief 테넌트 식별자 검증 / 테이블 이름 유도 테스트
 */

#include <gtest/gtest.h>

#include <string>

#include "Common/Exceptions.h"
#include "Database/IdentifierSanitizer.h"
#include "SQLDialect.hpp"

using namespace ImageVault;
using namespace ImageVault::Database;

// =============================================================================
// 허용 입력
// =============================================================================

TEST(IdentifierSanitizerTest, AcceptsPositiveIntegers) {
    IdentifierSanitizer sanitizer;
    EXPECT_EQ(sanitizer.sanitize(int64_t{2}).str(), "2");
    EXPECT_EQ(sanitizer.sanitize(TenantId{int64_t{9000}}).str(), "9000");
}

TEST(IdentifierSanitizerTest, AcceptsLowercaseTokens) {
    IdentifierSanitizer sanitizer;
    EXPECT_EQ(sanitizer.sanitize(std::string("acme_shop")).str(), "acme_shop");
    EXPECT_EQ(sanitizer.sanitize(TenantId{std::string("s3")}).str(), "s3");
}

TEST(IdentifierSanitizerTest, SameInputSameFragment) {
    IdentifierSanitizer sanitizer;
    EXPECT_EQ(sanitizer.sanitize(int64_t{7}), sanitizer.sanitize(int64_t{7}));
    EXPECT_NE(sanitizer.sanitize(int64_t{7}), sanitizer.sanitize(int64_t{8}));
}

// =============================================================================
// 거부 입력
// =============================================================================

TEST(IdentifierSanitizerTest, RejectsNonPositiveIntegers) {
    IdentifierSanitizer sanitizer;
    EXPECT_THROW(sanitizer.sanitize(int64_t{0}), InvalidIdentifier);
    EXPECT_THROW(sanitizer.sanitize(int64_t{-3}), InvalidIdentifier);
}

TEST(IdentifierSanitizerTest, RejectsHostileTokens) {
    IdentifierSanitizer sanitizer;
    const std::vector<std::string> hostile = {
        "",
        "Acme",
        "a-b",
        "a b",
        "a;DROP TABLE x",
        "x\"y",
        "x'y",
        "x`y",
        "caf\xc3\xa9",
        "store.1",
    };
    for (const auto& token : hostile) {
        EXPECT_THROW(sanitizer.sanitize(token), InvalidIdentifier) << token;
        EXPECT_FALSE(sanitizer.isValidToken(token)) << token;
    }
}

TEST(IdentifierSanitizerTest, EnforcesLengthBound) {
    IdentifierSanitizer sanitizer(8);
    EXPECT_NO_THROW(sanitizer.sanitize(std::string("abcdefgh")));
    EXPECT_THROW(sanitizer.sanitize(std::string("abcdefghi")), InvalidIdentifier);
    EXPECT_EQ(sanitizer.getMaxTokenLength(), 8u);
}

TEST(IdentifierSanitizerTest, ErrorDoesNotEchoInput) {
    IdentifierSanitizer sanitizer;
    try {
        sanitizer.sanitize(std::string("evil\"; DROP"));
        FAIL() << "expected InvalidIdentifier";
    } catch (const InvalidIdentifier& e) {
        EXPECT_EQ(std::string(e.what()).find("DROP"), std::string::npos);
    }
}

// =============================================================================
// 테이블 이름
// =============================================================================

TEST(TenantTableSetTest, DerivesQuotedNames) {
    IdentifierSanitizer sanitizer;
    DbLib::SQLiteDialect dialect;
    TenantTableSet tables(sanitizer.sanitize(int64_t{2}), dialect);

    EXPECT_EQ(tables.rawName(Enums::TenantTable::CATEGORIES), "store_2_categories");
    EXPECT_EQ(tables.categories(), "\"store_2_categories\"");
    EXPECT_EQ(tables.products(), "\"store_2_products\"");
    EXPECT_EQ(tables.images(), "\"store_2_images\"");
    EXPECT_EQ(tables.indexName("images_code_unique"),
              "\"idx_store_2_images_code_unique\"");

    auto names = tables.rawNames();
    ASSERT_EQ(names.size(), 3u);
    EXPECT_EQ(names[0], "store_2_categories");
    EXPECT_EQ(names[2], "store_2_images");
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}

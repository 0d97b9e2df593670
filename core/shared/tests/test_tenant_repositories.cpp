/**
 * @file test_tenant_repositories.cpp
 * @brief TenantStore CRUD, 검색, 정렬, 페이지 테스트
 */

#include "TenantTestSupport.h"

#include "Common/Exceptions.h"
#include "Database/TenantStore.h"

using namespace ImageVault;
using namespace ImageVault::Database;

class TenantRepositoryTest : public TenantDbTest {
protected:
    void SetUp() override {
        TenantDbTest::SetUp();
        store_ = std::make_unique<TenantStore>(*session_);
        store_->onTenantCreated(kTenant);
    }

    void TearDown() override {
        store_.reset();
        TenantDbTest::TearDown();
    }

    ProductEntity makeProduct(int64_t category_id, const std::string& name) {
        ProductEntity draft;
        draft.setCategoryId(category_id);
        draft.setName(name);
        return store_->createProduct(kTenant, draft);
    }

    ImageEntity makeImage(int64_t product_id, const std::string& name, const std::string& code) {
        ImageEntity draft;
        draft.setProductId(product_id);
        draft.setName(name);
        draft.setCode(code);
        return store_->createImage(kTenant, draft);
    }

    const TenantId kTenant = TenantId{int64_t{2}};
    std::unique_ptr<TenantStore> store_;
};

// =============================================================================
// 카테고리
// =============================================================================

TEST_F(TenantRepositoryTest, CreateAndGetCategory) {
    auto created = store_->createCategory(kTenant, "Shoes");
    EXPECT_GT(created.getId(), 0);
    EXPECT_TRUE(created.isLoaded());

    auto loaded = store_->getCategory(kTenant, created.getId());
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->getName(), "Shoes");
    EXPECT_TRUE(loaded->isLoaded());
    EXPECT_FALSE(store_->getCategory(kTenant, 999).has_value());
}

TEST_F(TenantRepositoryTest, RenameCategory) {
    auto created = store_->createCategory(kTenant, "Shoes");
    auto renamed = store_->renameCategory(kTenant, created.getId(), "Footwear");
    EXPECT_EQ(renamed.getName(), "Footwear");
    EXPECT_EQ(store_->getCategory(kTenant, created.getId())->getName(), "Footwear");

    EXPECT_THROW(store_->renameCategory(kTenant, 404, "x"), NotFound);
}

TEST_F(TenantRepositoryTest, BlankNamesAreRejected) {
    EXPECT_THROW(store_->createCategory(kTenant, "   "), ConstraintViolation);
    EXPECT_THROW(store_->createCategory(kTenant, std::string(201, 'a')), ConstraintViolation);
    EXPECT_EQ(store_->countCategories(kTenant), 0);
}

TEST_F(TenantRepositoryTest, ValuesAreStoredVerbatim) {
    const std::string hostile = "Robert'); DROP TABLE store_2_images;--";
    auto created = store_->createCategory(kTenant, hostile);
    EXPECT_EQ(store_->getCategory(kTenant, created.getId())->getName(), hostile);
    EXPECT_TRUE(store_->isProvisioned(kTenant));
}

// =============================================================================
// 상품
// =============================================================================

TEST_F(TenantRepositoryTest, ProductRequiresCategoryInSameTenant) {
    EXPECT_THROW(makeProduct(123, "Orphan"), ConstraintViolation);
    EXPECT_EQ(store_->countProducts(kTenant), 0);
}

TEST_F(TenantRepositoryTest, ProductOptionalFieldsRoundTrip) {
    auto category = store_->createCategory(kTenant, "Shoes");

    ProductEntity draft;
    draft.setCategoryId(category.getId());
    draft.setName("Runner");
    draft.setMarkedPrice(120.5);
    draft.setDescription(std::string("light"));
    auto created = store_->createProduct(kTenant, draft);

    auto loaded = store_->getProduct(kTenant, created.getId());
    ASSERT_TRUE(loaded.has_value());
    EXPECT_DOUBLE_EQ(loaded->getMarkedPrice().value(), 120.5);
    EXPECT_FALSE(loaded->getMinDiscountedPrice().has_value());
    EXPECT_EQ(loaded->getDescription().value(), "light");
}

TEST_F(TenantRepositoryTest, UpdateProduct) {
    auto shoes = store_->createCategory(kTenant, "Shoes");
    auto hats = store_->createCategory(kTenant, "Hats");
    auto product = makeProduct(shoes.getId(), "Runner");

    product.setCategoryId(hats.getId());
    product.setName("Cap");
    product.setMinDiscountedPrice(9.99);
    auto updated = store_->updateProduct(kTenant, product);
    EXPECT_EQ(updated.getCategoryId(), hats.getId());
    EXPECT_EQ(updated.getName(), "Cap");

    product.setCategoryId(555);
    EXPECT_THROW(store_->updateProduct(kTenant, product), ConstraintViolation);

    ProductEntity missing(777);
    missing.setCategoryId(hats.getId());
    missing.setName("Ghost");
    EXPECT_THROW(store_->updateProduct(kTenant, missing), NotFound);
}

TEST_F(TenantRepositoryTest, ListProductsByCategoryInInsertionOrder) {
    auto shoes = store_->createCategory(kTenant, "Shoes");
    auto hats = store_->createCategory(kTenant, "Hats");
    makeProduct(shoes.getId(), "Zeta");
    makeProduct(hats.getId(), "Beanie");
    makeProduct(shoes.getId(), "Alpha");

    auto products = store_->listProductsByCategory(kTenant, shoes.getId()).toVector();
    ASSERT_EQ(products.size(), 2u);
    EXPECT_EQ(products[0].getName(), "Zeta");
    EXPECT_EQ(products[1].getName(), "Alpha");
}

TEST_F(TenantRepositoryTest, SearchIsCaseInsensitiveSubstring) {
    auto shoes = store_->createCategory(kTenant, "Shoes");
    makeProduct(shoes.getId(), "Trail Runner");
    makeProduct(shoes.getId(), "Road RUNNER");
    makeProduct(shoes.getId(), "Sandal");

    EXPECT_EQ(store_->searchProducts(kTenant, "runner").toVector().size(), 2u);
    EXPECT_EQ(store_->searchProducts(kTenant, "%").toVector().size(), 0u);
    EXPECT_EQ(store_->countProducts(kTenant, TenantQuery::byName("SAND")), 1);
}

TEST_F(TenantRepositoryTest, SortAndPaginate) {
    auto shoes = store_->createCategory(kTenant, "Shoes");
    makeProduct(shoes.getId(), "Charlie");
    makeProduct(shoes.getId(), "Alpha");
    makeProduct(shoes.getId(), "Bravo");

    TenantQuery query;
    query.order_by = DbLib::OrderBy::Asc("name");
    auto sorted = store_->listProducts(kTenant, query).toVector();
    ASSERT_EQ(sorted.size(), 3u);
    EXPECT_EQ(sorted[0].getName(), "Alpha");
    EXPECT_EQ(sorted[2].getName(), "Charlie");

    query.order_by = DbLib::OrderBy::Desc("name");
    query.pagination = DbLib::Pagination(2, 1);
    auto page = store_->listProducts(kTenant, query).toVector();
    ASSERT_EQ(page.size(), 2u);
    EXPECT_EQ(page[0].getName(), "Bravo");
    EXPECT_EQ(page[1].getName(), "Alpha");
}

TEST_F(TenantRepositoryTest, UnknownSortColumnIsRejected) {
    TenantQuery query;
    query.order_by = DbLib::OrderBy::Asc("name; DROP TABLE x");
    EXPECT_THROW(store_->listProducts(kTenant, query), std::invalid_argument);
}

TEST_F(TenantRepositoryTest, CursorIsSinglePass) {
    store_->createCategory(kTenant, "A");
    store_->createCategory(kTenant, "B");

    auto cursor = store_->listCategories(kTenant);
    int seen = 0;
    for (const auto& category : cursor) {
        EXPECT_FALSE(category.getName().empty());
        ++seen;
    }
    EXPECT_EQ(seen, 2);
    EXPECT_TRUE(cursor.isExhausted());
    EXPECT_FALSE(cursor.next().has_value());
}

// =============================================================================
// 이미지
// =============================================================================

TEST_F(TenantRepositoryTest, ImageCodeIsNormalized) {
    auto shoes = store_->createCategory(kTenant, "Shoes");
    auto product = makeProduct(shoes.getId(), "Runner");

    auto image = makeImage(product.getId(), "Front", "  Front View-2 ");
    EXPECT_EQ(image.getCode(), "front_view2");

    auto found = store_->findImageByCode(kTenant, "FRONT VIEW2");
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->getId(), image.getId());
}

TEST_F(TenantRepositoryTest, ImageCodeIsGeneratedWhenEmpty) {
    auto shoes = store_->createCategory(kTenant, "Shoes");
    auto product = makeProduct(shoes.getId(), "Runner");

    ImageEntity from_file;
    from_file.setProductId(product.getId());
    from_file.setName("ignored");
    from_file.setFilePath(std::string("uploads/2/Side Shot.JPG"));
    EXPECT_EQ(store_->createImage(kTenant, from_file).getCode(), "side_shot");

    ImageEntity from_url;
    from_url.setProductId(product.getId());
    from_url.setName("ignored too");
    from_url.setUrl(std::string("https://cdn.example.com/img/back-view.png?v=3"));
    EXPECT_EQ(store_->createImage(kTenant, from_url).getCode(), "backview");

    ImageEntity from_name;
    from_name.setProductId(product.getId());
    from_name.setName("Top Down");
    EXPECT_EQ(store_->createImage(kTenant, from_name).getCode(), "top_down");
}

TEST_F(TenantRepositoryTest, UnusableCodeIsRejected) {
    auto shoes = store_->createCategory(kTenant, "Shoes");
    auto product = makeProduct(shoes.getId(), "Runner");

    EXPECT_THROW(makeImage(product.getId(), "---", "***"), ConstraintViolation);
    EXPECT_THROW(makeImage(product.getId(), "long", std::string(201, 'a')), ConstraintViolation);
    EXPECT_EQ(store_->countImages(kTenant), 0);
}

TEST_F(TenantRepositoryTest, ImageRequiresProduct) {
    EXPECT_THROW(makeImage(31, "Nope", "nope"), ConstraintViolation);
}

TEST_F(TenantRepositoryTest, UpdateImageKeepsOwnCode) {
    auto shoes = store_->createCategory(kTenant, "Shoes");
    auto product = makeProduct(shoes.getId(), "Runner");
    auto image = makeImage(product.getId(), "Front", "front");
    makeImage(product.getId(), "Back", "back");

    image.setName("Front (new)");
    auto updated = store_->updateImage(kTenant, image);
    EXPECT_EQ(updated.getName(), "Front (new)");
    EXPECT_EQ(updated.getCode(), "front");

    image.setCode("back");
    EXPECT_THROW(store_->updateImage(kTenant, image), DuplicateCode);
}

TEST_F(TenantRepositoryTest, UpdateImageCode) {
    auto shoes = store_->createCategory(kTenant, "Shoes");
    auto product = makeProduct(shoes.getId(), "Runner");
    auto image = makeImage(product.getId(), "Front", "front");
    makeImage(product.getId(), "Back", "back");

    EXPECT_EQ(store_->updateImageCode(kTenant, image.getId(), "Hero Shot").getCode(), "hero_shot");
    EXPECT_THROW(store_->updateImageCode(kTenant, image.getId(), "back"), DuplicateCode);
    EXPECT_THROW(store_->updateImageCode(kTenant, 999, "free"), NotFound);
    EXPECT_EQ(store_->getImage(kTenant, image.getId())->getCode(), "hero_shot");
}

TEST_F(TenantRepositoryTest, DeleteImage) {
    auto shoes = store_->createCategory(kTenant, "Shoes");
    auto product = makeProduct(shoes.getId(), "Runner");
    auto image = makeImage(product.getId(), "Front", "front");

    store_->deleteImage(kTenant, image.getId());
    EXPECT_FALSE(store_->getImage(kTenant, image.getId()).has_value());
    EXPECT_THROW(store_->deleteImage(kTenant, image.getId()), NotFound);
}

TEST_F(TenantRepositoryTest, ListAndSearchImages) {
    auto shoes = store_->createCategory(kTenant, "Shoes");
    auto runner = makeProduct(shoes.getId(), "Runner");
    auto sandal = makeProduct(shoes.getId(), "Sandal");
    makeImage(runner.getId(), "Runner front", "runner_front");
    makeImage(runner.getId(), "Runner back", "runner_back");
    makeImage(sandal.getId(), "Sandal top", "sandal_top");

    EXPECT_EQ(store_->listImagesByProduct(kTenant, runner.getId()).toVector().size(), 2u);
    EXPECT_EQ(store_->searchImages(kTenant, "TOP").toVector().size(), 1u);

    TenantQuery by_code;
    by_code.code_contains = "runner_";
    EXPECT_EQ(store_->countImages(kTenant, by_code), 2);
}

TEST_F(TenantRepositoryTest, EntitiesSerializeToJson) {
    auto shoes = store_->createCategory(kTenant, "Shoes");
    auto product = makeProduct(shoes.getId(), "Runner");
    auto image = makeImage(product.getId(), "Front", "front");

    auto json = image.toJson();
    EXPECT_EQ(json["id"].get<int64_t>(), image.getId());
    EXPECT_EQ(json["product_id"].get<int64_t>(), product.getId());
    EXPECT_EQ(json["code"].get<std::string>(), "front");
    EXPECT_TRUE(json["url"].is_null());
    EXPECT_EQ(json["created_at"].get<std::string>().size(), 19u);

    auto product_json = store_->getProduct(kTenant, product.getId())->toJson();
    EXPECT_TRUE(product_json["marked_price"].is_null());
    EXPECT_EQ(product_json["name"].get<std::string>(), "Runner");
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}

#ifndef IMAGEVAULT_IMAGE_REPOSITORY_H
#define IMAGEVAULT_IMAGE_REPOSITORY_H

/**
 * @file ImageRepository.h
 * @brief store_<id>_images CRUD 및 code 조회
 * @details code 유일성은 images_code_unique 인덱스가 최종 보장한다.
 * codeExists() 는 트랜잭션 안에서 먼저 확인하기 위한 것이다.
 */

#include "CoreRepository.hpp"
#include "Database/Entities/ImageEntity.h"
#include "Database/IdentifierSanitizer.h"
#include "Database/Repositories/RepositoryHelpers.h"
#include "Database/TenantQuery.h"

#include <optional>
#include <string>
#include <vector>

namespace ImageVault {
namespace Database {
namespace Repositories {

using ImageEntity = ImageVault::Database::Entities::ImageEntity;

class ImageRepository : public DbLib::CoreRepository<ImageEntity> {
public:
    ImageRepository(DbLib::SqlSession& session, const TenantTableSet& tables);

    ImageEntity insert(const ImageEntity& draft);
    std::optional<ImageEntity> update(const ImageEntity& entity);
    std::optional<ImageEntity> updateCode(int64_t id, const std::string& code);

    std::optional<ImageEntity> findByCode(const std::string& code);

    /**
     * @param exclude_id 0 이 아니면 해당 행은 제외 (자기 자신 갱신)
     */
    bool codeExists(const std::string& code, int64_t exclude_id = 0);

    int deleteByProduct(int64_t product_id);
    int deleteByProducts(const std::vector<int64_t>& product_ids);

    DbLib::RowCursor<ImageEntity> find(const TenantQuery& query);
    int count(const TenantQuery& query = {});

protected:
    std::string selectColumns() const override;
    std::vector<std::string> sortableColumns() const override;

private:
    static ImageEntity mapRow(const Row& row);
    std::vector<QueryCondition> buildConditions(const TenantQuery& query) const;
};

} // namespace Repositories
} // namespace Database
} // namespace ImageVault

#endif // IMAGEVAULT_IMAGE_REPOSITORY_H

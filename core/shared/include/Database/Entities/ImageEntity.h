/**
 * @file ImageEntity.h
 * @brief 테넌트 이미지 엔티티 (store_<id>_images 행)
 *
 * code 는 테넌트 내에서 유일하며 공개 URL 리졸버의 키로 쓰인다.
 * file_path 는 파일 저장소가 넘겨준 경로를 그대로 보관한다.
 */

#ifndef IMAGEVAULT_IMAGE_ENTITY_H
#define IMAGEVAULT_IMAGE_ENTITY_H

#include "CoreEntity.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace ImageVault {
namespace Database {
namespace Entities {

using json = nlohmann::json;

class ImageEntity : public DbLib::CoreEntity<ImageEntity> {
public:
    ImageEntity() = default;
    explicit ImageEntity(int64_t id) : CoreEntity(id) {}

    int64_t getProductId() const { return product_id_; }
    const std::string& getName() const { return name_; }
    const std::string& getCode() const { return code_; }
    const std::optional<std::string>& getFilePath() const { return file_path_; }
    const std::optional<std::string>& getUrl() const { return url_; }

    void setProductId(int64_t product_id) {
        product_id_ = product_id;
        markModified();
    }

    void setName(const std::string& name) {
        name_ = name;
        markModified();
    }

    void setCode(const std::string& code) {
        code_ = code;
        markModified();
    }

    void setFilePath(const std::optional<std::string>& file_path) {
        file_path_ = file_path;
        markModified();
    }

    void setUrl(const std::optional<std::string>& url) {
        url_ = url;
        markModified();
    }

    json toJson() const;
    std::string toString() const;

private:
    int64_t product_id_ = 0;
    std::string name_;
    std::string code_;
    std::optional<std::string> file_path_;
    std::optional<std::string> url_;
};

} // namespace Entities
} // namespace Database
} // namespace ImageVault

#endif // IMAGEVAULT_IMAGE_ENTITY_H

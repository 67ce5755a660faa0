#pragma once

#include <filesystem>
#include <string>
#include "sandbox/capture.hpp"

namespace sandbox {

/**
 * @brief 保存执行过程中生成的图片
 */
struct image_store {
    virtual ~image_store();

    /**
     * @brief 保存图片
     * @return 图片编号
     * @throw std::exception 保存失败，调用方只记录日志，不影响执行结果
     */
    virtual std::string store(const captured_image &image) = 0;
};

/**
 * @brief 将图片以 captured_image::name 为文件名保存在目录中，图片编号即为文件名
 */
struct directory_image_store : public image_store {
    explicit directory_image_store(const std::filesystem::path &dir);

    std::string store(const captured_image &image) override;

private:
    std::filesystem::path dir;
};

}  // namespace sandbox

#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace sandbox {

/**
 * @brief 图片在 stdout 中的标记前缀
 * 完整的标记为 __SANDBOX_IMAGE_BASE64__[<w>x<h>]data:image/png;base64,<payload>，
 * 其中尺寸部分可以省略。
 */
extern const char IMAGE_MARKER[];

struct captured_image {
    /**
     * @brief 解码后的图片内容
     */
    std::string data;

    /**
     * @brief 唯一的文件名，比如 sandbox_20240101_120000_123_1a2b3c4d.png
     */
    std::string name;

    int width = 0;
    int height = 0;

    /**
     * @brief 图片格式，比如 "png"
     */
    std::string format;
};

/**
 * @brief 序列化时不包含图片内容，只包含元信息
 */
void to_json(nlohmann::json &j, const captured_image &image);

struct capture_result {
    /**
     * @brief 去掉图片标记后的输出
     */
    std::string output;

    std::vector<captured_image> images;
};

/**
 * @brief 从 stdout 中提取图片
 * 无法解码的图片会被丢弃并输出警告，不会导致失败。
 * @param stdout_text 子进程的标准输出
 * @param inline_images 为真时将标记替换为 markdown 图片引用，否则直接删除标记
 */
capture_result extract_images(const std::string &stdout_text, bool inline_images);

/**
 * @brief 从 PNG 文件头（IHDR 块）中读取图片尺寸
 * @return 是否是合法的 PNG 文件头
 */
bool read_png_size(const std::string &data, int &width, int &height);

}  // namespace sandbox

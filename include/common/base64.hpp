#pragma once

#include <string>

namespace sandbox {

std::string encode_base64(const std::string &bytes);

/**
 * @brief 解码标准 base64 字符串（RFC 4648，带 '=' 填充）
 * @throw std::invalid_argument 长度不是 4 的倍数或者包含非法字符
 */
std::string decode_base64(const std::string &text);

}  // namespace sandbox

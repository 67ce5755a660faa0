#pragma once

#include <string>

namespace sandbox {

/**
 * @brief 沙箱能够识别的脚本语言
 * 目前只有 PYTHON 能被执行，其他语言只会返回未实现的执行结果
 */
enum class language {
    PYTHON,
    R,
    JAVASCRIPT,
    SQL
};

/**
 * @brief 解析语言名称，忽略大小写
 * @param name 比如 "python", "r"
 * @throw invalid_language 无法识别的语言
 */
language parse_language(const std::string &name);

std::string to_string(language lang);

}  // namespace sandbox

#pragma once

#include <filesystem>
#include <nlohmann/json.hpp>
#include <optional>
#include <regex>
#include <set>
#include <string>
#include <vector>
#include "common/status.hpp"
#include "sandbox/language.hpp"
#include "sandbox/parser.hpp"
#include "sandbox/repair.hpp"

namespace sandbox {

/**
 * @brief 代码安全检查的配置
 * 配置在构造 code_validator 时传入，之后不会再被修改
 */
struct validator_config {
    /**
     * @brief 允许导入的顶层包，比如 "numpy" 允许 import numpy.linalg
     */
    std::set<std::string> allowed_modules;

    /**
     * @brief 禁止直接调用的内置函数
     */
    std::set<std::string> forbidden_builtins;

    /**
     * @brief 对原始代码进行文本匹配的正则表达式（ECMAScript 语法，忽略大小写）
     * 作为语法树检查之外的第二道防线
     */
    std::vector<std::string> dangerous_patterns;

    /**
     * @brief 默认配置，允许常用的数据分析库
     */
    static validator_config defaults();
};

/**
 * @brief 从 json 中读取配置，缺少的字段使用默认配置
 * @code{.json}
 * {
 *     "allowed_modules": ["numpy", "pandas"],
 *     "forbidden_builtins": ["eval", "exec"],
 *     "dangerous_patterns": ["__import__\\s*\\("]
 * }
 * @endcode
 */
void from_json(const nlohmann::json &j, validator_config &config);

void to_json(nlohmann::json &j, const validator_config &config);

/**
 * @brief 从 json 文件中读取配置
 * @throw std::runtime_error 文件不存在
 * @throw nlohmann::json::exception 文件格式错误
 */
validator_config load_validator_config(const std::filesystem::path &path);

struct validation_result {
    bool valid = false;

    /**
     * @brief 校验失败的原因，只会是 INVALID_REQUEST、SYNTAX_ERROR 或者 SECURITY_VIOLATION
     */
    error_kind kind = error_kind::NONE;

    std::string error;

    /**
     * @brief 如果代码经过了语法修复，为修复后的代码，之后应当执行修复后的代码
     */
    std::optional<std::string> repaired_code;
};

void to_json(nlohmann::json &j, const validation_result &result);

/**
 * @brief 静态检查代码是否可以执行
 * 检查过程没有副作用，只会解析代码，不会执行代码。
 */
struct code_validator {
    /**
     * @throw std::regex_error 配置中的正则表达式不合法
     */
    code_validator(const script_parser &parser, validator_config config);

    /**
     * @brief 检查代码
     * 1. 解析代码，解析失败时尝试语法修复，修复后仍然无法解析返回 SYNTAX_ERROR
     * 2. 检查语法树中的 import、函数调用、变量和属性，不在白名单中的模块、禁止的内置函数
     *    （无论是否直接调用）或者以 '_' 开头的属性返回 SECURITY_VIOLATION
     * 3. 用正则表达式检查代码文本，匹配到危险模式返回 SECURITY_VIOLATION
     * 非 Python 语言不做检查。
     */
    validation_result validate(const std::string &code, language lang) const;

    const validator_config &config() const;

private:
    const script_parser &parser;
    const validator_config configuration;
    std::vector<std::pair<std::string, std::regex>> patterns;
    syntax_repairer repairer;

    void check_nodes(const std::vector<syntax_node> &nodes) const;
    void check_patterns(const std::string &code) const;
};

}  // namespace sandbox

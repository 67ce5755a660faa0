#pragma once

#include <string>
#include <vector>
#include "sandbox/parser.hpp"

namespace sandbox {

/**
 * @brief 尝试修复几乎合法的 Python 脚本，比如 AI 生成的代码中常见的缩进错乱和未闭合的字符串
 * 修复只改变空白和定界符，不会增加或删除语句。
 *
 * 修复按固定的顺序依次尝试以下变换，每种变换都作用于原始代码，
 * 第一个能通过解析的结果被采用：
 * 1. 缩进规范化
 * 2. 补全未闭合的字符串
 * 3. 缩进块开始后的第一行
 */
struct syntax_repairer {
    explicit syntax_repairer(const script_parser &parser);

    /**
     * @brief 修复代码
     * 如果代码本身就能解析，或者所有变换都无法得到能解析的代码，返回原始代码。
     * 因此 repair(repair(code)) == repair(code)。
     */
    std::string repair(const std::string &code) const;

    /**
     * @brief 缩进规范化
     * 以 ':' 结尾的行之后的一行缩进一级，else/elif/except/finally 与对应的块开始对齐，
     * 每一级缩进统一为 4 个空格。三引号字符串和括号内部的行保持不变。
     */
    static std::string normalize_indentation(const std::string &code);

    /**
     * @brief 为行尾未闭合的单行字符串补上引号，为文末未闭合的三引号字符串补上三引号
     */
    static std::string close_string_literals(const std::string &code);

    /**
     * @brief 如果以 ':' 结尾的行之后的第一行没有缩进，将它缩进到比块开始多 4 个空格
     */
    static std::string indent_block_bodies(const std::string &code);

private:
    const script_parser &parser;
};

}  // namespace sandbox

#pragma once

#include <string>
#include <vector>

/**
 * 这个头文件包含按行扫描 Python 源代码的工具
 * 扫描器只识别字符串、注释、括号和行尾的冒号，不是完整的词法分析器，
 * 用于语法修复和文件读取改写这类需要保持代码原样的行级变换。
 */
namespace sandbox {

struct line_info {
    /**
     * @brief 该行的原始内容，不包括换行符
     */
    std::string text;

    /**
     * @brief 行首空白的宽度，制表符对齐到 8 的倍数
     */
    int indent_width = 0;

    /**
     * @brief 去掉行首空白后的内容
     */
    std::string content;

    /**
     * @brief 空行或者只有注释的行
     */
    bool blank = false;

    /**
     * @brief 行首位于三引号字符串内部，这一行的内容不能被修改
     */
    bool in_string = false;

    /**
     * @brief 行首位于括号内部或者上一行以反斜杠续行，这一行的缩进没有语法意义
     */
    bool continuation = false;

    /**
     * @brief 该行以冒号结束（不在字符串、注释和括号中），下一行应当缩进
     */
    bool opens_block = false;

    /**
     * @brief 该行结束时仍然位于单引号或双引号字符串中，值为未闭合的引号，否则为 0
     */
    char open_quote = 0;

    /**
     * @brief 该行的第一个标识符，比如 "else"、"def"
     */
    std::string first_word;
};

struct scan_result {
    std::vector<line_info> lines;

    /**
     * @brief 扫描结束时仍未闭合的三引号，为空表示全部闭合
     */
    std::string open_triple_quote;
};

/**
 * @brief 按 '\n' 分割源代码，行尾的 '\r' 会被去掉
 */
std::vector<std::string> split_lines(const std::string &code);

/**
 * @brief 以 '\n' 连接各行
 * @param trailing_newline 是否在末尾追加换行符
 */
std::string join_lines(const std::vector<std::string> &lines, bool trailing_newline);

scan_result scan_lines(const std::vector<std::string> &lines);

/**
 * @brief 将字符串字面量（包括引号）和注释替换为空格，换行符保持不变
 * 返回值与 text 等长，可以用返回值中的位置定位 text 中的代码。
 * text 可以包含多行，三引号字符串可以跨行。
 */
std::string mask_literals(const std::string &text);

/**
 * @brief 将字符串转换为 Python 的单引号字符串字面量
 */
std::string python_string_literal(const std::string &value);

}  // namespace sandbox

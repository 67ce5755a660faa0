#pragma once

#include <string>
#include <vector>

namespace sandbox {

/**
 * @brief 语法树中与安全检查相关的节点
 */
struct syntax_node {
    enum class node_type {
        IMPORT,       // import a.b.c
        IMPORT_FROM,  // from a.b import c
        CALL,         // f(...) 或者 a.b.f(...)
        NAME,         // 读取变量 f，不包括赋值
        ATTRIBUTE     // a.b 中的 b
    };

    node_type type;

    /**
     * @brief 对于 IMPORT 和 IMPORT_FROM，是完整的模块名；
     * 对于 CALL，是被调用的名字，属性调用会带上前缀，比如 "plt.show"。
     * 无法确定名字的调用（比如 f()()）为空字符串。
     * 对于 NAME，是标识符；对于 ATTRIBUTE，是不带前缀的属性名
     */
    std::string name;

    /**
     * @brief 节点所在的行号，从 1 开始
     */
    int line = 0;

    /**
     * @brief 相对导入的层级，from ..a import b 为 2，绝对导入为 0
     */
    int level = 0;
};

struct parse_result {
    bool ok = false;

    /**
     * @brief 解析失败时解析器给出的错误信息
     */
    std::string error;

    /**
     * @brief 解析失败的行号，未知时为 0
     */
    int error_line = 0;

    /**
     * @brief 按语法树遍历顺序排列的节点
     */
    std::vector<syntax_node> nodes;
};

/**
 * @brief 将脚本解析为语法树
 */
struct script_parser {
    virtual ~script_parser();

    /**
     * @brief 解析脚本，语法错误通过 parse_result 返回，不会抛出异常
     * @throw internal_error 解析器自身出错
     */
    virtual parse_result parse(const std::string &code) const = 0;
};

/**
 * @brief 通过嵌入的 CPython 解释器的 ast 模块解析 Python 脚本
 * 只调用 ast.parse，不会编译或执行脚本。
 * 解释器必须已经初始化，parse 内部会通过 GIL_guard 获取 GIL。
 */
struct python_ast_parser : public script_parser {
    parse_result parse(const std::string &code) const override;
};

}  // namespace sandbox

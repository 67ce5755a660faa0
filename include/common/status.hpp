#pragma once

#include <string>

namespace sandbox {

/**
 * @brief 表示一次代码执行的状态
 * 状态转移只允许：PENDING -> RUNNING -> {COMPLETED | FAILED}，
 * 以及校验失败时的 PENDING -> FAILED。
 */
enum class execution_status {
    /**
     * @brief 执行记录已经创建，代码还未通过校验或者还未启动子进程
     */
    PENDING = 0,

    /**
     * @brief 子进程已经启动，正在等待子进程结束或超时
     */
    RUNNING = 1,

    /**
     * @brief 子进程正常退出，且没有超出任何资源限制
     * 即使 stderr 有输出（比如警告信息），也可以是 COMPLETED
     */
    COMPLETED = 2,

    /**
     * @brief 执行失败
     * 包括校验失败、超时、内存超限、输出超限、非零退出码、无法启动子进程
     */
    FAILED = 3
};

/**
 * @brief 执行失败的原因
 * 所有失败最终都会被归一化为 execution_outcome.success == false，
 * error_kind 只用于区分失败原因。
 */
enum class error_kind {
    NONE = 0,

    /**
     * @brief 调用方传入的请求不合法（比如代码为空）
     */
    INVALID_REQUEST,

    /**
     * @brief 代码在尝试修复后仍然无法解析
     */
    SYNTAX_ERROR,

    /**
     * @brief 代码导入了不在白名单中的模块、调用了禁止的内置函数或匹配了危险模式
     */
    SECURITY_VIOLATION,

    /**
     * @brief 子进程运行时间超过时钟时间限制，已被强制终止
     */
    TIMEOUT_EXCEEDED,

    /**
     * @brief 子进程峰值内存超过限制
     * 内存是在子进程退出后检查的，子进程不会因为内存超限被提前终止
     */
    MEMORY_LIMIT_EXCEEDED,

    /**
     * @brief stdout 与 stderr 的总字节数超过限制
     */
    OUTPUT_SIZE_EXCEEDED,

    /**
     * @brief 子进程以非零退出码退出或被信号终止
     */
    RUNTIME_ERROR,

    /**
     * @brief 无法创建临时文件、管道或者无法启动解释器
     */
    PROCESS_SPAWN_FAILURE,

    /**
     * @brief 请求的语言不是 Python
     */
    UNSUPPORTED_LANGUAGE,

    /**
     * @brief 执行被调用方取消
     */
    CANCELLED,

    /**
     * @brief 沙箱自身出错
     */
    INTERNAL_ERROR
};

const char *get_display_message(execution_status);

const char *get_display_message(error_kind);

/**
 * @brief 序列化时使用的小写名称，比如 "completed"
 */
std::string to_string(execution_status);

execution_status parse_execution_status(const std::string &name);

std::string to_string(error_kind);

error_kind parse_error_kind(const std::string &name);

}  // namespace sandbox

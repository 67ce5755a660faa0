#pragma once

#include <chrono>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "common/status.hpp"
#include "sandbox/capture.hpp"
#include "sandbox/language.hpp"

/**
 * 这个头文件包含一次代码执行的数据模型
 * 包含：
 * 1. execution_request 类（调用方的执行请求）
 * 2. execution_record 类（执行记录，会被写入历史记录）
 * 3. execution_outcome 类（返回给调用方的执行结果）
 */
namespace sandbox {

/**
 * @brief 执行请求，构造之后不再修改
 */
struct execution_request {
    std::string code;

    language lang = language::PYTHON;

    /**
     * @brief 时钟时间限制（秒），执行时会被截断到 [1, MAX_TIMEOUT]
     */
    int timeout_seconds = 30;

    /**
     * @brief 峰值内存限制（MB），执行时会被截断到 [16, MAX_MEMORY_LIMIT]
     */
    int memory_limit_mb = 512;

    std::string caller_id;

    /**
     * @brief 分析会话，用于查找数据集
     */
    std::optional<std::string> session_id;
};

typedef std::chrono::system_clock::time_point timestamp;

/**
 * @brief 格式化为 ISO 8601 格式的 UTC 时间，比如 2024-01-01T12:00:00.123Z
 */
std::string format_timestamp(const timestamp &time);

/**
 * @throw std::invalid_argument 格式不正确
 */
timestamp parse_timestamp(const std::string &text);

/**
 * @brief 一次代码执行的记录
 * 创建时为 PENDING，之后只会进入一次终止状态（COMPLETED 或 FAILED）。
 */
struct execution_record {
    /**
     * @brief uuid
     */
    std::string id;

    std::string caller_id;
    std::optional<std::string> session_id;
    language lang = language::PYTHON;
    std::string code;

    execution_status status = execution_status::PENDING;

    std::string output;

    /**
     * @brief 失败原因，执行成功时可能是 stderr 中的警告信息
     */
    std::string error_message;

    error_kind kind = error_kind::NONE;

    std::int64_t execution_time_ms = 0;
    std::int64_t cpu_time_ms = 0;
    double memory_peak_mb = 0;

    /**
     * @brief 实际使用的限制（截断之后）
     */
    int timeout_seconds = 0;
    int memory_limit_mb = 0;

    /**
     * @brief 保存的图片编号
     */
    std::vector<std::string> image_ids;

    timestamp created_at;
    std::optional<timestamp> finished_at;

    /**
     * @brief 为请求创建 PENDING 状态的记录
     */
    static execution_record create(const execution_request &request, int timeout_seconds, int memory_limit_mb);

    /**
     * @brief 状态转移
     * 只允许 PENDING -> RUNNING，PENDING -> FAILED，RUNNING -> COMPLETED，RUNNING -> FAILED。
     * 进入终止状态时记录 finished_at。
     * @throw internal_error 非法的状态转移
     */
    void transition_to(execution_status next);

    bool finished() const;
};

void to_json(nlohmann::json &j, const execution_record &record);

void from_json(const nlohmann::json &j, execution_record &record);

/**
 * @brief 返回给调用方的执行结果
 * 所有失败都以 success == false 返回，不会抛出异常。
 */
struct execution_outcome {
    bool success = false;
    execution_status status = execution_status::FAILED;

    /**
     * @brief 去掉图片标记后的 stdout，失败时也会保留已经产生的输出
     */
    std::string output;

    std::string error;
    error_kind kind = error_kind::NONE;

    std::int64_t execution_time_ms = 0;
    std::int64_t cpu_time_ms = 0;
    double memory_peak_mb = 0;

    std::vector<captured_image> images;

    /**
     * @brief 执行记录的编号
     */
    std::string execution_id;

    /**
     * @brief 图片保存后的编号，与 images 一一对应，保存失败的图片没有编号
     */
    std::vector<std::string> image_ids;

    /**
     * @brief 如果代码经过了语法修复，为实际执行的代码
     */
    std::optional<std::string> repaired_code;
};

void to_json(nlohmann::json &j, const execution_outcome &outcome);

}  // namespace sandbox

#pragma once

#include <optional>
#include <string>
#include <vector>
#include "sandbox/context.hpp"
#include "sandbox/history.hpp"
#include "sandbox/image_store.hpp"
#include "sandbox/process.hpp"
#include "sandbox/record.hpp"
#include "sandbox/validator.hpp"

namespace sandbox {

/**
 * @brief 批量执行中的一个代码块
 */
struct named_code_block {
    std::string name;
    std::string code;
};

void from_json(const nlohmann::json &j, named_code_block &block);

struct batch_entry {
    std::string name;
    execution_outcome outcome;
};

void to_json(nlohmann::json &j, const batch_entry &entry);

/**
 * @brief 代码执行的入口
 * 按顺序完成：校验 -> 组装完整脚本 -> 在子进程中执行 -> 提取图片 -> 更新执行记录。
 * 每个请求在调用方线程中同步执行，执行之间没有共享的可变状态，
 * 因此只要各个协作对象是线程安全的，就可以在多个线程中同时调用 execute。
 */
struct sandbox_executor {
    sandbox_executor(const code_validator &validator,
                     const context_builder &builder,
                     process_runner &runner,
                     history_sink &history,
                     image_store &images,
                     bool inline_images = false);

    /**
     * @brief 执行代码
     * 所有错误都以 success == false 的结果返回，不会抛出异常。
     * @param cancel 可选的取消信号，取消后子进程会被强制终止
     */
    execution_outcome execute(const execution_request &request, const cancellation *cancel = nullptr);

    /**
     * @brief 执行代码，language 为语言名称
     * 无法识别的语言返回 UNSUPPORTED_LANGUAGE。
     */
    execution_outcome execute(const std::string &code,
                              const std::string &language,
                              int timeout_seconds,
                              int memory_limit_mb,
                              const std::string &caller_id,
                              const std::optional<std::string> &session_id = std::nullopt);

    /**
     * @brief 依次执行多个代码块，每个代码块是独立的执行，互不影响
     * @param base 除 code 以外的请求参数
     */
    std::vector<batch_entry> execute_batch(const std::vector<named_code_block> &blocks, const execution_request &base);

    static int clamp_timeout(int timeout_seconds);

    static int clamp_memory_limit(int memory_limit_mb);

private:
    const code_validator &validator;
    const context_builder &builder;
    process_runner &runner;
    history_sink &history;
    image_store &images;
    bool inline_images;

    execution_outcome run(execution_record &record, const execution_request &request, const cancellation *cancel);

    execution_outcome reject(execution_record &record, error_kind kind, const std::string &error);

    /**
     * @brief 保存执行记录，失败时只记录日志
     */
    void save(const execution_record &record);
};

}  // namespace sandbox

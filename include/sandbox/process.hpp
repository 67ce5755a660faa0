#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>
#include "common/io_utils.hpp"
#include "common/status.hpp"

namespace sandbox {

/**
 * @brief 取消正在执行的子进程
 * 通过 eventfd 实现，执行子进程的线程会在等待子进程的同时监听这个 eventfd，
 * 因此可以在任意线程调用 cancel。
 */
struct cancellation {
    /**
     * @throw std::system_error 无法创建 eventfd
     */
    cancellation();

    void cancel();

    bool cancelled() const;

    int fd() const;

private:
    scoped_fd event;
};

/**
 * @brief 子进程执行结果
 */
struct run_result {
    /**
     * @brief COMPLETED 或者 FAILED
     */
    execution_status status = execution_status::FAILED;

    error_kind kind = error_kind::NONE;

    /**
     * @brief 失败原因，比如 "Execution timeout after 5 seconds"
     */
    std::string error;

    /**
     * @brief 子进程的退出码，被信号终止或者没有启动时为 -1
     */
    int exit_code = -1;

    /**
     * @brief 终止子进程的信号，正常退出时为 0
     */
    int signal = 0;

    /**
     * @brief 子进程的标准输出，已转换为合法的 UTF-8，超过输出限制的部分被丢弃
     */
    std::string stdout_text;

    std::string stderr_text;

    /**
     * @brief 子进程输出的总字节数（包括被丢弃的部分）
     */
    size_t output_bytes = 0;

    bool timed_out = false;
    bool cancelled = false;

    std::int64_t wall_time_ms = 0;
    std::int64_t cpu_time_ms = 0;

    /**
     * @brief 峰值常驻内存（MB），来自 wait4 的 ru_maxrss
     */
    double memory_peak_mb = 0;
};

void to_json(nlohmann::json &j, const run_result &result);

/**
 * @brief 执行完整的脚本
 */
struct process_runner {
    virtual ~process_runner();

    /**
     * @brief 在子进程中执行脚本，直到子进程退出、超时或者被取消
     * 不会抛出异常，启动失败也通过 run_result 返回。
     * @param script 完整的脚本
     * @param timeout_seconds 时钟时间限制
     * @param memory_limit_mb 峰值内存限制，子进程退出后检查
     * @param cancel 可选的取消信号
     */
    virtual run_result run(const std::string &script, int timeout_seconds, int memory_limit_mb, const cancellation *cancel = nullptr) = 0;
};

struct process_options {
    /**
     * @brief Python 解释器，不是绝对路径时在 PATH 中查找
     */
    std::filesystem::path python;

    /**
     * @brief 存放临时脚本的目录，也是子进程的工作目录
     */
    std::filesystem::path temp_dir;

    /**
     * @brief stdout 与 stderr 的总字节数上限
     */
    size_t max_output_size;

    /**
     * @brief 发送 SIGTERM 后等待多久再发送 SIGKILL
     */
    std::chrono::milliseconds kill_delay{100};

    /**
     * @brief 子进程被杀死后继续读取管道中剩余输出的最长时间
     */
    std::chrono::milliseconds drain_timeout{500};

    /**
     * @brief 子进程能创建的最大文件大小（字节）
     */
    std::uint64_t file_size_limit = 64ull << 20;

    /**
     * @brief 使用 config.hpp 中的全局配置
     */
    static process_options from_config();
};

/**
 * @brief 在独立的子进程中执行 Python 脚本
 * 1. 脚本写入临时目录下以 uuid 命名的文件，执行结束后删除；
 * 2. 子进程通过 setsid 创建新的进程组，stdin 为 /dev/null，stdout 和 stderr 通过管道读取；
 * 3. 子进程只继承最小的环境变量，并设置 CPU 时间、core dump 和文件大小的 rlimit；
 * 4. 父进程通过 poll 同时等待管道、子进程退出（pidfd）、取消信号以及超时；
 * 5. 超时或取消时先向进程组发送 SIGTERM，等待 kill_delay 后发送 SIGKILL。
 */
struct process_sandbox : public process_runner {
    explicit process_sandbox(process_options options);

    run_result run(const std::string &script, int timeout_seconds, int memory_limit_mb, const cancellation *cancel = nullptr) override;

private:
    process_options options;

    run_result execute(const std::string &script, int timeout_seconds, int memory_limit_mb, const cancellation *cancel);
};

}  // namespace sandbox

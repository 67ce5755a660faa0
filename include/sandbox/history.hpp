#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include "sandbox/record.hpp"

namespace sandbox {

/**
 * @brief 保存执行记录，用于审计和查询历史
 * 执行记录在创建时和进入终止状态时各保存一次，后一次覆盖前一次。
 */
struct history_sink {
    virtual ~history_sink();

    /**
     * @brief 保存执行记录
     * @throw std::exception 保存失败，调用方只记录日志，不影响执行结果
     */
    virtual void record(const execution_record &record) = 0;
};

/**
 * @brief 以 JSON Lines 格式追加写入文件的执行记录
 * 每次保存都追加一行，读取时同一个 id 以最后一行为准。
 * 写入时对文件加 flock 锁，因此多个进程可以共享同一个历史文件。
 */
struct jsonl_history_sink : public history_sink {
    explicit jsonl_history_sink(const std::filesystem::path &path);

    void record(const execution_record &record) override;

    /**
     * @brief 查询调用方最近的执行记录
     * @param caller_id 调用方，为空时返回所有调用方的记录
     * @param limit 最多返回多少条记录
     * @return 按创建时间从新到旧排列的记录
     */
    std::vector<execution_record> recent(const std::string &caller_id, size_t limit) const;

private:
    std::filesystem::path path;
    std::filesystem::path lock_path;
};

}  // namespace sandbox

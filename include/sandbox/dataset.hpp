#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace sandbox {

/**
 * @brief 一个会话关联的表格数据集
 */
struct tabular_dataset {
    /**
     * @brief 数据集文件的绝对路径，子进程直接读取这个文件
     */
    std::filesystem::path path;

    /**
     * @brief 文件格式：csv, parquet, json, xlsx
     */
    std::string format;
};

/**
 * @brief 根据会话查找数据集
 */
struct dataset_loader {
    virtual ~dataset_loader();

    /**
     * @return 会话关联的数据集，会话没有数据集时返回 nullopt
     */
    virtual std::optional<tabular_dataset> load(const std::string &session_id) const = 0;
};

/**
 * @brief 在目录中按 <session_id>.<format> 查找数据集
 * 依次查找 csv, parquet, json, xlsx
 */
struct directory_dataset_loader : public dataset_loader {
    explicit directory_dataset_loader(const std::filesystem::path &dir);

    std::optional<tabular_dataset> load(const std::string &session_id) const override;

private:
    std::filesystem::path dir;
};

}  // namespace sandbox

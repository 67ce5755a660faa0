#pragma once

#include <optional>
#include <string>
#include "sandbox/dataset.hpp"

namespace sandbox {

/**
 * @brief 组装最终在子进程中执行的完整脚本
 * 完整脚本由三部分组成：
 * 1. 前置代码：选择 Agg 后端，替换 plt.show / plt.savefig / Figure.savefig，
 *    使每张图片都以 base64 的形式输出到 stdout 的单独一行；
 * 2. 数据集代码：如果会话有数据集，加载到变量 df 中；
 * 3. 用户代码：直接读取文件的调用被替换为占位表达式。
 * 组装过程只是字符串变换。
 */
struct context_builder {
    explicit context_builder(const dataset_loader &loader);

    /**
     * @param code 已经通过检查的用户代码
     * @param session_id 会话，为 nullopt 时不加载数据集
     */
    std::string build(const std::string &code, const std::optional<std::string> &session_id) const;

    static std::string preamble();

    /**
     * @brief 加载数据集到 df 并打印数据集大小的代码，加载失败时只在 stderr 输出警告
     */
    static std::string dataset_code(const tabular_dataset &dataset);

    /**
     * @brief 将 pd.read_csv(...)、np.loadtxt(...) 这类直接读取文件的调用替换为占位表达式
     * 原语句保留为注释。有数据集时调用替换为 df，否则替换为 None，同一行的其他语句保持不变；
     * with 和 for 语句替换为 if False: 以保持代码块结构。字符串和注释中的内容不会被替换。
     * @param has_dataset 是否注入了数据集变量 df
     */
    static std::string rewrite_file_reads(const std::string &code, bool has_dataset);

private:
    const dataset_loader &loader;
};

}  // namespace sandbox

#pragma once

#include <cstddef>
#include <filesystem>

namespace sandbox {

/**
 * @brief 执行用户代码使用的 Python 解释器
 * 可以是绝对路径，也可以是在 PATH 中查找的命令名
 * @defaultValue python3
 */
extern std::filesystem::path PYTHON_EXECUTABLE;

/**
 * @brief 存放待执行脚本的临时目录
 * 每次执行都会在这里创建一个 uuid 命名的脚本文件，执行结束后删除，
 * 子进程的工作目录也是这个目录。
 *
 * TEMP_DIR
 * ├── sandbox_1b4e28ba-2fa1-11d2-883f-0016d3cca427.py // 正在执行的脚本
 * └── ...
 */
extern std::filesystem::path TEMP_DIR;

/**
 * @brief 数据集文件所在的目录
 *
 * DATASET_DIR
 * ├── [session_id].csv
 * ├── [session_id].parquet
 * ├── [session_id].json
 * └── [session_id].xlsx
 */
extern std::filesystem::path DATASET_DIR;

/**
 * @brief 保存子进程生成图片的目录
 */
extern std::filesystem::path IMAGE_DIR;

/**
 * @brief 执行记录的 JSON Lines 文件，每一行是一次状态变化后的执行记录
 */
extern std::filesystem::path HISTORY_FILE;

/**
 * @brief 单次执行允许的最长时钟时间（秒），请求中的 timeout 会被截断到 [1, MAX_TIMEOUT]
 */
extern int MAX_TIMEOUT;

/**
 * @brief 单次执行允许的最大内存（MB），请求中的内存限制会被截断到 [16, MAX_MEMORY_LIMIT]
 */
extern int MAX_MEMORY_LIMIT;

/**
 * @brief stdout 与 stderr 的总字节数上限
 * @defaultValue 16 MiB
 */
extern size_t MAX_OUTPUT_SIZE;

/**
 * @brief 是否将图片标记替换为 markdown 图片引用，而不是直接删除
 */
extern bool INLINE_IMAGES;

/**
 * @brief 是否开启 DEBUG 模式
 * 如果开启 DEBUG 模式，将会打印组装完成的完整脚本，便于检查注入的前置代码。
 */
extern bool DEBUG;

}  // namespace sandbox

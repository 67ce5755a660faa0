#pragma once

#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/lexical_cast.hpp>
#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace fmt {
template <>
struct formatter<std::filesystem::path> {
    template <typename ParseContext>
    constexpr auto parse(ParseContext &ctx) { return ctx.begin(); }

    template <typename FormatContext>
    auto format(const std::filesystem::path &p, FormatContext &ctx) const {
        return format_to(ctx.out(), "{}", p.string());
    }
};
}  // namespace fmt

template <typename T>
struct to_string_cont {
    template <typename ContainerT>
    static void to_string(ContainerT &cont, const T &element) {
        cont.push_back(boost::lexical_cast<std::string>(element));
    }
};

template <>
struct to_string_cont<std::filesystem::path> {
    template <typename ContainerT>
    static void to_string(ContainerT &cont, const std::filesystem::path &element) {
        cont.push_back(element.string());
    }
};

/**
 * @brief 将参数 args 的内容通过 to_string 转换为字符串并装入容器中
 * @param cont 字符串容器
 * @param args 按顺序 to_string 转换为字符串并装入容器
 */
template <typename ContainerT, typename Head, typename... Args>
void to_string_list(ContainerT &cont, Head &head, Args &... args) {
    to_string_cont<std::decay_t<Head>>::to_string(cont, head);
    if constexpr (sizeof...(args) > 0)
        to_string_list(cont, args...);
}

/**
 * @brief 执行外部命令，子进程的标准输出和标准错误被丢弃
 * @param argv 外部命令的路径 (argv[0]) 和 参数 (argv)，以 nullptr 结尾
 * @return 外部命令的返回值，如果外部命令因为信号崩溃而没有返回码，则返回 -1
 */
int exec_program(const char **argv);

/**
 * @brief 调用外部程序
 * @note 与 exec_program(argv) 的区别是，这个函数是类型安全的，而且会自动执行类型转换
 * @note 与 system(cmd) 的区别是，这个函数避免了转义导致的安全问题
 * @code{.cpp}
 *     std::filesystem::path python("/usr/bin/python3");
 *     // 检查解释器能否导入 matplotlib
 *     int exitcode = call_process(python, "-c", "import matplotlib");
 * @endcode
 */
template <typename... Args>
int call_process(Args &&... args) {
    std::vector<std::string> list;
    to_string_list(list, args...);
    std::vector<const char *> argv;
    for (auto &arg : list)
        argv.push_back(arg.c_str());
    argv.push_back(nullptr);

#ifndef NDEBUG
    std::string command;
    for (auto &arg : list)
        command += arg + ' ';
    LOG(INFO) << command;
#endif

    return exec_program(argv.data());
}

/**
 * @brief 根据 key 来查找环境变量
 * @param key 环境变量的键
 * @param def_value 如果键不存在，返回该参数
 * @return 环境变量的值，或者不存在时返回 def_value
 */
std::string get_env(const std::string &key, const std::string &def_value);

/**
 * @brief 设置环境变量
 * @param key 环境变量的键
 * @param value 环境变量的值
 * @param replace 若为真，则覆盖已有的环境变量值
 */
void set_env(const std::string &key, const std::string &value, bool replace = true);

/**
 * @brief 在 PATH 中查找可执行文件
 * @param name 可执行文件名，如果包含 '/' 则直接检查该路径
 * @return 可执行文件的绝对路径，找不到时返回 nullopt
 */
std::optional<std::filesystem::path> find_executable(const std::string &name);

struct elapsed_time {

    elapsed_time();

    template <typename DurationT>
    DurationT duration() const {
        return std::chrono::duration_cast<DurationT>(std::chrono::steady_clock::now() - start);
    }

private:
    std::chrono::steady_clock::time_point start;
};

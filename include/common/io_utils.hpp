#pragma once

#include <filesystem>
#include <string>

namespace sandbox {

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @return 文本文件的内容(没有指定编码)
 */
std::string read_file_content(const std::filesystem::path &path);

/**
 * @brief 以二进制方式写入文件，文件已存在时覆盖
 * @throw std::system_error 无法打开或写入文件
 */
void write_file_content(const std::filesystem::path &path, const std::string &content);

/**
 * @brief 将字节流按 UTF-8 解码，非法的字节替换为 U+FFFD
 * 子进程的输出可能被截断在多字节字符的中间，或者包含二进制数据，
 * 这里保证返回值一定是合法的 UTF-8 字符串。
 */
std::string utf8_sanitize(const std::string &bytes);

/**
 * @brief 断言 subpath 一定不会出现返回上一层目录的情况
 * 这里用于确保计算目录时不会出现目录遍历攻击，比如调用方传入的
 * session id 会被直接拼接成数据集的文件路径。
 * @param subpath 被检查的文件名
 */
std::string assert_safe_path(const std::string &subpath);

/**
 * @brief 持有一个文件描述符，析构时关闭
 */
struct scoped_fd {
    scoped_fd();
    explicit scoped_fd(int fd);
    scoped_fd(scoped_fd &&);
    scoped_fd(const scoped_fd &) = delete;
    ~scoped_fd();

    scoped_fd &operator=(scoped_fd &&);
    scoped_fd &operator=(const scoped_fd &) = delete;

    int get() const;

    bool valid() const;

    /**
     * @brief 放弃所有权，返回文件描述符，不关闭
     */
    int release();

    void reset(int new_fd = -1);

private:
    int fd;
};

/**
 * @brief 通过 flock 对文件加锁，析构时解锁
 * 锁文件不存在时会被创建，锁只在进程之间生效
 */
struct scoped_file_lock {
    /**
     * @param shared 为真时加共享锁（读），否则加排他锁（写）
     * @throw std::system_error 无法打开锁文件或加锁失败
     */
    scoped_file_lock(const std::filesystem::path &path, bool shared);
    scoped_file_lock(const scoped_file_lock &) = delete;
    ~scoped_file_lock();

    scoped_file_lock &operator=(const scoped_file_lock &) = delete;

private:
    scoped_fd fd;
};

/**
 * @brief 在指定目录下独占地创建一个临时文件，离开作用域时删除
 * 文件名由 uuid 生成，并以 O_CREAT | O_EXCL 创建，
 * 因此并发执行的多个请求不会共享同一个文件。
 */
struct scoped_temp_file {
    /**
     * @param dir 临时文件所在的目录，不存在时会被创建
     * @param suffix 文件名后缀，比如 ".py"
     * @throw std::system_error 无法创建文件
     */
    scoped_temp_file(const std::filesystem::path &dir, const std::string &suffix);
    scoped_temp_file(const scoped_temp_file &) = delete;
    ~scoped_temp_file();

    scoped_temp_file &operator=(const scoped_temp_file &) = delete;

    const std::filesystem::path &path() const;

    /**
     * @brief 写入全部内容并关闭文件，之后子进程才能读取
     * @throw std::system_error 写入失败
     */
    void write(const std::string &content);

private:
    std::filesystem::path file_path;
    scoped_fd fd;
};

}  // namespace sandbox

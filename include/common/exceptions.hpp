#pragma once

#include <boost/lexical_cast.hpp>
#include <boost/stacktrace.hpp>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace sandbox {

struct sandbox_exception : std::exception {
    sandbox_exception();
    explicit sandbox_exception(const std::string &message);

    friend std::ostream &operator<<(std::ostream &os, const sandbox_exception &ex);

    template <typename T>
    sandbox_exception operator<<(const T &t) const {
        return sandbox_exception(message + boost::lexical_cast<std::string>(t));
    }

    const char *what() const noexcept override;

private:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief 表示沙箱的内部错误
 * 比如执行记录出现了非法的状态转移
 */
struct internal_error : public sandbox_exception {
    internal_error();
    explicit internal_error(const std::string &message);
};

/**
 * @brief 表示代码没有通过安全检查
 * 只在 code_validator 内部抛出，validate 会将其转换为 validation_result
 */
struct security_violation : public sandbox_exception {
    explicit security_violation(const std::string &message);
};

/**
 * @brief 表示请求的语言无法识别
 */
struct invalid_language : public sandbox_exception {
    explicit invalid_language(const std::string &language);
};

}  // namespace sandbox

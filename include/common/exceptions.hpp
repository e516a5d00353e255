#pragma once

#include <ostream>
#include <boost/stacktrace.hpp>
#include <memory>
#include <string>
#include <stdexcept>

namespace codejudge {

struct judge_exception : std::exception {
    judge_exception();
    explicit judge_exception(const std::string &message);

    friend std::ostream &operator<<(std::ostream &os, const judge_exception &ex);

    const char *what() const noexcept override;

private:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief 表示评测系统的内部错误
 * 一般是管道、进程等系统资源出现问题
 */
struct internal_error : public judge_exception {
    internal_error();
    explicit internal_error(const std::string &message);
};

/**
 * @brief 表示评测环境不可用，通常是找不到编译器
 * 与具体的提交无关，需要运维人员处理
 */
struct environment_error : public judge_exception {
    environment_error();
    explicit environment_error(const std::string &message);
};

/**
 * @brief 表示提交的语言不被支持
 * 此时不会进行任何编译或运行
 */
struct unsupported_language_error : public judge_exception {
    explicit unsupported_language_error(const std::string &language);

    const std::string language;
};

}  // namespace codejudge

#pragma once

#include <boost/stacktrace.hpp>
#include <memory>
#include <ostream>
#include <string>
#include <stdexcept>

namespace grader {

/**
 * @brief 评测系统异常的基类
 * 构造时记录调用栈，便于在 orchestrator 边界处打印完整的错误信息。
 */
struct grader_exception : std::exception {
    explicit grader_exception(const std::string &message);

    friend std::ostream &operator<<(std::ostream &os, const grader_exception &ex);

    const char *what() const noexcept override;

private:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief 表示评测系统的内部错误
 * 一般是编译器或解释器不存在、磁盘错误、配置错误，而不是选手程序的问题。
 * 会在 orchestrator 边界处被转换为 IE。
 */
struct internal_error : public grader_exception {
    explicit internal_error(const std::string &message);
};

/**
 * @brief 打印异常的详细信息，如果是 grader_exception 还会打印调用栈
 */
std::string describe_exception(const std::exception &ex);

}  // namespace grader

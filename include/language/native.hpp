#pragma once

#include "language/adapter.hpp"

namespace grader {

/**
 * @brief 使用 gcc 工具链编译为本地可执行文件的语言
 * 编译产物固定为工作目录下的 app。
 */
class native_adapter : public language_adapter {
public:
    bool validate_solution(const std::filesystem::path &workdir) const override;

protected:
    native_adapter(const std::string &compiler, const std::vector<std::string> &flags);

    std::vector<std::string> compile_command() const override;
    std::vector<std::string> run_command(const resource_limits &limits) const override;

    /**
     * @brief 放在源文件之前的编译参数
     */
    std::vector<std::string> flags;

    /**
     * @brief 放在源文件之后的链接参数
     */
    std::vector<std::string> link_flags;
};

class cpp_adapter : public native_adapter {
public:
    cpp_adapter();

    std::string name() const override;
    std::string entry_file() const override;
    std::string template_content() const override;
};

class c_adapter : public native_adapter {
public:
    c_adapter();

    std::string name() const override;
    std::string entry_file() const override;
    std::string template_content() const override;
};

}  // namespace grader

#pragma once

#include "language/adapter.hpp"

namespace grader {

/**
 * @brief Python 3 适配器
 * 编译步骤只做语法检查（py_compile），不生成字节码文件。
 */
class python_adapter : public language_adapter {
public:
    python_adapter();

    std::string name() const override;
    std::string entry_file() const override;
    std::string template_content() const override;
    bool validate_solution(const std::filesystem::path &workdir) const override;

protected:
    std::vector<std::string> compile_command() const override;
    std::vector<std::string> run_command(const resource_limits &limits) const override;
    std::map<std::string, std::string> environment(const std::filesystem::path &workdir) const override;
};

}  // namespace grader

#pragma once

#include "common/utils.hpp"
#include "gmock/gmock.h"
#include "language/adapter.hpp"

namespace grader::test {

/**
 * @brief 用 /bin/sh 运行选手代码的适配器，使 orchestrator 的测试不依赖任何编译器
 * 编译步骤是 sh -n 语法检查
 */
class shell_adapter : public language_adapter {
public:
    shell_adapter()
        : language_adapter(resource_limits(2000, 2000, 256, 64, 10, 64, 4096), "sh", "sh") {}

    std::string name() const override { return "shell"; }
    std::string entry_file() const override { return "main.sh"; }
    std::string template_content() const override { return "#!/bin/sh\n"; }

    bool validate_solution(const std::filesystem::path &workdir) const override {
        return !is_blank(read_entry(workdir));
    }

protected:
    std::vector<std::string> compile_command() const override {
        return make_command(compiler, "-n", entry_file());
    }

    std::vector<std::string> run_command(const resource_limits &) const override {
        return make_command(executable, entry_file());
    }
};

/**
 * @brief 用于构造内部错误的适配器
 */
class mock_adapter : public language_adapter {
public:
    mock_adapter()
        : language_adapter(resource_limits(), "mock", "mock") {}

    MOCK_METHOD(std::string, name, (), (const, override));
    MOCK_METHOD(std::string, entry_file, (), (const, override));
    MOCK_METHOD(compile_result, compile, (const std::filesystem::path &), (const, override));
    MOCK_METHOD(run_result, run, (const std::filesystem::path &, const std::filesystem::path &, const std::filesystem::path &, const resource_limits &), (const, override));
    MOCK_METHOD(std::string, template_content, (), (const, override));
    MOCK_METHOD(bool, validate_solution, (const std::filesystem::path &), (const, override));

protected:
    std::vector<std::string> compile_command() const override { return {}; }
    std::vector<std::string> run_command(const resource_limits &) const override { return {}; }
};

}  // namespace grader::test

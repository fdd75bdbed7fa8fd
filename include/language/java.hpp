#pragma once

#include "language/adapter.hpp"

namespace grader {

/**
 * @brief Java 适配器
 * 选手代码必须是 Main.java 中的 public class Main。
 * 堆和栈大小通过 -Xmx 和 -Xss 传给 JVM。
 */
class java_adapter : public language_adapter {
public:
    java_adapter();

    std::string name() const override;
    std::string entry_file() const override;
    std::string template_content() const override;
    bool validate_solution(const std::filesystem::path &workdir) const override;

protected:
    std::vector<std::string> compile_command() const override;
    std::vector<std::string> run_command(const resource_limits &limits) const override;
    int64_t address_space_reserve_mb() const override;
};

}  // namespace grader

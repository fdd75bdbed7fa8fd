#pragma once

#include "language/adapter.hpp"

namespace grader {

/**
 * @brief Node.js 适配器
 * V8 需要预留大量虚拟地址空间，因此内存限制通过 --max-old-space-size 传给 V8，
 * 地址空间限制额外放宽 RUNTIME_RESERVE_MB。
 */
class javascript_adapter : public language_adapter {
public:
    javascript_adapter();

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

#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "sandbox/resource_limits.hpp"

namespace grader {

/**
 * @brief 表示一个测试点
 * 测试点由上游的测试数据生成器提供，交给 orchestrator 之后不再修改。
 */
struct test_case {
    /**
     * @brief 测试点 id，在一个提交内唯一
     */
    std::string id;

    /**
     * @brief 喂给选手程序标准输入的数据
     */
    std::string input;

    /**
     * @brief 标准输出
     */
    std::string expected_output;

    /**
     * @brief 本测试点的时间限制，同时覆盖时钟时间和 CPU 时间限制
     */
    std::optional<int64_t> time_limit_ms;

    /**
     * @brief 本测试点的内存限制
     */
    std::optional<int64_t> memory_limit_mb;

    /**
     * @brief 比较类型：auto、exact、text、numeric、json、array
     */
    std::string comparison_type = "auto";

    /**
     * @brief 比较器的选项
     */
    nlohmann::json comparison_config = nlohmann::json::object();

    /**
     * @brief 本测试点对资源限制的覆盖
     */
    resource_limit_overrides overrides() const;
};

/**
 * @brief 一个选手提交
 */
struct submission {
    /**
     * @brief 语言 id，如 python、cpp、java
     */
    std::string language;

    /**
     * @brief 选手代码，会被写入适配器要求的入口文件
     */
    std::string source;

    /**
     * @brief 题目级别对语言默认资源限制的覆盖，测试点级别的限制优先
     */
    resource_limit_overrides limits;

    /**
     * @brief 编译成功时是否也在报告中附带编译日志
     */
    bool verbose = false;

    std::vector<test_case> test_cases;
};

void from_json(const nlohmann::json &j, test_case &test);

/**
 * @throw std::invalid_argument 缺少必须的字段、字段类型错误或者测试点 id 重复
 */
void from_json(const nlohmann::json &j, submission &submit);

}  // namespace grader

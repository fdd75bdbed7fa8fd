#pragma once

#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "common/status.hpp"
#include "language/adapter.hpp"

namespace grader {

/**
 * @brief 一个测试点的评测结果，是评测报告中的一行
 */
struct test_case_result {
    std::string id;

    /**
     * @brief 测试点的结果，TIMEOUT 在这里不会归入 TLE
     */
    grader::status status = grader::status::INTERNAL_ERROR;

    double time_ms = 0;
    double memory_mb = 0;

    std::string input;
    std::string expected;

    /**
     * @brief 选手程序的标准输出
     */
    std::string actual;

    /**
     * @brief 错误信息：截断后的标准错误输出、比较器的信息或者内部错误的描述
     */
    std::string error;

    std::optional<std::string> diff;

    double similarity = 0;

    /**
     * @brief 使用的比较器名称，没有进行比较时为空
     */
    std::string comparator;

    int exit_code = -1;
    int signal = 0;
};

/**
 * @brief 运行时间和内存的统计，只统计正的样本
 */
struct performance_summary {
    double total_time_ms = 0;
    double average_time_ms = 0;
    double median_time_ms = 0;
    double max_time_ms = 0;
    double min_time_ms = 0;
    double total_memory_mb = 0;
    double average_memory_mb = 0;
    double peak_memory_mb = 0;
};

/**
 * @brief 正确性统计
 */
struct quality_summary {
    size_t passed = 0;

    /**
     * @brief 答案错误的测试点数
     */
    size_t failed = 0;

    size_t total = 0;
    double pass_rate = 0;
    double average_similarity = 0;

    /**
     * @brief 0.8 * 通过率 + 0.2 * 平均相似度
     */
    double correctness_score = 0;

    /**
     * @brief 每种非 OK 结果的测试点数，键为结果的缩写
     */
    std::map<std::string, size_t> error_counts;
};

/**
 * @brief 一个提交的评测报告
 */
struct judge_report {
    /**
     * @brief 整个提交的结果，是第一个不为 OK 的测试点的结果
     */
    grader::status verdict = grader::status::INTERNAL_ERROR;

    std::string message;

    size_t passed = 0;
    size_t total = 0;

    double total_time_ms = 0;
    double average_time_ms = 0;

    /**
     * @brief 编译日志，只在编译失败或者要求详细输出时存在
     */
    std::optional<compile_result> compile;

    /**
     * @brief 每个测试点的结果，顺序与提交中测试点的顺序一致
     */
    std::vector<test_case_result> results;

    /**
     * @brief 根据 results 计算 verdict、passed、total、时间和 message
     * 编译错误的报告不需要调用
     */
    void summarize();

    performance_summary performance() const;
    quality_summary quality() const;
};

void to_json(nlohmann::json &j, const compile_result &result);
void to_json(nlohmann::json &j, const test_case_result &result);
void to_json(nlohmann::json &j, const performance_summary &summary);
void to_json(nlohmann::json &j, const quality_summary &summary);
void to_json(nlohmann::json &j, const judge_report &report);

}  // namespace grader

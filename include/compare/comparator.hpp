#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace grader {

/**
 * @brief 比较的结论
 * ERROR 表示输出无法解析（如不是合法的 JSON），与 MISMATCH 区分开
 */
enum class comparison_verdict {
    MATCH,
    MISMATCH,
    ERROR
};

std::string to_string(comparison_verdict verdict);

/**
 * @brief 一次比较的详细结果
 */
struct comparison_details {
    comparison_verdict verdict = comparison_verdict::ERROR;

    std::string message;

    /**
     * @brief 给选手看的差异描述，匹配时为空
     */
    std::optional<std::string> diff;

    /**
     * @brief 解析后的标准输出，只有数值和 JSON 比较器会填写
     */
    nlohmann::json expected_parsed;

    /**
     * @brief 解析后的选手输出，只有数值和 JSON 比较器会填写
     */
    nlohmann::json actual_parsed;

    /**
     * @brief 相似度，取值范围为 [0, 1]，匹配时恰好为 1
     * 只用于部分分的统计，不影响测试点是否通过
     */
    double similarity = 0;

    bool matched() const { return verdict == comparison_verdict::MATCH; }
};

/**
 * @brief 输出比较器
 * compare 不会抛出异常，无法解析的输出通过 comparison_verdict::ERROR 报告。
 * 比较器构造完成之后是只读的，可以在多个线程中同时使用。
 */
class output_comparator {
public:
    virtual ~output_comparator() = default;

    /**
     * @brief 比较标准输出和选手输出
     * @param expected 标准输出
     * @param actual 选手程序的输出
     */
    virtual comparison_details compare(const std::string &expected, const std::string &actual) const = 0;

    /**
     * @brief 比较器的名称，会出现在评测报告中
     */
    virtual std::string name() const = 0;
};

}  // namespace grader

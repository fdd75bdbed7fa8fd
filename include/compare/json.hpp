#pragma once

#include <vector>
#include "compare/comparator.hpp"

namespace grader {

/**
 * @brief 选手输出的 JSON 文档允许的最大嵌套层数
 * 比较、复制和序列化 JSON 都是递归的，过深的文档会耗尽评测线程的栈。
 */
constexpr int MAX_JSON_DEPTH = 256;

/**
 * @brief 解析 JSON 文档，在嵌套层数超过 MAX_JSON_DEPTH 时立即停止
 * @throw nlohmann::json::parse_error 不是合法的 JSON
 * @throw std::length_error 嵌套层数超过 MAX_JSON_DEPTH
 */
nlohmann::json parse_bounded_json(const std::string &text);

/**
 * @brief 比较两个 JSON 文档的结构
 * 对象的键必须完全相同（可选允许选手输出多余的键），
 * 数组按位置比较，或者在忽略顺序时排序后逐对比较，数值在误差范围内相等。
 * 整数和浮点数视为同一种类型。嵌套过深的文档视为无法解析。
 */
class json_comparator : public output_comparator {
public:
    explicit json_comparator(bool ignore_order = true,
                             bool ignore_extra_fields = false,
                             double numeric_tolerance = 1e-9);

    comparison_details compare(const std::string &expected, const std::string &actual) const override;
    std::string name() const override;

private:
    bool ignore_order;
    bool ignore_extra_fields;
    double numeric_tolerance;

    void compare_recursive(const nlohmann::json &expected, const nlohmann::json &actual,
                           const std::string &path, std::vector<std::string> &differences) const;
    void compare_objects(const nlohmann::json &expected, const nlohmann::json &actual,
                         const std::string &path, std::vector<std::string> &differences) const;
    void compare_arrays(const nlohmann::json &expected, const nlohmann::json &actual,
                        const std::string &path, std::vector<std::string> &differences) const;
};

}  // namespace grader

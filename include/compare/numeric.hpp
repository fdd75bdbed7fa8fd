#pragma once

#include <vector>
#include "compare/comparator.hpp"

namespace grader {

/**
 * @brief 按顺序提取两边所有的数，逐对在误差范围内比较
 * 一对数在绝对误差不超过 epsilon 或者相对误差不超过 relative_tolerance 时相等。
 * nan 与 nan 相等，无穷大需要符号相同。
 */
class numeric_comparator : public output_comparator {
public:
    explicit numeric_comparator(double epsilon = 1e-9,
                                double relative_tolerance = 1e-6,
                                bool allow_scientific_notation = true);

    comparison_details compare(const std::string &expected, const std::string &actual) const override;
    std::string name() const override;

    /**
     * @brief 提取文本中所有的数，包括 nan、inf、infinity
     */
    std::vector<double> extract_numbers(const std::string &text) const;

    /**
     * @brief 判断两个数是否在误差范围内相等
     */
    bool numbers_equal(double a, double b) const;

private:
    double epsilon;
    double relative_tolerance;
    bool allow_scientific_notation;
};

/**
 * @brief 判断一个单词是否是一个数，如 -1.5e3、nan、+inf
 */
bool is_numeric_token(const std::string &token);

}  // namespace grader

#pragma once

#include <optional>
#include <regex>
#include <vector>
#include "compare/comparator.hpp"

namespace grader {

/**
 * @brief 默认的分隔符：逗号和空白
 */
constexpr const char *DEFAULT_ARRAY_SEPARATOR = R"([,\s]+)";

/**
 * @brief 将输出视为一个列表逐元素比较
 * 解析时去掉一对匹配的方括号或圆括号，按分隔符切分，去掉元素两端的空白和引号。
 * 默认分隔符不经过 std::regex 切分，std::regex 匹配长分隔符串时的递归深度与串长成正比。
 */
class array_comparator : public output_comparator {
public:
    /**
     * @throw std::regex_error separator_pattern 不是合法的正则表达式
     */
    explicit array_comparator(bool ignore_order = false,
                              bool ignore_brackets = true,
                              const std::string &separator_pattern = DEFAULT_ARRAY_SEPARATOR);

    comparison_details compare(const std::string &expected, const std::string &actual) const override;
    std::string name() const override;

    std::vector<std::string> parse_array(const std::string &text) const;

private:
    bool ignore_order;
    bool ignore_brackets;
    /**
     * @brief 自定义的分隔符，使用默认分隔符时为空
     */
    std::optional<std::regex> separator;
};

/**
 * @brief 文本是否被一对匹配的方括号或圆括号包围
 */
bool is_bracketed(const std::string &text);

}  // namespace grader

#pragma once

#include "compare/comparator.hpp"

namespace grader {

/**
 * @brief 逐字符比较文本
 * 比较之前可以忽略大小写、去掉末尾空白、将连续的空白字符合并为一个空格。
 * 不匹配时给出逐行的差异，较短的行还会给出逐字符的差异。
 */
class text_comparator : public output_comparator {
public:
    explicit text_comparator(bool normalize_whitespace = true,
                             bool ignore_trailing_whitespace = true,
                             bool case_sensitive = true);

    comparison_details compare(const std::string &expected, const std::string &actual) const override;
    std::string name() const override;

    /**
     * @brief 按照选项预处理文本
     */
    std::string normalize(const std::string &text) const;

private:
    bool normalize_whitespace;
    bool ignore_trailing_whitespace;
    bool case_sensitive;
};

/**
 * @brief 计算两个字符串的编辑距离
 * 字符串过长时退化为根据公共前后缀估算，避免比较被卡死
 */
size_t edit_distance(const std::string &s1, const std::string &s2);

/**
 * @brief 根据编辑距离计算两个字符串之间的相似度(0~1)
 */
double text_similarity(const std::string &s1, const std::string &s2);

/**
 * @brief 生成逐字符的差异，如 ab[c→d][+e]
 */
std::string character_diff(const std::string &expected, const std::string &actual);

}  // namespace grader

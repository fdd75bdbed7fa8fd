#pragma once

#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include "compare/comparator.hpp"

namespace grader {

/**
 * @brief 根据比较类型和选项创建比较器
 * @param type exact、text、numeric、json、array 之一，不区分大小写
 * @param config 比较器的选项，如 {"epsilon": 1e-6}
 * @throw std::invalid_argument 未知的比较类型、未知的选项或者选项类型错误
 */
std::unique_ptr<output_comparator> create_comparator(const std::string &type, const nlohmann::json &config = nlohmann::json::object());

/**
 * @brief 根据标准输出和选手输出自动选择比较器，两边都满足条件时才选择：
 * 1. 被括号包围且是只包含基本类型的列表（或者无法解析为 JSON）-> Array
 * 2. 都是合法的 JSON -> JSON
 * 3. 每个单词都是数 -> Numeric
 * 4. 其他情况 -> TextExact
 */
std::unique_ptr<output_comparator> detect_comparator(const std::string &expected, const std::string &actual);

/**
 * @brief 比较类型为空或者为 auto 时表示自动选择
 */
bool is_auto_comparison(const std::string &type);

/**
 * @brief 为一个测试点选择比较器，自动选择时不接受选项
 * @throw std::invalid_argument 比较类型或者选项不合法
 */
std::unique_ptr<output_comparator> select_comparator(const std::string &type, const nlohmann::json &config,
                                                     const std::string &expected, const std::string &actual);

}  // namespace grader

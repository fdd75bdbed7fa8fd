#pragma once

#include <boost/lexical_cast.hpp>
#include <initializer_list>
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>

namespace grader {

/**
 * @brief 沿着 keys 访问嵌套的 json 对象，不存在时返回 nullptr
 */
template <typename... Keys>
const nlohmann::json *find_optional(const nlohmann::json &j, const Keys &... keys) {
    const nlohmann::json *ref = j.is_null() ? nullptr : &j;
    auto step = [&ref](const auto &key) {
        if (ref && ref->is_object() && ref->count(key))
            ref = &ref->at(key);
        else
            ref = nullptr;
    };
    (step(keys), ...);
    return ref && !ref->is_null() ? ref : nullptr;
}

template <typename... Keys>
std::invalid_argument build_invalid_argument(const nlohmann::json &j, const Keys &... keys) {
    std::string msg = "Unexpected value type of: ";
    ((msg += boost::lexical_cast<std::string>(keys) + "."), ...);
    msg += " in " + j.dump();
    return std::invalid_argument(msg);
}

/**
 * @brief 读取 json 中的可选字段
 * @param def_value 字段不存在或为 null 时的默认值
 * @throw std::invalid_argument 字段存在但类型不正确
 */
template <typename T, typename... Keys>
T get_value_def(const nlohmann::json &j, const T &def_value, const Keys &... keys) {
    const nlohmann::json *ref = find_optional(j, keys...);
    if (!ref) return def_value;
    try {
        return ref->get<T>();
    } catch (nlohmann::json::exception &) {
        throw build_invalid_argument(j, keys...);
    }
}

/**
 * @brief 如果 json 中存在字段 key，则写入 std::optional 中
 * @throw std::invalid_argument 字段存在但类型不正确
 */
template <typename T, typename Key>
void assign_optional(const nlohmann::json &j, std::optional<T> &value, const Key &key) {
    const nlohmann::json *ref = find_optional(j, key);
    if (!ref) return;
    try {
        value = ref->get<T>();
    } catch (nlohmann::json::exception &) {
        throw build_invalid_argument(j, key);
    }
}

/**
 * @brief 检查 json 对象只包含允许的字段
 * 用于比较器配置等，拼写错误的选项应当报错而不是被静默忽略。
 * @throw std::invalid_argument 存在未知字段或者 j 不是对象
 */
void ensure_known_keys(const nlohmann::json &j, std::initializer_list<const char *> allowed, const std::string &context);

/**
 * @brief 序列化 json，非法的 UTF-8 字节替换为 U+FFFD
 * 报告中包含选手程序的任意输出，不能因为选手输出了非 UTF-8 的字节就无法生成报告。
 * @param indent 缩进空格数，为 -1 时输出紧凑格式
 */
std::string dump_json(const nlohmann::json &j, int indent = -1);

}  // namespace grader

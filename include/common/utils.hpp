#pragma once

#include <boost/lexical_cast.hpp>
#include <filesystem>
#include <string>
#include <type_traits>
#include <vector>

namespace grader {

template <typename T>
struct to_string_cont {
    template <typename ContainerT>
    static void to_string(ContainerT &cont, const T &element) {
        cont.push_back(boost::lexical_cast<std::string>(element));
    }
};

template <>
struct to_string_cont<std::filesystem::path> {
    template <typename ContainerT>
    static void to_string(ContainerT &cont, const std::filesystem::path &element) {
        cont.push_back(element.string());
    }
};

template <typename T>
struct to_string_cont<std::vector<T>> {
    template <typename ContainerT>
    static void to_string(ContainerT &cont, const std::vector<T> &vec) {
        for (const T &value : vec)
            to_string_cont<T>::to_string(cont, value);
    }
};

/**
 * @brief 将参数 args 的内容通过 to_string 转换为字符串并装入容器中
 * @param cont 字符串容器
 * @param args 按顺序 to_string 转换为字符串并装入容器（如果 arg 本身为容器，则遍历这个容器将各个元素加入结果容器中）
 */
template <typename ContainerT, typename Head, typename... Args>
void to_string_list(ContainerT &cont, const Head &head, const Args &... args) {
    to_string_cont<std::decay_t<decltype(head)>>::to_string(cont, head);
    if constexpr (sizeof...(args) > 0)
        to_string_list(cont, args...);
}

/**
 * @brief 构造外部命令的参数列表
 * @note 参数列表直接交给 execve，不经过 shell，因此不存在转义导致的安全问题
 * @code{.cpp}
 *     std::filesystem::path source("main.cpp");
 *     // {"g++", "-O2", "main.cpp"}
 *     auto argv = make_command("g++", "-O2", source);
 * @endcode
 */
template <typename... Args>
std::vector<std::string> make_command(const Args &... args) {
    std::vector<std::string> list;
    to_string_list(list, args...);
    return list;
}

/**
 * @brief 将 [0,1] 的比例格式化为百分数，保留一位小数，如 "66.7%"
 */
std::string format_percent(double ratio);

/**
 * @brief 将字符串格式化为带单引号的可打印形式，转义控制字符
 * 用于 diff 中展示行内容，例如 "a\tb" 会显示为 'a\tb'
 */
std::string quote(const std::string &str);

}  // namespace grader

#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace grader {

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @return 文本文件的内容(没有指定编码)
 * @throw std::system_error 文件无法打开
 */
std::string read_file_content(const std::filesystem::path &path);

/**
 * @brief 读取文本文件的前 limit 个字节
 * 用于读取选手程序的 stderr，避免选手程序输出大量内容拖垮评测系统。
 * @param path 文本文件路径
 * @param limit 最多读取的字节数，超出部分被丢弃并追加 "... (truncated)"
 * @return 文本文件的内容，若文件不存在则返回空串
 */
std::string read_file_content(const std::filesystem::path &path, size_t limit);

/**
 * @brief 将字符串写入文件，覆盖已有内容
 * @throw std::system_error 文件无法写入
 */
void write_file_content(const std::filesystem::path &path, const std::string &content);

/**
 * @brief 在 PATH 环境变量中查找可执行文件
 * 如果 name 中包含 '/'，则直接检查该路径是否可执行。
 * @param name 可执行文件名，如 "g++"
 * @return 可执行文件的路径，找不到时返回 std::nullopt
 */
std::optional<std::filesystem::path> find_executable(const std::string &name);

/**
 * @brief 在 root 下创建一个以随机 uuid 命名、权限为 0700 的文件夹
 * 配置了 RUN_USER_ID 时文件夹归运行选手程序的用户所有。
 * @param root 父文件夹，不存在时会被创建
 * @return 新创建的文件夹路径
 */
std::filesystem::path create_unique_directory(const std::filesystem::path &root);

/**
 * @brief 生成一个随机的 uuid 字符串，用于文件命名
 */
std::string random_uuid();

}  // namespace grader

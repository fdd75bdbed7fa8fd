#pragma once

#include <string>

namespace grader {

/**
 * @brief 表示数据点或整个提交的评测结果
 */
enum class status {
    /**
     * @brief 用户程序正常退出且输出与标准答案一致
     * 对于单次运行结果，表示进程以返回码 0 退出。
     */
    OK = 0,

    /**
     * @brief 用户程序运行时钟时间超出限制，被评测系统强制杀死
     * 这是 TIME_LIMIT_EXCEEDED 的一种，汇总整个提交时会归入 TLE。
     */
    TIMEOUT = 1,

    /**
     * @brief 用户程序 CPU 时间超出限制
     * 由内核发送 SIGXCPU 或者退出后统计的 CPU 时间超过限制。
     */
    TIME_LIMIT_EXCEEDED = 2,

    /**
     * @brief 用户程序运行内存超限
     * 进程被不是评测系统发出的 SIGKILL 杀死（内核 OOM killer），
     * 或者启用 cgroup 时 memory.oom_control 记录了 oom_kill。
     * 在 RLIMIT_AS 限制下 malloc 返回 NULL 导致的崩溃会被认为是 RE。
     */
    MEMORY_LIMIT_EXCEEDED = 3,

    /**
     * @brief 用户程序写文件内容过多，收到 SIGXFSZ
     */
    OUTPUT_LIMIT_EXCEEDED = 4,

    /**
     * @brief 用户程序出现运行时错误
     * 非零返回码、上述以外的信号，或者程序根本无法启动。
     */
    RUNTIME_ERROR = 5,

    /**
     * @brief 内部错误，评测系统出错
     * 比如编译器不存在、磁盘错误、比较器配置错误。
     */
    INTERNAL_ERROR = 6,

    /**
     * @brief 用户程序编译错误
     * 此时不会运行任何测试点。
     */
    COMPILATION_ERROR = 7,

    /**
     * @brief 答案错误
     * 程序正常运行结束，但输出没有通过比较器。
     */
    WRONG_ANSWER = 8
};

const char *get_display_message(status);

/**
 * @brief 获得评测结果的缩写，如 "OK"、"TLE"、"TIMEOUT"
 */
const char *get_short_name(status);

/**
 * @brief 根据缩写解析评测结果
 * @throw std::invalid_argument 缩写不存在
 */
status parse_status(const std::string &name);

/**
 * @brief 是否为超时类结果（TIMEOUT 或 TLE）
 */
bool is_time_limit(status);

/**
 * @brief 将单个测试点的结果折叠为整个提交的结果，TIMEOUT 归入 TLE
 */
status fold_verdict(status);

}  // namespace grader

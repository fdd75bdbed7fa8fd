#pragma once

#include <sys/types.h>
#include <cstdint>
#include <exception>
#include <string>

struct cgroup;
struct cgroup_controller;

namespace grader {

struct cgroup_exception : public std::exception {
    cgroup_exception(const std::string &cgroup_op, int err);

    const char *what() const noexcept override;

    static void ensure(const std::string &cgroup_op, int err);

private:
    std::string errmsg;
};

/**
 * @brief 表示一个 cgroup 的 controller
 * 评测系统只使用 memory（限制内存、统计峰值内存、检测 OOM）和 cpuacct（统计 CPU 时间）两个控制器
 */
struct cgroup_ctrl {
    struct cgroup_controller *ctrl;

    /**
     * @brief 为 controller 添加设定
     */
    void add_value(const std::string &name, int64_t value);

    int64_t get_value_int64(const std::string &name);
};

/**
 * @brief 创建指定 cgroup 的管理器
 * 在析构时释放 libcgroup 分配的内存以确保没有内存泄漏，但不会删除内核中的 cgroup
 */
struct cgroup_guard {
    /**
     * @brief 构造函数，调用 libcgroup 的创建函数
     * @param cgroup_name cgroup 的内核名称
     */
    explicit cgroup_guard(const std::string &cgroup_name);

    ~cgroup_guard();

    cgroup_guard(const cgroup_guard &) = delete;
    cgroup_guard &operator=(const cgroup_guard &) = delete;

    /**
     * @brief 在内核中创建这个 cgroup，同时写入 add_controller、add_value 添加的数据
     */
    void create_cgroup(int ignore_ownership);

    /**
     * @brief 创建一个新的 controller
     * @param name 控制器的名称，如 "memory"
     * @throw cgroup_exception 当创建失败时
     */
    cgroup_ctrl add_controller(const std::string &name);

    /**
     * @brief 从 cgroup 中获得指定的 controller，必须先调用 get_cgroup
     * @throw cgroup_exception 当 controller 不存在时
     */
    cgroup_ctrl get_controller(const std::string &name);

    /**
     * 从内核中读入 cgroup 的所有信息。
     */
    void get_cgroup();

    /**
     * @brief 将指定进程移入本 cgroup
     */
    void attach_task(pid_t pid);

    /**
     * @brief 从内核中删除这个 cgroup，所有的进程都会被移入上一层的 cgroup
     */
    void delete_cgroup();

    /**
     * @brief 初始化 libcgroup，多次调用只会初始化一次
     */
    static void init();

private:
    struct cgroup *cg;
};

/**
 * @brief 一次运行独占的 cgroup，析构时杀死组内所有进程并删除 cgroup
 * 名称为 /codegrader/<uuid>，内存和内存加交换的上限设为同一值以禁止交换
 */
class sandbox_cgroup {
public:
    /**
     * @param memory_limit_bytes 组内所有进程的内存上限
     */
    explicit sandbox_cgroup(int64_t memory_limit_bytes);
    ~sandbox_cgroup();

    sandbox_cgroup(const sandbox_cgroup &) = delete;
    sandbox_cgroup &operator=(const sandbox_cgroup &) = delete;

    void attach(pid_t pid);

    /**
     * @brief 杀死 cgroup 内所有的进程，包括脱离了进程组的后代进程
     */
    void kill_all();

    /**
     * @brief 组内进程的峰值内存（内存加交换），单位字节
     */
    int64_t max_memory_usage();

    /**
     * @brief 组内进程消耗的 CPU 时间，单位纳秒
     */
    int64_t cpu_usage();

    /**
     * @brief 内核 OOM killer 是否杀死过组内的进程
     */
    bool oom_killed();

    const std::string &name() const { return name_; }

private:
    std::string name_;
};

}  // namespace grader

#pragma once

#include <filesystem>
#include <map>
#include <string>
#include <vector>
#include "common/status.hpp"
#include "sandbox/resource_limits.hpp"

namespace grader {

/**
 * @brief 描述需要在资源限制下运行的一个进程
 */
struct process_request {
    /**
     * @brief 命令行参数，command[0] 会在 PATH 中查找
     */
    std::vector<std::string> command;

    /**
     * @brief 子进程的环境变量
     * 子进程不继承评测系统的环境变量，只会额外获得 PATH。
     */
    std::map<std::string, std::string> env;

    /**
     * @brief 子进程的工作目录
     */
    std::filesystem::path work_dir;

    /**
     * @brief 标准输入文件，为空时使用 /dev/null
     */
    std::filesystem::path stdin_file;

    /**
     * @brief 标准输出文件，会被截断重写，受 file_size_mb 限制
     */
    std::filesystem::path stdout_file;

    /**
     * @brief 标准错误输出文件
     */
    std::filesystem::path stderr_file;

    resource_limits limits;

    /**
     * @brief 在 memory_mb 之外额外允许的虚拟地址空间（MB），供 JVM、V8 等托管运行时使用
     */
    int64_t address_space_reserve_mb = 0;
};

/**
 * @brief 一次运行的结果
 */
struct run_result {
    grader::status status = grader::status::INTERNAL_ERROR;

    /**
     * @brief 进程的返回码，如果进程因为信号退出则为 -1
     */
    int exit_code = -1;

    /**
     * @brief 导致进程退出的信号，正常退出时为 0
     */
    int signal = 0;

    /**
     * @brief 时钟时间（毫秒），从 fork 开始到回收进程为止
     */
    double time_ms = 0;

    /**
     * @brief 用户态加内核态 CPU 时间（毫秒）
     */
    double cpu_time_ms = 0;

    /**
     * @brief 峰值内存（MB），无法获得时为 0
     */
    double memory_mb = 0;

    std::string stdout_text;

    /**
     * @brief 截断后的标准错误输出，若进程无法启动则为错误描述
     */
    std::string stderr_text;

    /**
     * @brief 进程无法启动时的 errno，成功启动时为 0
     * 语言适配器根据它区分编译器不存在（内部错误）与真正的编译失败。
     */
    int spawn_errno = 0;
};

/**
 * @brief 子进程退出时的观测数据，用于推导运行结果
 */
struct termination_info {
    bool wall_timeout = false;
    bool exited = false;
    int exit_code = -1;
    int signal = 0;
    bool oom_killed = false;
    double cpu_time_ms = 0;
};

/**
 * @brief 信号与评测结果的对应关系
 */
struct signal_verdict {
    int signal;
    grader::status verdict;
    const char *reason;
};

/**
 * @brief Linux 下终止信号到评测结果的显式对照表
 * SIGXCPU -> TLE，SIGKILL -> MLE（不是评测系统发出的 SIGKILL 只可能来自 OOM killer），
 * SIGXFSZ -> OLE，表中没有的信号都是 RE。
 */
const std::vector<signal_verdict> &signal_verdict_table();

/**
 * @brief 查表得到信号对应的评测结果，不在表中的信号返回 RUNTIME_ERROR
 */
status classify_signal(int signal);

/**
 * @brief 根据子进程的退出情况推导评测结果，优先级从高到低为：
 * 1. 时钟时间超限被杀死 -> TIMEOUT，无论返回码是什么
 * 2. 收到 SIGXCPU 或者 CPU 时间超过限制 -> TLE
 * 3. cgroup 记录了 OOM 或者收到 SIGKILL -> MLE
 * 4. 收到 SIGXFSZ -> OLE
 * 5. 非零返回码或其他信号 -> RE
 * 6. 返回码为 0 -> OK
 */
status derive_status(const termination_info &info, const resource_limits &limits);

/**
 * @brief 资源限制执行器
 * 在内核资源限制下启动一个进程并等待其结束：
 * 1. fork 之前在父进程中查找可执行文件、构造参数和环境变量，子进程中只调用异步信号安全的函数
 * 2. 子进程
 *    1. 调用 setpgid 进入独立的进程组，以便通过 kill(-pgid) 杀死所有后代进程
 *    2. 如果启用了 cgroup，等待父进程将自己加入 cgroup
 *    3. 重定向标准输入输出，切换工作目录
 *    4. 通过 setrlimit 限制 CPU 时间、虚拟内存、栈、输出文件大小和文件描述符数
 *    5. 切换到运行用户（setgid、setgroups、setuid），之后再限制进程数
 *    6. 调用 execve，失败时通过 CLOEXEC 管道将 errno 报告给父进程
 * 3. 父进程每隔 5ms 检查子进程是否退出，超过时钟时间限制时杀死整个进程组
 * 4. 子进程退出后仍然杀死整个进程组（以及 cgroup 内所有进程），确保没有后代进程存活
 * 5. 通过 wait4 回收子进程，得到 CPU 时间和峰值内存
 */
class resource_limit_enforcer {
public:
    /**
     * @param use_cgroup 是否使用 cgroup 限制内存，默认取决于全局配置 USE_CGROUP
     * @param user_id 运行子进程的用户，默认取决于全局配置 RUN_USER_ID，为 -1 时不切换用户
     * @param group_id 运行子进程的组，为 -1 时使用 user_id 的主组
     */
    resource_limit_enforcer();
    explicit resource_limit_enforcer(bool use_cgroup);
    resource_limit_enforcer(bool use_cgroup, int user_id, int group_id);

    /**
     * @brief 运行进程直到其结束或被杀死
     * 选手程序导致的各种失败（包括无法启动）都通过返回值报告
     * @throw std::system_error fork、pipe 等系统调用失败
     * @throw cgroup_exception 启用 cgroup 但无法创建
     * @throw internal_error 以 root 身份运行但没有配置运行用户
     */
    run_result run(const process_request &request) const;

private:
    bool use_cgroup;
    int user_id;
    int group_id;
};

/**
 * @brief 信号的名字，如 SIGSEGV，不认识的信号返回 "unknown signal"
 * 与 strsignal 不同，返回的是静态字符串，可以在多个评测线程中同时调用
 */
const char *signal_name(int signal);

}  // namespace grader

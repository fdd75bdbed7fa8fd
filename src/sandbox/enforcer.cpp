#include "sandbox/enforcer.hpp"
#include <fcntl.h>
#include <fmt/core.h>
#include <grp.h>
#include <glog/logging.h>
#include <signal.h>
#include <sys/resource.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <boost/algorithm/string/join.hpp>
#include <chrono>
#include <cmath>
#include <cstring>
#include <optional>
#include <system_error>
#include <thread>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/system.hpp"
#include "config.hpp"
#include "sandbox/cgroup.hpp"

namespace grader {
using namespace std;
namespace fs = std::filesystem;

const int PIPE_READ = 0;
const int PIPE_WRITE = 1;

const auto POLL_INTERVAL = chrono::milliseconds(5);

// clang-format off
static const vector<signal_verdict> signal_table = {
    {SIGXCPU, status::TIME_LIMIT_EXCEEDED, "CPU time limit exceeded"},
    {SIGKILL, status::MEMORY_LIMIT_EXCEEDED, "killed by the kernel, out of memory"},
    {SIGXFSZ, status::OUTPUT_LIMIT_EXCEEDED, "file size limit exceeded"},
};
// clang-format on

const vector<signal_verdict> &signal_verdict_table() {
    return signal_table;
}

// clang-format off
static const pair<int, const char *> signal_names[] = {
    {SIGHUP, "SIGHUP"}, {SIGINT, "SIGINT"}, {SIGQUIT, "SIGQUIT"}, {SIGILL, "SIGILL"},
    {SIGTRAP, "SIGTRAP"}, {SIGABRT, "SIGABRT"}, {SIGBUS, "SIGBUS"}, {SIGFPE, "SIGFPE"},
    {SIGKILL, "SIGKILL"}, {SIGUSR1, "SIGUSR1"}, {SIGSEGV, "SIGSEGV"}, {SIGUSR2, "SIGUSR2"},
    {SIGPIPE, "SIGPIPE"}, {SIGALRM, "SIGALRM"}, {SIGTERM, "SIGTERM"}, {SIGCHLD, "SIGCHLD"},
    {SIGCONT, "SIGCONT"}, {SIGSTOP, "SIGSTOP"}, {SIGTSTP, "SIGTSTP"}, {SIGTTIN, "SIGTTIN"},
    {SIGTTOU, "SIGTTOU"}, {SIGURG, "SIGURG"}, {SIGXCPU, "SIGXCPU"}, {SIGXFSZ, "SIGXFSZ"},
    {SIGVTALRM, "SIGVTALRM"}, {SIGPROF, "SIGPROF"}, {SIGWINCH, "SIGWINCH"}, {SIGIO, "SIGIO"},
    {SIGPWR, "SIGPWR"}, {SIGSYS, "SIGSYS"},
};
// clang-format on

const char *signal_name(int signal) {
    for (auto &[number, name] : signal_names)
        if (number == signal) return name;
    return "unknown signal";
}

status classify_signal(int signal) {
    for (auto &entry : signal_table)
        if (entry.signal == signal) return entry.verdict;
    return status::RUNTIME_ERROR;
}

status derive_status(const termination_info &info, const resource_limits &limits) {
    if (info.wall_timeout)
        return status::TIMEOUT;
    // 硬限制触发时内核发送 SIGKILL，此时 CPU 时间一定已经超过限制，必须先于 MLE 判断
    if (info.signal == SIGXCPU || info.cpu_time_ms > limits.cpu_time_ms())
        return status::TIME_LIMIT_EXCEEDED;
    if (info.oom_killed)
        return status::MEMORY_LIMIT_EXCEEDED;
    if (info.signal != 0)
        return classify_signal(info.signal);
    if (!info.exited || info.exit_code != 0)
        return status::RUNTIME_ERROR;
    return status::OK;
}

/**
 * @brief 子进程在 execve 之前失败时通过管道报告给父进程的数据
 */
struct child_failure {
    int stage;
    int err;
};

enum child_stage {
    STAGE_SETPGID = 0,
    STAGE_CGROUP,
    STAGE_STDIN,
    STAGE_STDOUT,
    STAGE_STDERR,
    STAGE_CHDIR,
    STAGE_RLIMIT,
    STAGE_SETUID,
    STAGE_EXEC
};

static const char *stage_names[] = {
    "setpgid", "cgroup", "stdin", "stdout", "stderr", "chdir", "setrlimit", "setuid", "execve"};

struct rlimit_setting {
    int resource;
    struct rlimit limit;
};

/**
 * @brief 子进程出错时报告并退出，只使用异步信号安全的函数
 */
[[noreturn]] static void child_fail(int fd, int stage) {
    child_failure failure{stage, errno};
    ssize_t ret = write(fd, &failure, sizeof(failure));
    (void)ret;
    _exit(127);
}

static int open_redirect(const char *path, int flags, int target) {
    int fd = open(path, flags, S_IRUSR | S_IWUSR);
    if (fd < 0) return -1;
    if (fd != target) {
        if (dup2(fd, target) < 0) return -1;
        close(fd);
    }
    return 0;
}

static vector<rlimit_setting> build_rlimits(const process_request &request) {
    const resource_limits &limits = request.limits;
    const rlim_t MB = 1024 * 1024;

    // 软限制比时钟时间限制多 1 秒，使得单线程的死循环总是先触发时钟时间限制；
    // 硬限制再多 1 秒：软限制时内核发送 SIGXCPU，硬限制时发送 SIGKILL。
    rlim_t cpu_soft = (rlim_t)ceil(limits.cpu_time_ms() / 1000.0) + 1;
    rlim_t address_space = (rlim_t)(limits.memory_mb() + request.address_space_reserve_mb) * MB;

    return {
        {RLIMIT_CPU, {cpu_soft, cpu_soft + 1}},
        {RLIMIT_AS, {address_space, address_space}},
        {RLIMIT_STACK, {(rlim_t)limits.stack_mb() * MB, (rlim_t)limits.stack_mb() * MB}},
        {RLIMIT_FSIZE, {(rlim_t)limits.file_size_mb() * MB, (rlim_t)limits.file_size_mb() * MB}},
        {RLIMIT_NOFILE, {(rlim_t)limits.open_files(), (rlim_t)limits.open_files()}},
        {RLIMIT_CORE, {0, 0}}};
}

/**
 * @brief 当前进程打开的最大文件描述符
 * 评测系统是多线程的，其他线程打开的文件可能没有 O_CLOEXEC，子进程需要在 exec 前关闭它们
 */
static int highest_open_fd() {
    int highest = 2;
    error_code ec;
    for (auto &entry : fs::directory_iterator("/proc/self/fd", ec)) {
        try {
            highest = max(highest, stoi(entry.path().filename().string()));
        } catch (invalid_argument &) {
        }
    }
    if (ec) highest = 1023;
    return highest;
}

static double to_ms(const struct timeval &tv) {
    return tv.tv_sec * 1000.0 + tv.tv_usec / 1000.0;
}

resource_limit_enforcer::resource_limit_enforcer()
    : resource_limit_enforcer(USE_CGROUP) {}

resource_limit_enforcer::resource_limit_enforcer(bool use_cgroup)
    : resource_limit_enforcer(use_cgroup, RUN_USER_ID, RUN_GROUP_ID) {}

resource_limit_enforcer::resource_limit_enforcer(bool use_cgroup, int user_id, int group_id)
    : use_cgroup(use_cgroup), user_id(user_id), group_id(group_id) {}

run_result resource_limit_enforcer::run(const process_request &request) const {
    if (request.command.empty())
        throw invalid_argument("command to run should not be empty");
    if (user_id < 0 && geteuid() == 0)
        throw internal_error("refusing to run a command as root, configure a run user");
    if (user_id == 0)
        throw internal_error("run user must not be root");

    // getpwuid 不是异步信号安全的，必须在 fork 之前查询
    int run_group_id = group_id;
    if (user_id >= 0 && run_group_id < 0) {
        run_group_id = get_primary_groupid(user_id);
        if (run_group_id < 0)
            throw internal_error(fmt::format("unable to find the primary group of user {}", user_id));
    }

    run_result result;
    const resource_limits &limits = request.limits;

    // 含有 '/' 的相对路径相对于子进程的工作目录
    string program = request.command[0];
    if (program.find('/') != string::npos && filesystem::path(program).is_relative() && !request.work_dir.empty())
        program = (request.work_dir / program).string();
    auto executable = find_executable(program);
    if (!executable) {
        result.status = status::RUNTIME_ERROR;
        result.spawn_errno = ENOENT;
        result.stderr_text = fmt::format("failed to start '{}': {}", request.command[0], strerror(ENOENT));
        LOG(WARNING) << result.stderr_text;
        return result;
    }

    // 在 fork 之前准备好子进程需要的所有数据，子进程中不能分配内存
    // 子进程先 chdir 再 execve，相对路径必须转换为绝对路径
    string exec_path = filesystem::absolute(*executable).string();
    vector<char *> argv;
    for (auto &arg : request.command) argv.push_back(const_cast<char *>(arg.c_str()));
    argv.push_back(nullptr);

    vector<string> env_list;
    if (!request.env.count("PATH")) {
        const char *path = getenv("PATH");
        env_list.push_back(string("PATH=") + (path ? path : "/usr/local/bin:/usr/bin:/bin"));
    }
    for (auto &[key, value] : request.env) env_list.push_back(key + "=" + value);
    vector<char *> envp;
    for (auto &entry : env_list) envp.push_back(const_cast<char *>(entry.c_str()));
    envp.push_back(nullptr);

    string stdin_path = request.stdin_file.empty() ? "/dev/null" : request.stdin_file.string();
    string stdout_path = request.stdout_file.empty() ? "/dev/null" : request.stdout_file.string();
    string stderr_path = request.stderr_file.empty() ? "/dev/null" : request.stderr_file.string();
    string work_dir = request.work_dir.string();
    vector<rlimit_setting> rlimits = build_rlimits(request);
    struct rlimit nproc_limit = {(rlim_t)limits.processes(), (rlim_t)limits.processes()};
    uid_t run_user = (uid_t)user_id;
    gid_t run_group = (gid_t)run_group_id;
    int max_fd = highest_open_fd() + 64;

    DLOG(INFO) << "Running " << boost::algorithm::join(request.command, " ") << " in " << work_dir;

    optional<sandbox_cgroup> cg;
    if (use_cgroup) cg.emplace(limits.memory_mb() * 1024 * 1024);

    int error_pipe[2], sync_pipe[2] = {-1, -1};
    if (pipe2(error_pipe, O_CLOEXEC) != 0)
        throw system_error(errno, system_category(), "unable to create pipe");
    defer {
        if (error_pipe[PIPE_READ] >= 0) close(error_pipe[PIPE_READ]);
        if (error_pipe[PIPE_WRITE] >= 0) close(error_pipe[PIPE_WRITE]);
        if (sync_pipe[PIPE_READ] >= 0) close(sync_pipe[PIPE_READ]);
        if (sync_pipe[PIPE_WRITE] >= 0) close(sync_pipe[PIPE_WRITE]);
    };
    if (cg && pipe2(sync_pipe, O_CLOEXEC) != 0)
        throw system_error(errno, system_category(), "unable to create pipe");

    auto start_time = chrono::steady_clock::now();
    pid_t pid = fork();
    if (pid < 0)
        throw system_error(errno, system_category(), "unable to fork");

    if (pid == 0) {  // 子进程
        int err_fd = error_pipe[PIPE_WRITE];

        // 单独的进程组，使得选手程序及其所有子进程能被一个信号杀死
        if (setpgid(0, 0) != 0) child_fail(err_fd, STAGE_SETPGID);

        // 评测线程可能屏蔽或忽略了某些信号，选手程序应当使用默认的信号处理方式
        sigset_t empty_mask;
        sigemptyset(&empty_mask);
        sigprocmask(SIG_SETMASK, &empty_mask, nullptr);
        for (int sig : {SIGPIPE, SIGXCPU, SIGXFSZ, SIGINT, SIGTERM, SIGHUP, SIGQUIT})
            signal(sig, SIG_DFL);

        if (sync_pipe[PIPE_READ] >= 0) {
            char go;
            if (read(sync_pipe[PIPE_READ], &go, 1) != 1) child_fail(err_fd, STAGE_CGROUP);
        }

        if (open_redirect(stdin_path.c_str(), O_RDONLY, STDIN_FILENO) != 0) child_fail(err_fd, STAGE_STDIN);
        if (open_redirect(stdout_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, STDOUT_FILENO) != 0) child_fail(err_fd, STAGE_STDOUT);
        if (open_redirect(stderr_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, STDERR_FILENO) != 0) child_fail(err_fd, STAGE_STDERR);
        for (int fd = STDERR_FILENO + 1; fd <= max_fd; ++fd)
            if (fd != err_fd) fcntl(fd, F_SETFD, FD_CLOEXEC);

        if (chdir(work_dir.c_str()) != 0) child_fail(err_fd, STAGE_CHDIR);

        // 资源限制必须在 execve 之前设置，这样选手程序的第一条指令就已经受到限制
        for (auto &setting : rlimits)
            if (setrlimit(setting.resource, &setting.limit) != 0) child_fail(err_fd, STAGE_RLIMIT);

        if (user_id >= 0) {
            if (setgid(run_group) != 0) child_fail(err_fd, STAGE_SETUID);
            if (setgroups(1, &run_group) != 0) child_fail(err_fd, STAGE_SETUID);
            if (setuid(run_user) != 0) child_fail(err_fd, STAGE_SETUID);
        } else {
            if (setuid(getuid()) != 0) child_fail(err_fd, STAGE_SETUID);
        }
        if (geteuid() == 0 || getuid() == 0) {
            errno = EPERM;
            child_fail(err_fd, STAGE_SETUID);
        }

        // RLIMIT_NPROC 按真实用户统计，切换用户之后再设置，否则 setuid 之后的 execve 可能因 EAGAIN 失败
        if (setrlimit(RLIMIT_NPROC, &nproc_limit) != 0) child_fail(err_fd, STAGE_RLIMIT);

        execve(exec_path.c_str(), argv.data(), envp.data());
        child_fail(err_fd, STAGE_EXEC);
    }

    // 父进程也设置一次进程组，避免子进程还没调用 setpgid 时就需要杀死进程组
    if (setpgid(pid, pid) != 0 && errno != EACCES && errno != ESRCH)
        LOG(WARNING) << "setpgid(" << pid << ") failed: " << strerror(errno);

    close(error_pipe[PIPE_WRITE]);
    error_pipe[PIPE_WRITE] = -1;

    auto kill_group = [&] {
        if (kill(-pid, SIGKILL) != 0 && errno != ESRCH)
            LOG(ERROR) << "unable to send SIGKILL to process group " << pid << ": " << strerror(errno);
        if (cg) cg->kill_all();
    };

    if (cg) {
        try {
            cg->attach(pid);
        } catch (exception &) {
            kill_group();
            waitpid(pid, nullptr, 0);
            throw;
        }
        char go = 1;
        if (write(sync_pipe[PIPE_WRITE], &go, 1) != 1) {
            int err = errno;
            kill_group();
            waitpid(pid, nullptr, 0);
            throw system_error(err, system_category(), "unable to resume child process");
        }
    }

    auto deadline = start_time + chrono::milliseconds(limits.wall_clock_ms());
    bool wall_timeout = false;
    while (true) {
        siginfo_t info;
        info.si_pid = 0;
        // WNOWAIT 使子进程保持僵尸状态，进程组 id 在我们杀死进程组之前不会被回收复用
        if (waitid(P_PID, pid, &info, WEXITED | WNOHANG | WNOWAIT) != 0) {
            if (errno == EINTR) continue;
            int err = errno;
            kill_group();
            throw system_error(err, system_category(), "waiting on child");
        }
        if (info.si_pid == pid) break;

        auto now = chrono::steady_clock::now();
        if (now >= deadline) {
            wall_timeout = true;
            LOG(WARNING) << fmt::format("wall clock limit {} ms exceeded: killing process group {}", limits.wall_clock_ms(), pid);
            break;
        }
        this_thread::sleep_for(min<chrono::steady_clock::duration>(POLL_INTERVAL, deadline - now));
    }

    // 无论子进程是正常退出还是超时，都杀死整个进程组，确保后代进程不会在调用结束后存活
    kill_group();

    int wstatus = 0;
    struct rusage usage;
    memset(&usage, 0, sizeof(usage));
    while (wait4(pid, &wstatus, 0, &usage) < 0) {
        if (errno != EINTR)
            throw system_error(errno, system_category(), "reaping child");
    }
    auto end_time = chrono::steady_clock::now();

    result.time_ms = chrono::duration<double, milli>(end_time - start_time).count();
    result.cpu_time_ms = to_ms(usage.ru_utime) + to_ms(usage.ru_stime);
    result.memory_mb = usage.ru_maxrss / 1024.0;  // ru_maxrss 的单位为 KB

    child_failure failure;
    ssize_t nread;
    do {
        nread = read(error_pipe[PIPE_READ], &failure, sizeof(failure));
    } while (nread < 0 && errno == EINTR);
    if (nread == sizeof(failure)) {
        result.status = status::RUNTIME_ERROR;
        result.spawn_errno = failure.err;
        result.stderr_text = fmt::format("failed to start '{}': {} ({})", request.command[0], strerror(failure.err), stage_names[failure.stage]);
        LOG(WARNING) << result.stderr_text;
        return result;
    }

    termination_info info;
    info.wall_timeout = wall_timeout;
    info.exited = WIFEXITED(wstatus);
    info.exit_code = info.exited ? WEXITSTATUS(wstatus) : -1;
    info.signal = WIFSIGNALED(wstatus) ? WTERMSIG(wstatus) : 0;
    info.cpu_time_ms = result.cpu_time_ms;

    if (cg) {
        // 内存和 CPU 时间的统计是尽力而为的，读取失败不影响评测结果
        try {
            result.memory_mb = cg->max_memory_usage() / (1024.0 * 1024.0);
            result.cpu_time_ms = info.cpu_time_ms = cg->cpu_usage() / 1e6;
            info.oom_killed = cg->oom_killed();
        } catch (exception &e) {
            LOG(WARNING) << "unable to read cgroup statistics of " << cg->name() << ": " << e.what();
        }
    }

    result.exit_code = info.exit_code;
    result.signal = info.signal;
    result.status = derive_status(info, limits);

    result.stdout_text = read_file_content(request.stdout_file, limits.file_size_mb() * 1024 * 1024);
    result.stderr_text = read_file_content(request.stderr_file, STDERR_CAPTURE_LIMIT);

    DLOG(INFO) << fmt::format("Process {} finished: {} exitcode={} signal={} time={:.0f}ms cpu={:.0f}ms memory={:.1f}MB",
                              pid, get_short_name(result.status), result.exit_code, result.signal,
                              result.time_ms, result.cpu_time_ms, result.memory_mb);
    return result;
}

}  // namespace grader

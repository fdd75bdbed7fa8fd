#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>

namespace grader {

/**
 * @brief 选手程序编译及运行的根目录
 * 每个提交在该目录下拥有一个独占的临时文件夹，评测结束后（无论成功与否）都会被删除。
 * RUN_DIR 的文件结构如下：
 *
 * RUN_DIR
 * ├── 0b5c6b2e-... // 随机生成的 uuid，权限 0700
 * │   ├── main.cpp // 选手程序的代码，文件名由语言决定
 * │   ├── app // 编译产物
 * │   ├── compile.out // 编译器的 stdout
 * │   ├── compile.err // 编译器的 stderr
 * │   ├── 5f1e....in // 测试点的标准输入，每个测试点使用不同的 uuid
 * │   ├── 5f1e....out // 选手程序的 stdout
 * │   └── 5f1e....err // 选手程序的 stderr
 * └── ...
 *
 * @defaultValue /tmp/codegrader
 */
extern std::filesystem::path RUN_DIR;

/**
 * @brief 每个提交最多同时运行的测试点数量
 */
extern size_t WORKER_COUNT;

/**
 * @brief 是否使用 cgroup 限制内存并统计内存和 CPU 时间
 * 需要 root 权限以及挂载好的 cgroup v1 memory 和 cpuacct 控制器。
 */
extern bool USE_CGROUP;

/**
 * @brief 运行编译器和选手程序的用户 id 及组 id
 * 子进程在 execve 之前切换到该用户，同时 RUN_DIR 下的临时文件夹归该用户所有。
 * 为 -1 时不切换用户，此时评测机不能以 root 身份运行选手程序。
 * @defaultValue -1
 */
extern int RUN_USER_ID;
extern int RUN_GROUP_ID;

/**
 * @brief 编译的时钟时间限制（毫秒），与测试点的时间限制无关
 */
extern int64_t COMPILE_TIME_LIMIT_MS;

/**
 * @brief 编译器的内存限制（MB）
 */
extern int64_t COMPILE_MEMORY_LIMIT_MB;

/**
 * @brief 编译器能写出的最大文件大小（MB）
 */
extern int64_t COMPILE_FILE_LIMIT_MB;

/**
 * @brief 读取选手程序 stderr 的最大字节数
 */
extern size_t STDERR_CAPTURE_LIMIT;

/**
 * @brief JVM、V8 等托管运行时在堆大小之外额外允许的虚拟内存（MB）
 * 这些运行时启动时会预留大量地址空间，如果直接用堆大小限制 RLIMIT_AS 会导致无法启动，
 * 因此堆大小由运行时参数限制，RLIMIT_AS 放宽这么多。
 */
extern int64_t RUNTIME_RESERVE_MB;

}  // namespace grader

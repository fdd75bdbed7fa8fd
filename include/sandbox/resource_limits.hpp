#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>

namespace grader {

/**
 * @brief 对资源限制的部分覆盖，每个字段都是可选的
 * 用于语言默认值 -> 提交级别 -> 测试点级别的逐层覆盖
 */
struct resource_limit_overrides {
    std::optional<int64_t> wall_clock_ms;
    std::optional<int64_t> cpu_time_ms;
    std::optional<int64_t> memory_mb;
    std::optional<int64_t> stack_mb;
    std::optional<int64_t> file_size_mb;
    std::optional<int64_t> open_files;
    std::optional<int64_t> processes;

    bool empty() const;
};

void from_json(const nlohmann::json &j, resource_limit_overrides &overrides);

/**
 * @brief 运行一个进程时的资源限制
 * 所有字段都必须为正数且不超过对应的上限，非法的值会在构造时（而不是运行时）抛出 std::invalid_argument。
 * 上限保证换算成字节和截止时间时不会溢出。
 * 因此任何一个 resource_limits 对象都是合法的。
 */
class resource_limits {
public:
    static constexpr int64_t DEFAULT_WALL_CLOCK_MS = 2000;
    static constexpr int64_t DEFAULT_CPU_TIME_MS = 2000;
    static constexpr int64_t DEFAULT_MEMORY_MB = 256;
    static constexpr int64_t DEFAULT_STACK_MB = 64;
    static constexpr int64_t DEFAULT_FILE_SIZE_MB = 10;
    static constexpr int64_t DEFAULT_OPEN_FILES = 64;
    static constexpr int64_t DEFAULT_PROCESSES = 1;

    static constexpr int64_t MAX_TIME_MS = 24 * 60 * 60 * 1000;  // 1 天
    static constexpr int64_t MAX_SIZE_MB = 1024 * 1024;          // 1T
    static constexpr int64_t MAX_OPEN_FILES = 1024 * 1024;
    static constexpr int64_t MAX_PROCESSES = 4 * 1024 * 1024;

    /**
     * @brief 使用默认值构造：2 秒、256MB 内存、64MB 栈、10MB 输出、64 个文件描述符、1 个进程
     */
    resource_limits();

    /**
     * @throw std::invalid_argument 任意一个字段不为正数或者超过上限
     */
    resource_limits(int64_t wall_clock_ms, int64_t cpu_time_ms, int64_t memory_mb, int64_t stack_mb,
                    int64_t file_size_mb, int64_t open_files, int64_t processes);

    /**
     * @brief 在当前限制的基础上应用覆盖，返回新的限制
     * @throw std::invalid_argument 覆盖后的某个字段不为正数或者超过上限
     */
    resource_limits apply(const resource_limit_overrides &overrides) const;

    int64_t wall_clock_ms() const { return wall_clock_ms_; }
    int64_t cpu_time_ms() const { return cpu_time_ms_; }
    int64_t memory_mb() const { return memory_mb_; }
    int64_t stack_mb() const { return stack_mb_; }
    int64_t file_size_mb() const { return file_size_mb_; }
    int64_t open_files() const { return open_files_; }
    int64_t processes() const { return processes_; }

    bool operator==(const resource_limits &other) const;
    bool operator!=(const resource_limits &other) const { return !(*this == other); }

private:
    int64_t wall_clock_ms_, cpu_time_ms_, memory_mb_, stack_mb_, file_size_mb_, open_files_, processes_;

    void validate() const;
};

void to_json(nlohmann::json &j, const resource_limits &limits);

}  // namespace grader

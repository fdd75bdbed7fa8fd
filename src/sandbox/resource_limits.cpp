#include "sandbox/resource_limits.hpp"
#include <fmt/core.h>
#include <stdexcept>
#include "common/json_utils.hpp"

namespace grader {
using namespace std;
using namespace nlohmann;

bool resource_limit_overrides::empty() const {
    return !wall_clock_ms && !cpu_time_ms && !memory_mb && !stack_mb &&
           !file_size_mb && !open_files && !processes;
}

void from_json(const json &j, resource_limit_overrides &overrides) {
    ensure_known_keys(j, {"wall_clock_ms", "cpu_time_ms", "memory_mb", "stack_mb", "file_size_mb", "open_files", "processes"}, "resource limits");
    assign_optional(j, overrides.wall_clock_ms, "wall_clock_ms");
    assign_optional(j, overrides.cpu_time_ms, "cpu_time_ms");
    assign_optional(j, overrides.memory_mb, "memory_mb");
    assign_optional(j, overrides.stack_mb, "stack_mb");
    assign_optional(j, overrides.file_size_mb, "file_size_mb");
    assign_optional(j, overrides.open_files, "open_files");
    assign_optional(j, overrides.processes, "processes");
}

resource_limits::resource_limits()
    : resource_limits(DEFAULT_WALL_CLOCK_MS, DEFAULT_CPU_TIME_MS, DEFAULT_MEMORY_MB, DEFAULT_STACK_MB,
                      DEFAULT_FILE_SIZE_MB, DEFAULT_OPEN_FILES, DEFAULT_PROCESSES) {}

resource_limits::resource_limits(int64_t wall_clock_ms, int64_t cpu_time_ms, int64_t memory_mb, int64_t stack_mb,
                                 int64_t file_size_mb, int64_t open_files, int64_t processes)
    : wall_clock_ms_(wall_clock_ms), cpu_time_ms_(cpu_time_ms), memory_mb_(memory_mb), stack_mb_(stack_mb), file_size_mb_(file_size_mb), open_files_(open_files), processes_(processes) {
    validate();
}

static void ensure_in_range(const char *name, int64_t value, int64_t max_value) {
    if (value <= 0)
        throw invalid_argument(fmt::format("{} must be positive, got {}", name, value));
    if (value > max_value)
        throw invalid_argument(fmt::format("{} must not exceed {}, got {}", name, max_value, value));
}

void resource_limits::validate() const {
    ensure_in_range("wall_clock_ms", wall_clock_ms_, MAX_TIME_MS);
    ensure_in_range("cpu_time_ms", cpu_time_ms_, MAX_TIME_MS);
    ensure_in_range("memory_mb", memory_mb_, MAX_SIZE_MB);
    ensure_in_range("stack_mb", stack_mb_, MAX_SIZE_MB);
    ensure_in_range("file_size_mb", file_size_mb_, MAX_SIZE_MB);
    ensure_in_range("open_files", open_files_, MAX_OPEN_FILES);
    ensure_in_range("processes", processes_, MAX_PROCESSES);
}

resource_limits resource_limits::apply(const resource_limit_overrides &o) const {
    return resource_limits(o.wall_clock_ms.value_or(wall_clock_ms_),
                           o.cpu_time_ms.value_or(cpu_time_ms_),
                           o.memory_mb.value_or(memory_mb_),
                           o.stack_mb.value_or(stack_mb_),
                           o.file_size_mb.value_or(file_size_mb_),
                           o.open_files.value_or(open_files_),
                           o.processes.value_or(processes_));
}

bool resource_limits::operator==(const resource_limits &other) const {
    return wall_clock_ms_ == other.wall_clock_ms_ &&
           cpu_time_ms_ == other.cpu_time_ms_ &&
           memory_mb_ == other.memory_mb_ &&
           stack_mb_ == other.stack_mb_ &&
           file_size_mb_ == other.file_size_mb_ &&
           open_files_ == other.open_files_ &&
           processes_ == other.processes_;
}

void to_json(json &j, const resource_limits &limits) {
    j = {{"wall_clock_ms", limits.wall_clock_ms()},
         {"cpu_time_ms", limits.cpu_time_ms()},
         {"memory_mb", limits.memory_mb()},
         {"stack_mb", limits.stack_mb()},
         {"file_size_mb", limits.file_size_mb()},
         {"open_files", limits.open_files()},
         {"processes", limits.processes()}};
}

}  // namespace grader

#include "config.hpp"
#include <algorithm>
#include <thread>

namespace grader {
using namespace std;

filesystem::path RUN_DIR = "/tmp/codegrader";
size_t WORKER_COUNT = max<size_t>(1, thread::hardware_concurrency());
bool USE_CGROUP = false;
int RUN_USER_ID = -1;
int RUN_GROUP_ID = -1;
int64_t COMPILE_TIME_LIMIT_MS = 30000;      // 30s
int64_t COMPILE_MEMORY_LIMIT_MB = 2048;     // 2G
int64_t COMPILE_FILE_LIMIT_MB = 64;         // 64M
size_t STDERR_CAPTURE_LIMIT = 64 * 1024;    // 64K
int64_t RUNTIME_RESERVE_MB = 4096;          // 4G

}  // namespace grader

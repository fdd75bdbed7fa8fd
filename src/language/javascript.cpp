#include "language/javascript.hpp"
#include "common/utils.hpp"
#include "config.hpp"

namespace grader {
using namespace std;

javascript_adapter::javascript_adapter()
    : language_adapter(resource_limits(resource_limits::DEFAULT_WALL_CLOCK_MS,
                                       resource_limits::DEFAULT_CPU_TIME_MS,
                                       resource_limits::DEFAULT_MEMORY_MB,
                                       resource_limits::DEFAULT_STACK_MB,
                                       resource_limits::DEFAULT_FILE_SIZE_MB,
                                       resource_limits::DEFAULT_OPEN_FILES,
                                       64),
                       "node", "node") {}

string javascript_adapter::name() const {
    return "javascript";
}

string javascript_adapter::entry_file() const {
    return "main.js";
}

string javascript_adapter::template_content() const {
    return R"(const fs = require('fs');

function solve(input) {
    // Write your solution here
    return '';
}

const input = fs.readFileSync(0, 'utf8');
process.stdout.write(solve(input));
)";
}

bool javascript_adapter::validate_solution(const filesystem::path &workdir) const {
    return !is_blank(read_entry(workdir));
}

vector<string> javascript_adapter::compile_command() const {
    return make_command(compiler, "--check", entry_file());
}

vector<string> javascript_adapter::run_command(const resource_limits &limits) const {
    return make_command(executable, "--max-old-space-size=" + to_string(limits.memory_mb()), entry_file());
}

int64_t javascript_adapter::address_space_reserve_mb() const {
    return RUNTIME_RESERVE_MB;
}

}  // namespace grader

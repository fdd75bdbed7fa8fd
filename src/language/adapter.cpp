#include "language/adapter.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <algorithm>
#include <cctype>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "config.hpp"

namespace grader {
using namespace std;

resource_limits compile_limits() {
    return resource_limits(
        COMPILE_TIME_LIMIT_MS,
        COMPILE_TIME_LIMIT_MS,
        COMPILE_MEMORY_LIMIT_MB,
        256,
        COMPILE_FILE_LIMIT_MB,
        1024,
        1024);
}

bool is_blank(const string &content) {
    return all_of(content.begin(), content.end(), [](unsigned char ch) { return isspace(ch); });
}

language_adapter::language_adapter(const resource_limits &limits, const string &executable, const string &compiler)
    : limits(limits), executable(executable), compiler(compiler) {}

const resource_limits &language_adapter::default_limits() const {
    return limits;
}

void language_adapter::set_default_limits(const resource_limits &limits) {
    this->limits = limits;
}

void language_adapter::set_executable(const string &executable) {
    this->executable = executable;
}

void language_adapter::set_compiler(const string &compiler) {
    this->compiler = compiler;
}

map<string, string> language_adapter::environment(const filesystem::path &) const {
    return {};
}

int64_t language_adapter::address_space_reserve_mb() const {
    return 0;
}

string language_adapter::read_entry(const filesystem::path &workdir) const {
    filesystem::path entry = workdir / entry_file();
    if (!filesystem::exists(entry)) return "";
    return read_file_content(entry);
}

compile_result language_adapter::compile(const filesystem::path &workdir) const {
    compile_result result;
    if (!filesystem::exists(workdir / entry_file())) {
        result.success = false;
        result.stderr_text = fmt::format("Entry file {} not found", entry_file());
        result.exit_code = 1;
        return result;
    }

    vector<string> command = compile_command();
    if (command.empty()) {
        // 解释执行的语言没有编译步骤
        result.success = true;
        result.exit_code = 0;
        return result;
    }

    process_request request;
    request.command = command;
    request.env = environment(workdir);
    request.work_dir = workdir;
    request.stdout_file = workdir / "compile.out";
    request.stderr_file = workdir / "compile.err";
    request.limits = compile_limits();
    request.address_space_reserve_mb = address_space_reserve_mb();

    DLOG(INFO) << "Compiling " << name() << " solution in " << workdir;
    run_result run = enforcer.run(request);
    if (run.spawn_errno != 0) {
        throw internal_error(fmt::format("Compiler for {} is not available: {}", name(), run.stderr_text));
    }

    result.stdout_text = run.stdout_text;
    result.stderr_text = run.stderr_text;
    result.exit_code = run.exit_code;
    result.compile_time_ms = run.time_ms;

    if (is_time_limit(run.status)) {
        result.success = false;
        result.stderr_text = fmt::format("Compilation timed out after {} seconds", COMPILE_TIME_LIMIT_MS / 1000);
    } else if (run.status != status::OK) {
        result.success = false;
        if (is_blank(result.stderr_text)) {
            if (run.signal != 0)
                result.stderr_text = fmt::format("Compiler was terminated by signal {}", run.signal);
            else
                result.stderr_text = fmt::format("Compiler exited with code {}", run.exit_code);
        }
    } else {
        result.success = true;
    }
    return result;
}

run_result language_adapter::run(const filesystem::path &workdir,
                                 const filesystem::path &stdin_file,
                                 const filesystem::path &stdout_file,
                                 const resource_limits &limits) const {
    process_request request;
    request.command = run_command(limits);
    request.env = environment(workdir);
    request.work_dir = workdir;
    request.stdin_file = stdin_file;
    request.stdout_file = stdout_file;
    request.stderr_file = filesystem::path(stdout_file).replace_extension(".err");
    request.limits = limits;
    request.address_space_reserve_mb = address_space_reserve_mb();
    return enforcer.run(request);
}

}  // namespace grader

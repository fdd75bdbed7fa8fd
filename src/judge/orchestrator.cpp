#include "judge/orchestrator.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <algorithm>
#include <mutex>
#include <thread>
#include "common/concurrent_queue.hpp"
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "compare/factory.hpp"
#include "config.hpp"

namespace grader {
using namespace std;
using namespace nlohmann;

static void remove_scratch(const filesystem::path &path) {
    error_code ec;
    filesystem::remove_all(path, ec);
    if (ec) LOG(WARNING) << "Unable to remove " << path << ": " << ec.message();
}

/**
 * @brief 为没有通过的运行生成给选手看的错误信息
 */
static string describe_failure(const run_result &run, const resource_limits &limits) {
    switch (run.status) {
        case status::TIMEOUT:
            return fmt::format("Time limit exceeded: killed after {} ms wall clock", limits.wall_clock_ms());
        case status::TIME_LIMIT_EXCEEDED:
            return fmt::format("CPU time limit of {} ms exceeded", limits.cpu_time_ms());
        case status::MEMORY_LIMIT_EXCEEDED:
            return fmt::format("Memory limit of {} MB exceeded", limits.memory_mb());
        case status::OUTPUT_LIMIT_EXCEEDED:
            return fmt::format("Output limit of {} MB exceeded", limits.file_size_mb());
        default:
            if (!run.stderr_text.empty()) return run.stderr_text;
            if (run.signal != 0) return fmt::format("Process was killed by signal {} ({})", run.signal, signal_name(run.signal));
            return fmt::format("Process exited with code {}", run.exit_code);
    }
}

void to_json(json &j, const syntax_check &check) {
    j = {{"valid", check.valid}, {"message", check.message}, {"structure_ok", check.structure_ok}};
}

judge_report internal_error_report(const submission &submit, const string &message) {
    judge_report report;
    for (auto &test : submit.test_cases) {
        test_case_result row;
        row.id = test.id;
        row.status = status::INTERNAL_ERROR;
        row.input = test.input;
        row.expected = test.expected_output;
        row.error = message;
        report.results.push_back(move(row));
    }
    report.message = message;
    report.summarize();
    report.verdict = status::INTERNAL_ERROR;
    return report;
}

execution_orchestrator::execution_orchestrator(const language_registry &registry, size_t workers)
    : registry(registry), workers(max<size_t>(1, workers)) {}

test_case_result execution_orchestrator::run_test_case(const language_adapter &adapter,
                                                       const filesystem::path &workdir,
                                                       const resource_limits &base_limits,
                                                       const test_case &test) const {
    test_case_result row;
    row.id = test.id;
    row.input = test.input;
    row.expected = test.expected_output;

    try {
        resource_limits limits = base_limits.apply(test.overrides());

        // 并发运行时每个测试点使用独立命名的文件
        string stem = random_uuid();
        filesystem::path stdin_file = workdir / (stem + ".in");
        filesystem::path stdout_file = workdir / (stem + ".out");
        defer {
            error_code ec;
            filesystem::remove(stdin_file, ec);
            filesystem::remove(stdout_file, ec);
            filesystem::remove(filesystem::path(stdout_file).replace_extension(".err"), ec);
        };
        write_file_content(stdin_file, test.input);

        run_result run = adapter.run(workdir, stdin_file, stdout_file, limits);
        row.status = run.status;
        row.time_ms = run.time_ms;
        row.memory_mb = run.memory_mb;
        row.actual = run.stdout_text;
        row.exit_code = run.exit_code;
        row.signal = run.signal;

        if (run.status != status::OK) {
            row.error = describe_failure(run, limits);
            if (is_time_limit(run.status) || run.status == status::MEMORY_LIMIT_EXCEEDED)
                LOG(WARNING) << "Test case " << test.id << " exceeded its limits: " << row.error;
        } else {
            auto comparator = select_comparator(test.comparison_type, test.comparison_config, test.expected_output, run.stdout_text);
            comparison_details details = comparator->compare(test.expected_output, run.stdout_text);
            row.comparator = comparator->name();
            row.similarity = details.similarity;
            if (!details.matched()) {
                row.status = status::WRONG_ANSWER;
                row.error = details.message;
                row.diff = details.diff;
            }
        }
    } catch (exception &e) {
        LOG(ERROR) << "Internal error while running test case " << test.id << ": " << describe_exception(e);
        row.status = status::INTERNAL_ERROR;
        row.error = string("Internal error: ") + e.what();
        row.similarity = 0;
        row.diff.reset();
    }

    DLOG(INFO) << "Test case " << test.id << ": " << get_short_name(row.status) << " in " << row.time_ms << " ms";
    return row;
}

vector<test_case_result> execution_orchestrator::run_test_cases(const language_adapter &adapter,
                                                                const filesystem::path &workdir,
                                                                const resource_limits &limits,
                                                                const vector<test_case> &test_cases) const {
    vector<test_case_result> results(test_cases.size());
    size_t thread_count = min(workers, test_cases.size());
    if (thread_count <= 1) {
        for (size_t i = 0; i < test_cases.size(); ++i)
            results[i] = run_test_case(adapter, workdir, limits, test_cases[i]);
        return results;
    }

    concurrent_queue<size_t> indices;
    for (size_t i = 0; i < test_cases.size(); ++i) indices.push(i);
    indices.close();

    mutex results_mutex;
    vector<thread> threads;
    defer {
        for (auto &t : threads)
            if (t.joinable()) t.join();
    };

    for (size_t k = 0; k < thread_count; ++k) {
        threads.emplace_back([&] {
            size_t index;
            while (indices.pop(index)) {
                test_case_result row = run_test_case(adapter, workdir, limits, test_cases[index]);
                lock_guard<mutex> guard(results_mutex);
                results[index] = move(row);
            }
        });
    }

    for (auto &t : threads) t.join();
    return results;
}

judge_report execution_orchestrator::grade(const submission &submit) const {
    auto adapter = registry.find(submit.language);
    if (!adapter) {
        LOG(WARNING) << "Unsupported language " << submit.language;
        return internal_error_report(submit, "Unsupported language: " + submit.language);
    }

    LOG(INFO) << "Grading " << adapter->name() << " submission with " << submit.test_cases.size() << " test cases";
    try {
        filesystem::path workdir = create_unique_directory(RUN_DIR);
        defer { remove_scratch(workdir); };

        write_file_content(workdir / adapter->entry_file(), submit.source);
        resource_limits limits = adapter->default_limits().apply(submit.limits);

        compile_result compiled = adapter->compile(workdir);
        if (!compiled.success) {
            judge_report report;
            report.verdict = status::COMPILATION_ERROR;
            report.message = "Compilation failed";
            report.total = submit.test_cases.size();
            report.compile = compiled;
            LOG(INFO) << "Submission failed to compile";
            return report;
        }

        judge_report report;
        if (submit.verbose) report.compile = compiled;
        report.results = run_test_cases(*adapter, workdir, limits, submit.test_cases);
        report.summarize();
        LOG(INFO) << "Submission graded: " << get_short_name(report.verdict) << ", " << report.passed << "/" << report.total << " passed";
        return report;
    } catch (exception &e) {
        LOG(ERROR) << "Internal error while grading " << submit.language << " submission: " << describe_exception(e);
        return internal_error_report(submit, string("Internal error: ") + e.what());
    }
}

syntax_check execution_orchestrator::validate_syntax(const string &language, const string &source) const {
    syntax_check check;
    auto adapter = registry.find(language);
    if (!adapter) {
        check.message = "Unsupported language: " + language;
        return check;
    }

    try {
        filesystem::path workdir = create_unique_directory(RUN_DIR);
        defer { remove_scratch(workdir); };

        write_file_content(workdir / adapter->entry_file(), source);
        check.structure_ok = adapter->validate_solution(workdir);
        compile_result compiled = adapter->compile(workdir);
        check.valid = compiled.success;
        check.message = compiled.success ? "Syntax OK" : compiled.stderr_text;
    } catch (exception &e) {
        LOG(ERROR) << "Internal error while checking " << language << " syntax: " << describe_exception(e);
        check.valid = false;
        check.message = string("Internal error: ") + e.what();
    }
    return check;
}

}  // namespace grader

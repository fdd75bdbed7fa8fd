#include "judge/report.hpp"
#include <fmt/core.h>
#include <algorithm>
#include <numeric>

namespace grader {
using namespace std;
using namespace nlohmann;

void judge_report::summarize() {
    total = results.size();
    passed = count_if(results.begin(), results.end(), [](const test_case_result &r) { return r.status == status::OK; });

    verdict = status::OK;
    for (auto &result : results) {
        if (result.status != status::OK) {
            verdict = fold_verdict(result.status);
            break;
        }
    }

    total_time_ms = 0;
    for (auto &result : results) total_time_ms += result.time_ms;
    average_time_ms = total > 0 ? total_time_ms / total : 0;

    if (message.empty()) {
        if (verdict == status::OK)
            message = fmt::format("All {} test cases passed", total);
        else
            message = fmt::format("{}: {}/{} test cases passed", get_display_message(verdict), passed, total);
    }
}

performance_summary judge_report::performance() const {
    performance_summary summary;
    vector<double> times, memories;
    for (auto &result : results) {
        if (result.time_ms > 0) times.push_back(result.time_ms);
        if (result.memory_mb > 0) memories.push_back(result.memory_mb);
    }

    if (!times.empty()) {
        sort(times.begin(), times.end());
        summary.total_time_ms = accumulate(times.begin(), times.end(), 0.0);
        summary.average_time_ms = summary.total_time_ms / times.size();
        size_t mid = times.size() / 2;
        summary.median_time_ms = times.size() % 2 ? times[mid] : (times[mid - 1] + times[mid]) / 2;
        summary.min_time_ms = times.front();
        summary.max_time_ms = times.back();
    }

    if (!memories.empty()) {
        summary.total_memory_mb = accumulate(memories.begin(), memories.end(), 0.0);
        summary.average_memory_mb = summary.total_memory_mb / memories.size();
        summary.peak_memory_mb = *max_element(memories.begin(), memories.end());
    }
    return summary;
}

quality_summary judge_report::quality() const {
    quality_summary summary;
    summary.total = results.size();
    double similarity = 0;
    for (auto &result : results) {
        similarity += result.similarity;
        if (result.status == status::OK)
            ++summary.passed;
        else
            ++summary.error_counts[get_short_name(result.status)];
        if (result.status == status::WRONG_ANSWER)
            ++summary.failed;
    }
    if (summary.total > 0) {
        summary.pass_rate = summary.passed * 1.0 / summary.total;
        summary.average_similarity = similarity / summary.total;
    }
    summary.correctness_score = 0.8 * summary.pass_rate + 0.2 * summary.average_similarity;
    return summary;
}

void to_json(json &j, const compile_result &result) {
    j = {{"success", result.success},
         {"stdout", result.stdout_text},
         {"stderr", result.stderr_text},
         {"exit_code", result.exit_code},
         {"compile_time_ms", result.compile_time_ms}};
}

void to_json(json &j, const test_case_result &result) {
    j = {{"id", result.id},
         {"status", get_short_name(result.status)},
         {"time_ms", result.time_ms},
         {"memory_mb", result.memory_mb},
         {"input", result.input},
         {"expected", result.expected},
         {"actual", result.actual},
         {"error", result.error},
         {"diff", nullptr},
         {"similarity", result.similarity},
         {"comparator", result.comparator},
         {"exit_code", result.exit_code},
         {"signal", result.signal}};
    if (result.diff) j["diff"] = *result.diff;
}

void to_json(json &j, const performance_summary &summary) {
    j = {{"total_time_ms", summary.total_time_ms},
         {"average_time_ms", summary.average_time_ms},
         {"median_time_ms", summary.median_time_ms},
         {"max_time_ms", summary.max_time_ms},
         {"min_time_ms", summary.min_time_ms},
         {"total_memory_mb", summary.total_memory_mb},
         {"average_memory_mb", summary.average_memory_mb},
         {"peak_memory_mb", summary.peak_memory_mb}};
}

void to_json(json &j, const quality_summary &summary) {
    j = {{"passed", summary.passed},
         {"failed", summary.failed},
         {"total", summary.total},
         {"pass_rate", summary.pass_rate},
         {"average_similarity", summary.average_similarity},
         {"correctness_score", summary.correctness_score},
         {"error_counts", summary.error_counts}};
}

void to_json(json &j, const judge_report &report) {
    j = {{"verdict", get_short_name(fold_verdict(report.verdict))},
         {"message", report.message},
         {"passed", report.passed},
         {"total", report.total},
         {"total_time_ms", report.total_time_ms},
         {"average_time_ms", report.average_time_ms},
         {"results", report.results},
         {"performance", report.performance()},
         {"quality", report.quality()}};
    if (report.compile) j["compile"] = *report.compile;
}

}  // namespace grader

#include "judge/submission.hpp"
#include <set>
#include <stdexcept>
#include "common/json_utils.hpp"

namespace grader {
using namespace std;
using namespace nlohmann;

resource_limit_overrides test_case::overrides() const {
    resource_limit_overrides result;
    if (time_limit_ms) {
        result.wall_clock_ms = time_limit_ms;
        result.cpu_time_ms = time_limit_ms;
    }
    result.memory_mb = memory_limit_mb;
    return result;
}

void from_json(const json &j, test_case &test) {
    ensure_known_keys(j, {"id", "input", "expected_output", "time_limit_ms", "memory_limit_mb", "comparison_type", "comparison_config"}, "test case");

    const json *id = find_optional(j, "id");
    if (!id) throw invalid_argument("test case is missing an id: " + j.dump());
    if (id->is_string())
        test.id = id->get<string>();
    else if (id->is_number_integer())
        test.id = to_string(id->get<int64_t>());
    else
        throw build_invalid_argument(j, "id");

    test.input = get_value_def<string>(j, "", "input");
    test.expected_output = get_value_def<string>(j, "", "expected_output");
    assign_optional(j, test.time_limit_ms, "time_limit_ms");
    assign_optional(j, test.memory_limit_mb, "memory_limit_mb");
    test.comparison_type = get_value_def<string>(j, "auto", "comparison_type");
    if (const json *config = find_optional(j, "comparison_config")) {
        if (!config->is_object()) throw build_invalid_argument(j, "comparison_config");
        test.comparison_config = *config;
    }
}

void from_json(const json &j, submission &submit) {
    ensure_known_keys(j, {"language", "source", "limits", "verbose", "test_cases"}, "submission");

    const json *language = find_optional(j, "language");
    if (!language || !language->is_string())
        throw invalid_argument("submission requires a string field language");
    submit.language = language->get<string>();
    submit.source = get_value_def<string>(j, "", "source");
    submit.verbose = get_value_def(j, false, "verbose");
    if (const json *limits = find_optional(j, "limits"))
        submit.limits = limits->get<resource_limit_overrides>();

    submit.test_cases.clear();
    set<string> ids;
    if (const json *tests = find_optional(j, "test_cases")) {
        if (!tests->is_array()) throw build_invalid_argument(j, "test_cases");
        for (auto &item : *tests) {
            test_case test = item.get<test_case>();
            if (!ids.insert(test.id).second)
                throw invalid_argument("Duplicate test case id: " + test.id);
            submit.test_cases.push_back(move(test));
        }
    }
}

}  // namespace grader

#include "compare/json.hpp"
#include <boost/algorithm/string.hpp>
#include <fmt/core.h>
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include "common/utils.hpp"

namespace grader {
using namespace std;
using namespace nlohmann;

static const char *ROOT_PATH = "$";

static string format_keys(const vector<string> &keys) {
    vector<string> quoted;
    for (auto &key : keys) quoted.push_back(quote(key));
    return "[" + boost::algorithm::join(quoted, ", ") + "]";
}

static string format_value(const json &value) {
    if (value.is_string()) return quote(value.get<string>());
    return value.dump();
}

json parse_bounded_json(const string &text) {
    // 对象和数组开始时 depth 为外层容器的个数，最外层为 0
    json::parser_callback_t limit_depth = [](int depth, json::parse_event_t event, json &) {
        if ((event == json::parse_event_t::object_start || event == json::parse_event_t::array_start) && depth >= MAX_JSON_DEPTH)
            throw length_error(fmt::format("JSON nesting exceeds {} levels", MAX_JSON_DEPTH));
        return true;
    };
    return json::parse(text, limit_depth);
}

json_comparator::json_comparator(bool ignore_order, bool ignore_extra_fields, double numeric_tolerance)
    : ignore_order(ignore_order), ignore_extra_fields(ignore_extra_fields), numeric_tolerance(numeric_tolerance) {}

void json_comparator::compare_recursive(const json &expected, const json &actual, const string &path, vector<string> &differences) const {
    // type_name 对整数和浮点数都返回 "number"
    if (string(expected.type_name()) != actual.type_name()) {
        differences.push_back(fmt::format("{}: Type mismatch - expected {}, got {}", path, expected.type_name(), actual.type_name()));
        return;
    }

    if (expected.is_object()) {
        compare_objects(expected, actual, path, differences);
    } else if (expected.is_array()) {
        compare_arrays(expected, actual, path, differences);
    } else if (expected.is_number()) {
        double e = expected.get<double>(), a = actual.get<double>();
        if (!(fabs(e - a) <= numeric_tolerance))
            differences.push_back(fmt::format("{}: Numeric mismatch - expected {}, got {}", path, expected.dump(), actual.dump()));
    } else if (expected != actual) {
        differences.push_back(fmt::format("{}: Value mismatch - expected {}, got {}", path, format_value(expected), format_value(actual)));
    }
}

void json_comparator::compare_objects(const json &expected, const json &actual, const string &path, vector<string> &differences) const {
    // nlohmann::json 的对象按键排序，因此遍历得到的键列表是有序的
    if (!ignore_extra_fields) {
        vector<string> extra_keys;
        for (auto &item : actual.items())
            if (!expected.contains(item.key())) extra_keys.push_back(item.key());
        if (!extra_keys.empty())
            differences.push_back(fmt::format("{}: Extra keys in actual: {}", path, format_keys(extra_keys)));
    }

    vector<string> missing_keys;
    for (auto &item : expected.items())
        if (!actual.contains(item.key())) missing_keys.push_back(item.key());
    if (!missing_keys.empty())
        differences.push_back(fmt::format("{}: Missing keys in actual: {}", path, format_keys(missing_keys)));

    for (auto &item : expected.items()) {
        if (!actual.contains(item.key())) continue;
        compare_recursive(item.value(), actual.at(item.key()), path + "." + item.key(), differences);
    }
}

void json_comparator::compare_arrays(const json &expected, const json &actual, const string &path, vector<string> &differences) const {
    if (expected.size() != actual.size()) {
        differences.push_back(fmt::format("{}: Length mismatch - expected {}, got {}", path, expected.size(), actual.size()));
        return;
    }

    if (ignore_order) {
        // 按规范化的序列化结果排序后逐对比较
        auto by_dump = [](const json &a, const json &b) { return a.dump() < b.dump(); };
        vector<json> exp_sorted(expected.begin(), expected.end());
        vector<json> act_sorted(actual.begin(), actual.end());
        sort(exp_sorted.begin(), exp_sorted.end(), by_dump);
        sort(act_sorted.begin(), act_sorted.end(), by_dump);
        for (size_t i = 0; i < exp_sorted.size(); ++i)
            compare_recursive(exp_sorted[i], act_sorted[i], fmt::format("{}[{}] (sorted)", path, i), differences);
    } else {
        for (size_t i = 0; i < expected.size(); ++i)
            compare_recursive(expected[i], actual[i], fmt::format("{}[{}]", path, i), differences);
    }
}

comparison_details json_comparator::compare(const string &expected, const string &actual) const {
    comparison_details details;
    try {
        json exp_json = parse_bounded_json(boost::algorithm::trim_copy(expected));
        json act_json = parse_bounded_json(boost::algorithm::trim_copy(actual));

        vector<string> differences;
        compare_recursive(exp_json, act_json, ROOT_PATH, differences);

        details.expected_parsed = exp_json;
        details.actual_parsed = act_json;
        if (differences.empty()) {
            details.verdict = comparison_verdict::MATCH;
            details.message = "JSON structures match";
            details.similarity = 1.0;
        } else {
            details.verdict = comparison_verdict::MISMATCH;
            details.message = fmt::format("{} JSON differences found", differences.size());
            details.diff = boost::algorithm::join(differences, "\n");
            details.similarity = max(0.0, 1.0 - min(1.0, differences.size() / 10.0));
        }
    } catch (json::parse_error &e) {
        details = comparison_details();
        details.verdict = comparison_verdict::ERROR;
        details.message = string("JSON parsing error: ") + e.what();
    } catch (length_error &e) {
        details = comparison_details();
        details.verdict = comparison_verdict::ERROR;
        details.message = string("JSON parsing error: ") + e.what();
    } catch (exception &e) {
        details = comparison_details();
        details.verdict = comparison_verdict::ERROR;
        details.message = string("JSON comparison error: ") + e.what();
    }
    return details;
}

string json_comparator::name() const {
    return "JSON";
}

}  // namespace grader

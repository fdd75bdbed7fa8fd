#include "compare/factory.hpp"
#include <boost/algorithm/string.hpp>
#include <optional>
#include <stdexcept>
#include <regex>
#include "common/json_utils.hpp"
#include "compare/array.hpp"
#include "compare/json.hpp"
#include "compare/numeric.hpp"
#include "compare/text.hpp"

namespace grader {
using namespace std;
using namespace nlohmann;

static unique_ptr<output_comparator> create_text(const json &config) {
    ensure_known_keys(config, {"normalize_whitespace", "ignore_trailing_whitespace", "case_sensitive"}, "text comparator");
    return make_unique<text_comparator>(
        get_value_def(config, true, "normalize_whitespace"),
        get_value_def(config, true, "ignore_trailing_whitespace"),
        get_value_def(config, true, "case_sensitive"));
}

static unique_ptr<output_comparator> create_numeric(const json &config) {
    ensure_known_keys(config, {"epsilon", "relative_tolerance", "allow_scientific_notation"}, "numeric comparator");
    double epsilon = get_value_def(config, 1e-9, "epsilon");
    double relative_tolerance = get_value_def(config, 1e-6, "relative_tolerance");
    if (epsilon < 0 || relative_tolerance < 0)
        throw invalid_argument("numeric comparator tolerances must not be negative");
    return make_unique<numeric_comparator>(epsilon, relative_tolerance,
                                           get_value_def(config, true, "allow_scientific_notation"));
}

static unique_ptr<output_comparator> create_json(const json &config) {
    ensure_known_keys(config, {"ignore_order", "ignore_extra_fields", "numeric_tolerance"}, "json comparator");
    double numeric_tolerance = get_value_def(config, 1e-9, "numeric_tolerance");
    if (numeric_tolerance < 0)
        throw invalid_argument("json comparator tolerance must not be negative");
    return make_unique<json_comparator>(
        get_value_def(config, true, "ignore_order"),
        get_value_def(config, false, "ignore_extra_fields"),
        numeric_tolerance);
}

static unique_ptr<output_comparator> create_array(const json &config) {
    ensure_known_keys(config, {"ignore_order", "ignore_brackets", "separator_pattern"}, "array comparator");
    string separator = get_value_def<string>(config, DEFAULT_ARRAY_SEPARATOR, "separator_pattern");
    try {
        return make_unique<array_comparator>(
            get_value_def(config, false, "ignore_order"),
            get_value_def(config, true, "ignore_brackets"),
            separator);
    } catch (regex_error &e) {
        throw invalid_argument("invalid separator_pattern " + separator + ": " + e.what());
    }
}

unique_ptr<output_comparator> create_comparator(const string &type, const json &config) {
    if (!config.is_null() && !config.is_object())
        throw invalid_argument("comparison_config should be an object");

    string key = boost::algorithm::to_lower_copy(type);
    if (key == "exact" || key == "text") return create_text(config);
    if (key == "numeric") return create_numeric(config);
    if (key == "json") return create_json(config);
    if (key == "array") return create_array(config);
    throw invalid_argument("Unknown comparator type: " + type);
}

bool is_auto_comparison(const string &type) {
    return type.empty() || boost::algorithm::iequals(type, "auto");
}

static optional<json> try_parse_json(const string &text) {
    try {
        return parse_bounded_json(text);
    } catch (json::parse_error &) {
        return nullopt;
    } catch (length_error &) {
        return nullopt;
    }
}

static bool is_primitive_list(const json &j) {
    if (!j.is_array()) return false;
    return all_of(j.begin(), j.end(), [](const json &x) { return x.is_primitive(); });
}

static bool is_numeric_text(const string &text) {
    vector<string> tokens;
    boost::split(tokens, text, boost::is_any_of(", \t\r\n"), boost::token_compress_on);
    size_t count = 0;
    for (auto &token : tokens) {
        if (token.empty()) continue;
        if (!is_numeric_token(token)) return false;
        ++count;
    }
    return count > 0;
}

unique_ptr<output_comparator> detect_comparator(const string &expected, const string &actual) {
    string exp_stripped = boost::algorithm::trim_copy(expected);
    string act_stripped = boost::algorithm::trim_copy(actual);
    auto exp_json = try_parse_json(exp_stripped);
    auto act_json = try_parse_json(act_stripped);

    // [1,2,3] 既是 JSON 又是列表，因此先判断是否是只包含基本类型的列表
    if (is_bracketed(exp_stripped) && is_bracketed(act_stripped)) {
        if (!exp_json || !act_json)
            return make_unique<array_comparator>();
        if (is_primitive_list(*exp_json) && is_primitive_list(*act_json))
            return make_unique<array_comparator>();
    }

    if (exp_json && act_json)
        return make_unique<json_comparator>();

    if (is_numeric_text(exp_stripped) && is_numeric_text(act_stripped))
        return make_unique<numeric_comparator>();

    return make_unique<text_comparator>();
}

unique_ptr<output_comparator> select_comparator(const string &type, const json &config,
                                                const string &expected, const string &actual) {
    if (is_auto_comparison(type)) {
        if (!config.is_null() && !config.empty())
            throw invalid_argument("comparison_config requires an explicit comparison_type");
        return detect_comparator(expected, actual);
    }
    return create_comparator(type, config);
}

}  // namespace grader

#include "compare/text.hpp"
#include <boost/algorithm/string.hpp>
#include <fmt/core.h>
#include <algorithm>
#include <cctype>
#include <vector>
#include "common/utils.hpp"

namespace grader {
using namespace std;

// 动态规划超过这个规模时改为估算
static const size_t EDIT_DISTANCE_CELL_LIMIT = 25'000'000;

// 只有两行都比较短时才给出逐字符的差异
static const size_t CHARACTER_DIFF_LINE_LIMIT = 100;

size_t edit_distance(const string &s1, const string &s2) {
    size_t len1 = s1.size(), len2 = s2.size();
    if (len1 == 0) return len2;
    if (len2 == 0) return len1;

    if (len1 * len2 > EDIT_DISTANCE_CELL_LIMIT) {
        size_t shorter = min(len1, len2);
        size_t prefix = 0;
        while (prefix < shorter && s1[prefix] == s2[prefix]) ++prefix;
        size_t suffix = 0;
        while (suffix < shorter - prefix && s1[len1 - 1 - suffix] == s2[len2 - 1 - suffix]) ++suffix;
        return max(len1, len2) - prefix - suffix;
    }

    // 只保留两行，空间复杂度为 O(len2)
    vector<size_t> prev(len2 + 1), cur(len2 + 1);
    for (size_t j = 0; j <= len2; ++j) prev[j] = j;
    for (size_t i = 1; i <= len1; ++i) {
        cur[0] = i;
        for (size_t j = 1; j <= len2; ++j)
            cur[j] = min({prev[j] + 1, cur[j - 1] + 1, prev[j - 1] + (s1[i - 1] == s2[j - 1] ? 0 : 1)});
        swap(prev, cur);
    }
    return prev[len2];
}

double text_similarity(const string &s1, const string &s2) {
    if (s1.empty() && s2.empty()) return 1.0;
    if (s1.empty() || s2.empty()) return 0.0;
    return max(0.0, 1.0 - edit_distance(s1, s2) * 1.0 / max(s1.size(), s2.size()));
}

string character_diff(const string &expected, const string &actual) {
    string result;
    size_t i = 0, j = 0;
    while (i < expected.size() || j < actual.size()) {
        if (i < expected.size() && j < actual.size()) {
            if (expected[i] == actual[j])
                result += expected[i];
            else
                result += fmt::format("[{}→{}]", expected[i], actual[j]);
            ++i, ++j;
        } else if (i < expected.size()) {
            result += fmt::format("[-{}]", expected[i++]);
        } else {
            result += fmt::format("[+{}]", actual[j++]);
        }
    }
    return result;
}

static string line_diff(const string &expected, const string &actual) {
    vector<string> exp_lines, act_lines;
    boost::split(exp_lines, expected, boost::is_any_of("\n"));
    boost::split(act_lines, actual, boost::is_any_of("\n"));

    vector<string> diff_lines;
    size_t max_lines = max(exp_lines.size(), act_lines.size());
    for (size_t i = 0; i < max_lines; ++i) {
        string exp_line = i < exp_lines.size() ? exp_lines[i] : "";
        string act_line = i < act_lines.size() ? act_lines[i] : "";
        if (exp_line == act_line) continue;

        diff_lines.push_back(fmt::format("Line {}:", i + 1));
        diff_lines.push_back("  Expected: " + quote(exp_line));
        diff_lines.push_back("  Actual:   " + quote(act_line));
        if (exp_line.size() < CHARACTER_DIFF_LINE_LIMIT && act_line.size() < CHARACTER_DIFF_LINE_LIMIT) {
            string chars = character_diff(exp_line, act_line);
            if (!chars.empty()) diff_lines.push_back("  Diff:     " + chars);
        }
    }
    if (diff_lines.empty()) return "No differences found";
    return boost::algorithm::join(diff_lines, "\n");
}

text_comparator::text_comparator(bool normalize_whitespace, bool ignore_trailing_whitespace, bool case_sensitive)
    : normalize_whitespace(normalize_whitespace),
      ignore_trailing_whitespace(ignore_trailing_whitespace),
      case_sensitive(case_sensitive) {}

string text_comparator::normalize(const string &text) const {
    string result = text;
    if (!case_sensitive) boost::algorithm::to_lower(result);
    if (ignore_trailing_whitespace) boost::algorithm::trim_right(result);
    if (normalize_whitespace) {
        boost::algorithm::trim(result);
        string collapsed;
        bool in_space = false;
        for (char ch : result) {
            if (isspace((unsigned char)ch)) {
                if (!in_space) collapsed += ' ';
                in_space = true;
            } else {
                collapsed += ch;
                in_space = false;
            }
        }
        result.swap(collapsed);
    }
    return result;
}

comparison_details text_comparator::compare(const string &expected, const string &actual) const {
    comparison_details details;
    try {
        string exp_normalized = normalize(expected);
        string act_normalized = normalize(actual);

        if (exp_normalized == act_normalized) {
            details.verdict = comparison_verdict::MATCH;
            details.message = "Output matches exactly";
            details.similarity = 1.0;
        } else {
            details.verdict = comparison_verdict::MISMATCH;
            details.similarity = text_similarity(exp_normalized, act_normalized);
            details.message = "Text mismatch (similarity: " + format_percent(details.similarity) + ")";
            details.diff = line_diff(expected, actual);
        }
    } catch (exception &e) {
        details = comparison_details();
        details.verdict = comparison_verdict::ERROR;
        details.message = string("Comparison error: ") + e.what();
    }
    return details;
}

string text_comparator::name() const {
    return "TextExact";
}

}  // namespace grader

#include "compare/numeric.hpp"
#include <strings.h>
#include <boost/algorithm/string/join.hpp>
#include <fmt/core.h>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <cstring>

namespace grader {
using namespace std;

static bool is_word_char(char c) {
    return isalnum((unsigned char)c) || c == '_';
}

static size_t count_digits(const string &text, size_t pos) {
    size_t end = pos;
    while (end < text.size() && isdigit((unsigned char)text[end])) ++end;
    return end - pos;
}

/**
 * @brief 匹配从 pos 开始的一个数，返回匹配的长度，不是数时返回 0
 * 语法为 [-+]?(\d+\.?\d*|\.\d+)([eE][-+]?\d+)?，或者带符号的整词 nan、inf、infinity（不区分大小写）。
 * 线性扫描，输出中再长的数字串也不会导致深度递归。
 */
static size_t match_number(const string &text, size_t pos, bool allow_scientific_notation) {
    size_t i = pos;
    if (i < text.size() && (text[i] == '-' || text[i] == '+')) ++i;

    if (i == 0 || !is_word_char(text[i - 1])) {
        for (const char *word : {"infinity", "inf", "nan"}) {
            size_t len = strlen(word);
            if (i + len <= text.size() && strncasecmp(text.c_str() + i, word, len) == 0 &&
                (i + len == text.size() || !is_word_char(text[i + len])))
                return i + len - pos;
        }
    }

    size_t end;
    size_t integer_digits = count_digits(text, i);
    if (integer_digits > 0) {
        end = i + integer_digits;
        if (end < text.size() && text[end] == '.') {
            ++end;
            end += count_digits(text, end);
        }
    } else if (i < text.size() && text[i] == '.' && count_digits(text, i + 1) > 0) {
        end = i + 1 + count_digits(text, i + 1);
    } else {
        return 0;
    }

    if (allow_scientific_notation && end < text.size() && (text[end] == 'e' || text[end] == 'E')) {
        size_t exp = end + 1;
        if (exp < text.size() && (text[exp] == '-' || text[exp] == '+')) ++exp;
        size_t exp_digits = count_digits(text, exp);
        if (exp_digits > 0) end = exp + exp_digits;
    }
    return end - pos;
}

bool is_numeric_token(const string &token) {
    return !token.empty() && match_number(token, 0, true) == token.size();
}

numeric_comparator::numeric_comparator(double epsilon, double relative_tolerance, bool allow_scientific_notation)
    : epsilon(epsilon), relative_tolerance(relative_tolerance), allow_scientific_notation(allow_scientific_notation) {}

vector<double> numeric_comparator::extract_numbers(const string &text) const {
    vector<double> numbers;
    for (size_t pos = 0; pos < text.size();) {
        size_t len = match_number(text, pos, allow_scientific_notation);
        if (len == 0) {
            ++pos;
            continue;
        }
        numbers.push_back(strtod(text.substr(pos, len).c_str(), nullptr));
        pos += len;
    }
    return numbers;
}

bool numeric_comparator::numbers_equal(double a, double b) const {
    if (isnan(a) || isnan(b)) return isnan(a) && isnan(b);
    if (isinf(a) || isinf(b)) return a == b;

    double abs_diff = fabs(a - b);
    if (abs_diff <= epsilon) return true;
    double max_val = max(fabs(a), fabs(b));
    return max_val > 0 && abs_diff / max_val <= relative_tolerance;
}

comparison_details numeric_comparator::compare(const string &expected, const string &actual) const {
    comparison_details details;
    try {
        vector<double> exp_numbers = extract_numbers(expected);
        vector<double> act_numbers = extract_numbers(actual);
        details.expected_parsed = exp_numbers;
        details.actual_parsed = act_numbers;

        if (exp_numbers.size() != act_numbers.size()) {
            details.verdict = comparison_verdict::MISMATCH;
            details.message = fmt::format("Different number of numeric values: expected {}, got {}", exp_numbers.size(), act_numbers.size());
            details.similarity = 0;
            return details;
        }

        vector<string> diff_lines;
        size_t mismatches = 0;
        double total_error = 0, total_distance = 0;
        for (size_t i = 0; i < exp_numbers.size(); ++i) {
            double e = exp_numbers[i], a = act_numbers[i];
            if (numbers_equal(e, a)) continue;

            ++mismatches;
            double error = fabs(e - a);
            double relative_error = error / max({fabs(e), fabs(a), 1e-10});
            total_error += error;
            if (isfinite(e) && isfinite(a))
                total_distance += error / (fabs(e) + fabs(a) + 1);
            else
                total_distance += 1;

            diff_lines.push_back(fmt::format("Value {}:", i));
            diff_lines.push_back(fmt::format("  Expected: {}", e));
            diff_lines.push_back(fmt::format("  Actual:   {}", a));
            diff_lines.push_back(fmt::format("  Abs Error: {:.2e}", error));
            diff_lines.push_back(fmt::format("  Rel Error: {:.2f}%", relative_error * 100));
        }

        if (mismatches == 0) {
            details.verdict = comparison_verdict::MATCH;
            details.message = "All numeric values match within tolerance";
            details.similarity = 1.0;
        } else {
            details.verdict = comparison_verdict::MISMATCH;
            details.message = fmt::format("{} numeric mismatches (avg error: {:.2e})", mismatches, total_error / exp_numbers.size());
            details.similarity = max(0.0, min(1.0, 1.0 - total_distance / exp_numbers.size()));
            details.diff = boost::algorithm::join(diff_lines, "\n");
        }
    } catch (exception &e) {
        details = comparison_details();
        details.verdict = comparison_verdict::ERROR;
        details.message = string("Numeric comparison error: ") + e.what();
    }
    return details;
}

string numeric_comparator::name() const {
    return "Numeric";
}

}  // namespace grader

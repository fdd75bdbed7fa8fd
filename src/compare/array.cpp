#include "compare/array.hpp"
#include <boost/algorithm/string.hpp>
#include <fmt/core.h>
#include <algorithm>
#include <set>
#include "common/utils.hpp"

namespace grader {
using namespace std;

bool is_bracketed(const string &text) {
    if (text.size() < 2) return false;
    return (text.front() == '[' && text.back() == ']') || (text.front() == '(' && text.back() == ')');
}

static string format_array(const vector<string> &array) {
    vector<string> quoted;
    for (auto &elem : array) quoted.push_back(quote(elem));
    return "[" + boost::algorithm::join(quoted, ", ") + "]";
}

static double jaccard_similarity(const vector<string> &a, const vector<string> &b) {
    if (a.empty() && b.empty()) return 1.0;
    if (a.empty() || b.empty()) return 0.0;
    set<string> sa(a.begin(), a.end()), sb(b.begin(), b.end());
    size_t intersection = count_if(sa.begin(), sa.end(), [&](const string &x) { return sb.count(x) > 0; });
    size_t union_size = sa.size() + sb.size() - intersection;
    return union_size > 0 ? intersection * 1.0 / union_size : 0.0;
}

array_comparator::array_comparator(bool ignore_order, bool ignore_brackets, const string &separator_pattern)
    : ignore_order(ignore_order), ignore_brackets(ignore_brackets) {
    if (separator_pattern != DEFAULT_ARRAY_SEPARATOR)
        separator.emplace(separator_pattern);
}

vector<string> array_comparator::parse_array(const string &text) const {
    string content = boost::algorithm::trim_copy(text);
    if (ignore_brackets && is_bracketed(content))
        content = content.substr(1, content.size() - 2);

    vector<string> pieces;
    if (separator) {
        for (sregex_token_iterator it(content.begin(), content.end(), *separator, -1), end; it != end; ++it)
            pieces.push_back(it->str());
    } else {
        boost::split(pieces, content, boost::is_any_of(", \t\n\v\f\r"), boost::token_compress_on);
    }

    vector<string> elements;
    for (auto &piece : pieces) {
        string elem = boost::algorithm::trim_copy(piece);
        boost::algorithm::trim_if(elem, boost::is_any_of("\"'"));
        if (!elem.empty()) elements.push_back(move(elem));
    }
    return elements;
}

comparison_details array_comparator::compare(const string &expected, const string &actual) const {
    comparison_details details;
    try {
        vector<string> exp_array = parse_array(expected);
        vector<string> act_array = parse_array(actual);
        if (ignore_order) {
            sort(exp_array.begin(), exp_array.end());
            sort(act_array.begin(), act_array.end());
        }

        if (exp_array == act_array) {
            details.verdict = comparison_verdict::MATCH;
            details.message = "Arrays match";
            details.similarity = 1.0;
            return details;
        }

        details.verdict = comparison_verdict::MISMATCH;
        details.similarity = jaccard_similarity(exp_array, act_array);
        if (exp_array.size() != act_array.size())
            details.message = fmt::format("Array length mismatch: expected {} elements, got {}", exp_array.size(), act_array.size());
        else
            details.message = "Array mismatch (similarity: " + format_percent(details.similarity) + ")";

        vector<string> lines;
        lines.push_back("Expected: " + format_array(exp_array));
        lines.push_back("Actual:   " + format_array(act_array));
        if (exp_array.size() != act_array.size())
            lines.push_back(fmt::format("Length difference: expected {}, got {}", exp_array.size(), act_array.size()));
        size_t max_len = max(exp_array.size(), act_array.size());
        for (size_t i = 0; i < max_len; ++i) {
            string exp_elem = i < exp_array.size() ? exp_array[i] : "<missing>";
            string act_elem = i < act_array.size() ? act_array[i] : "<extra>";
            if (exp_elem != act_elem)
                lines.push_back(fmt::format("  [{}]: {} → {}", i, quote(exp_elem), quote(act_elem)));
        }
        details.diff = boost::algorithm::join(lines, "\n");
    } catch (exception &e) {
        details = comparison_details();
        details.verdict = comparison_verdict::ERROR;
        details.message = string("Array comparison error: ") + e.what();
    }
    return details;
}

string array_comparator::name() const {
    return "Array";
}

}  // namespace grader

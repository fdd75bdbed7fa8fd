#include "common/status.hpp"
#include <boost/assign.hpp>
#include <stdexcept>
#include <unordered_map>

namespace grader {
using namespace std;

// clang-format off
static const unordered_map<status, const char *> status_string = boost::assign::map_list_of
    (status::OK, "Accepted")
    (status::TIMEOUT, "Timeout")
    (status::TIME_LIMIT_EXCEEDED, "Time Limit Exceeded")
    (status::MEMORY_LIMIT_EXCEEDED, "Memory Limit Exceeded")
    (status::OUTPUT_LIMIT_EXCEEDED, "Output Limit Exceeded")
    (status::RUNTIME_ERROR, "Runtime Error")
    (status::INTERNAL_ERROR, "Internal Error")
    (status::COMPILATION_ERROR, "Compilation Error")
    (status::WRONG_ANSWER, "Wrong Answer");

static const unordered_map<status, const char *> status_short_name = boost::assign::map_list_of
    (status::OK, "OK")
    (status::TIMEOUT, "TIMEOUT")
    (status::TIME_LIMIT_EXCEEDED, "TLE")
    (status::MEMORY_LIMIT_EXCEEDED, "MLE")
    (status::OUTPUT_LIMIT_EXCEEDED, "OLE")
    (status::RUNTIME_ERROR, "RE")
    (status::INTERNAL_ERROR, "IE")
    (status::COMPILATION_ERROR, "CE")
    (status::WRONG_ANSWER, "WA");
// clang-format on

const char *get_display_message(status stat) {
    return status_string.at(stat);
}

const char *get_short_name(status stat) {
    return status_short_name.at(stat);
}

status parse_status(const string &name) {
    for (auto &[stat, short_name] : status_short_name)
        if (name == short_name) return stat;
    throw invalid_argument("Unknown status " + name);
}

bool is_time_limit(status stat) {
    return stat == status::TIMEOUT || stat == status::TIME_LIMIT_EXCEEDED;
}

status fold_verdict(status stat) {
    return stat == status::TIMEOUT ? status::TIME_LIMIT_EXCEEDED : stat;
}

}  // namespace grader

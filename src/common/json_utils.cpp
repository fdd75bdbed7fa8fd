#include "common/json_utils.hpp"
#include <algorithm>

namespace grader {
using namespace std;
using namespace nlohmann;

void ensure_known_keys(const json &j, initializer_list<const char *> allowed, const string &context) {
    if (j.is_null()) return;
    if (!j.is_object())
        throw invalid_argument(context + " should be a json object, got " + j.dump());
    for (auto &item : j.items()) {
        const string &key = item.key();
        bool known = any_of(allowed.begin(), allowed.end(), [&key](const char *name) {
            return key == name;
        });
        if (!known)
            throw invalid_argument("Unknown option '" + key + "' for " + context);
    }
}

string dump_json(const json &j, int indent) {
    return j.dump(indent, ' ', false, json::error_handler_t::replace);
}

}  // namespace grader

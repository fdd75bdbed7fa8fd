#include "language/registry.hpp"
#include <boost/algorithm/string/case_conv.hpp>
#include <set>
#include "common/json_utils.hpp"
#include "language/java.hpp"
#include "language/javascript.hpp"
#include "language/native.hpp"
#include "language/python.hpp"

namespace grader {
using namespace std;
using namespace nlohmann;

void language_registry::add(shared_ptr<language_adapter> adapter, const vector<string> &aliases) {
    vector<string> names = aliases;
    names.push_back(adapter->name());
    for (auto &alias : names) {
        string key = boost::algorithm::to_lower_copy(alias);
        auto it = adapters.find(key);
        if (it != adapters.end() && it->second != adapter)
            throw invalid_argument("Language alias " + alias + " is already registered for " + it->second->name());
        adapters[key] = adapter;
    }
}

shared_ptr<language_adapter> language_registry::find(const string &language) const {
    auto it = adapters.find(boost::algorithm::to_lower_copy(language));
    if (it == adapters.end()) return nullptr;
    return it->second;
}

vector<string> language_registry::languages() const {
    set<string> names;
    for (auto &[alias, adapter] : adapters) names.insert(adapter->name());
    return vector<string>(names.begin(), names.end());
}

void language_registry::configure(const json &languages) {
    if (languages.is_null()) return;
    if (!languages.is_object())
        throw invalid_argument("languages section should be an object");

    for (auto &item : languages.items()) {
        auto adapter = find(item.key());
        if (!adapter)
            throw invalid_argument("Unsupported language in configuration: " + item.key());

        const json &settings = item.value();
        ensure_known_keys(settings, {"executable", "compiler", "limits"}, "languages." + item.key());

        optional<string> executable, compiler;
        assign_optional(settings, executable, "executable");
        assign_optional(settings, compiler, "compiler");
        if (executable) adapter->set_executable(*executable);
        if (compiler) adapter->set_compiler(*compiler);

        if (auto limits = find_optional(settings, "limits")) {
            resource_limit_overrides overrides = limits->get<resource_limit_overrides>();
            adapter->set_default_limits(adapter->default_limits().apply(overrides));
        }
    }
}

language_registry language_registry::with_defaults() {
    language_registry registry;
    registry.add(make_shared<python_adapter>(), {"python3", "py"});
    registry.add(make_shared<cpp_adapter>(), {"c++", "cxx"});
    registry.add(make_shared<c_adapter>());
    registry.add(make_shared<javascript_adapter>(), {"js", "node"});
    registry.add(make_shared<java_adapter>());
    return registry;
}

}  // namespace grader

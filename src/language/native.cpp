#include "language/native.hpp"
#include <boost/algorithm/string/predicate.hpp>
#include "common/utils.hpp"

namespace grader {
using namespace std;

static const char *EXECUTABLE_NAME = "app";

native_adapter::native_adapter(const string &compiler, const vector<string> &flags)
    : language_adapter(resource_limits(), string("./") + EXECUTABLE_NAME, compiler), flags(flags) {}

bool native_adapter::validate_solution(const filesystem::path &workdir) const {
    string content = read_entry(workdir);
    return boost::algorithm::contains(content, "#include") && boost::algorithm::contains(content, "main(");
}

vector<string> native_adapter::compile_command() const {
    return make_command(compiler, flags, "-o", EXECUTABLE_NAME, entry_file(), link_flags);
}

vector<string> native_adapter::run_command(const resource_limits &) const {
    return make_command(executable);
}

cpp_adapter::cpp_adapter()
    : native_adapter("g++", {"-std=c++17", "-O2"}) {}

string cpp_adapter::name() const {
    return "cpp";
}

string cpp_adapter::entry_file() const {
    return "main.cpp";
}

string cpp_adapter::template_content() const {
    return R"(#include <iostream>
#include <vector>
#include <string>
#include <algorithm>

using namespace std;

class Solution {
public:
    void solve() {
        // Write your solution here
    }
};

int main() {
    ios_base::sync_with_stdio(false);
    cin.tie(nullptr);

    Solution solution;
    solution.solve();

    return 0;
}
)";
}

c_adapter::c_adapter()
    : native_adapter("gcc", {"-std=c11", "-O2"}) {
    link_flags = {"-lm"};
}

string c_adapter::name() const {
    return "c";
}

string c_adapter::entry_file() const {
    return "main.c";
}

string c_adapter::template_content() const {
    return R"(#include <stdio.h>
#include <stdlib.h>
#include <string.h>

int main(void) {
    /* Write your solution here */
    return 0;
}
)";
}

}  // namespace grader

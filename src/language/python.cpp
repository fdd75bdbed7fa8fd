#include "language/python.hpp"
#include "common/utils.hpp"

namespace grader {
using namespace std;

python_adapter::python_adapter()
    : language_adapter(resource_limits(), "python3", "python3") {}

string python_adapter::name() const {
    return "python";
}

string python_adapter::entry_file() const {
    return "main.py";
}

string python_adapter::template_content() const {
    return R"(#!/usr/bin/env python3

def solve():
    # Write your solution here
    pass

if __name__ == "__main__":
    solve()
)";
}

bool python_adapter::validate_solution(const filesystem::path &workdir) const {
    return !is_blank(read_entry(workdir));
}

vector<string> python_adapter::compile_command() const {
    return make_command(compiler, "-m", "py_compile", entry_file());
}

vector<string> python_adapter::run_command(const resource_limits &) const {
    return make_command(executable, entry_file());
}

map<string, string> python_adapter::environment(const filesystem::path &workdir) const {
    // 固定哈希种子使 set 和 dict 的遍历顺序在多次运行之间保持一致
    return {
        {"PYTHONHASHSEED", "0"},
        {"PYTHONPATH", workdir.string()},
        {"PYTHONDONTWRITEBYTECODE", "1"},
        {"PYTHONIOENCODING", "utf-8"}};
}

}  // namespace grader

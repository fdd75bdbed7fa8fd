#include <boost/algorithm/string/predicate.hpp>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "config.hpp"
#include "gtest/gtest.h"
#include "language/registry.hpp"
#include "test/assertions.hpp"
#include "test/test_adapters.hpp"

using namespace std;
using namespace std::filesystem;
using namespace grader;

/**
 * @brief 编译步骤永远不会结束的适配器
 */
class hanging_compiler_adapter : public test::shell_adapter {
protected:
    vector<string> compile_command() const override {
        return make_command("/bin/sh", "-c", "sleep 30");
    }
};

class LanguageAdapterTest : public ::testing::Test {
protected:
    path workdir;
    language_registry registry = language_registry::with_defaults();

    void SetUp() override {
        workdir = create_unique_directory(RUN_DIR);
    }

    void TearDown() override {
        error_code ec;
        remove_all(workdir, ec);
    }

    shared_ptr<language_adapter> prepare(const string &language, const string &source) {
        auto adapter = registry.find(language);
        EXPECT_TRUE(adapter) << language;
        write_file_content(workdir / adapter->entry_file(), source);
        return adapter;
    }

    run_result run(const language_adapter &adapter, const string &input) {
        write_file_content(workdir / "test.in", input);
        return adapter.run(workdir, workdir / "test.in", workdir / "test.out", adapter.default_limits());
    }
};

TEST_F(LanguageAdapterTest, RegistryAliases) {
    EXPECT_EQ(registry.find("python")->name(), "python");
    EXPECT_EQ(registry.find("Python3")->name(), "python");
    EXPECT_EQ(registry.find("py")->name(), "python");
    EXPECT_EQ(registry.find("CPP")->name(), "cpp");
    EXPECT_EQ(registry.find("c++")->name(), "cpp");
    EXPECT_EQ(registry.find("cxx")->name(), "cpp");
    EXPECT_EQ(registry.find("c")->name(), "c");
    EXPECT_EQ(registry.find("js")->name(), "javascript");
    EXPECT_EQ(registry.find("node")->name(), "javascript");
    EXPECT_EQ(registry.find("java")->name(), "java");
    EXPECT_FALSE(registry.find("ruby"));
    EXPECT_EQ(registry.languages(), (vector<string>{"c", "cpp", "java", "javascript", "python"}));
}

TEST_F(LanguageAdapterTest, RegistryRejectsDuplicateAlias) {
    language_registry local;
    local.add(make_shared<test::shell_adapter>(), {"sh"});
    EXPECT_THROW(local.add(make_shared<test::shell_adapter>(), {"sh"}), invalid_argument);
}

TEST_F(LanguageAdapterTest, DefaultLimits) {
    EXPECT_EQ(registry.find("java")->default_limits().wall_clock_ms(), 15000);
    EXPECT_EQ(registry.find("java")->default_limits().memory_mb(), 512);
    EXPECT_EQ(registry.find("java")->default_limits().processes(), 64);
    EXPECT_EQ(registry.find("javascript")->default_limits().processes(), 64);
    EXPECT_EQ(registry.find("cpp")->default_limits(), resource_limits());
    EXPECT_EQ(registry.find("python")->default_limits(), resource_limits());
}

TEST_F(LanguageAdapterTest, Configure) {
    registry.configure(nlohmann::json::parse(R"({
        "cpp": {"compiler": "clang++", "limits": {"memory_mb": 512}},
        "py": {"executable": "python3.11"}
    })"));
    EXPECT_EQ(registry.find("cpp")->default_limits().memory_mb(), 512);
    EXPECT_EQ(registry.find("cpp")->default_limits().wall_clock_ms(), 2000);

    EXPECT_THROW(registry.configure(nlohmann::json::parse(R"({"ruby": {}})")), invalid_argument);
    EXPECT_THROW(registry.configure(nlohmann::json::parse(R"({"cpp": {"flags": "-O3"}})")), invalid_argument);
    EXPECT_THROW(registry.configure(nlohmann::json::parse(R"({"cpp": {"limits": {"memory_mb": 0}}})")), invalid_argument);
}

TEST_F(LanguageAdapterTest, Templates) {
    EXPECT_NE(registry.find("cpp")->template_content().find("class Solution"), string::npos);
    EXPECT_NE(registry.find("python")->template_content().find("def solve():"), string::npos);
    EXPECT_NE(registry.find("javascript")->template_content().find("function solve(input)"), string::npos);
    EXPECT_NE(registry.find("java")->template_content().find("public class Main"), string::npos);
    EXPECT_NE(registry.find("c")->template_content().find("int main(void)"), string::npos);
}

TEST_F(LanguageAdapterTest, TemplatesPassValidation) {
    for (auto &language : registry.languages()) {
        auto adapter = registry.find(language);
        write_file_content(workdir / adapter->entry_file(), adapter->template_content());
        EXPECT_TRUE(adapter->validate_solution(workdir)) << language;
    }
}

TEST_F(LanguageAdapterTest, ValidateSolution) {
    auto cpp = prepare("cpp", "int main() { return 0; }");
    EXPECT_FALSE(cpp->validate_solution(workdir));
    write_file_content(workdir / "main.cpp", "#include <cstdio>\nint main() { return 0; }");
    EXPECT_TRUE(cpp->validate_solution(workdir));

    auto java = prepare("java", "public class Solution { public static void main(String[] a) {} }");
    EXPECT_FALSE(java->validate_solution(workdir));

    auto python = prepare("python", "  \n\t");
    EXPECT_FALSE(python->validate_solution(workdir));
}

TEST_F(LanguageAdapterTest, MissingEntryFile) {
    for (auto &language : registry.languages()) {
        compile_result result = registry.find(language)->compile(workdir);
        EXPECT_FALSE(result.success) << language;
        EXPECT_EQ(result.exit_code, 1);
        EXPECT_EQ(result.stderr_text, "Entry file " + registry.find(language)->entry_file() + " not found");
    }
}

TEST_F(LanguageAdapterTest, MissingCompilerIsInternalError) {
    test::shell_adapter adapter;
    adapter.set_compiler("/nonexistent/codegrader-compiler");
    write_file_content(workdir / "main.sh", "echo hi");
    EXPECT_THROW(adapter.compile(workdir), internal_error);
}

TEST_F(LanguageAdapterTest, CompileTimeout) {
    int64_t limit = COMPILE_TIME_LIMIT_MS;
    COMPILE_TIME_LIMIT_MS = 1000;
    hanging_compiler_adapter adapter;
    write_file_content(workdir / "main.sh", "echo hi");
    compile_result result = adapter.compile(workdir);
    COMPILE_TIME_LIMIT_MS = limit;

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.stderr_text, "Compilation timed out after 1 seconds");
    EXPECT_GE(result.compile_time_ms, 1000);
}

TEST_F(LanguageAdapterTest, ShellCompileAndRun) {
    test::shell_adapter adapter;
    write_file_content(workdir / "main.sh", "read x\necho $((x * 2))\n");
    compile_result compiled = adapter.compile(workdir);
    EXPECT_TRUE(compiled.success);
    EXPECT_EQ(compiled.exit_code, 0);
    EXPECT_TRUE(exists(workdir / "compile.err"));

    run_result result = run(adapter, "21\n");
    EXPECT_EQ(result.status, status::OK);
    EXPECT_EQ(result.stdout_text, "42\n");

    write_file_content(workdir / "main.sh", "if then fi (\n");
    compiled = adapter.compile(workdir);
    EXPECT_FALSE(compiled.success);
    EXPECT_FALSE(compiled.stderr_text.empty());
}

TEST_F(LanguageAdapterTest, RunWritesStderrBesideStdout) {
    test::shell_adapter adapter;
    write_file_content(workdir / "main.sh", "echo out; echo err >&2\n");
    run_result result = run(adapter, "");
    EXPECT_EQ(result.stdout_text, "out\n");
    EXPECT_EQ(result.stderr_text, "err\n");
    EXPECT_EQ(read_file_content(workdir / "test.err"), "err\n");
}

TEST_F(LanguageAdapterTest, PythonCompileAndRun) {
    REQUIRE_TOOLCHAIN("python3");
    auto python = prepare("python", "import sys\nprint(sum(map(int, sys.stdin.read().split())))\n");
    EXPECT_TRUE(python->compile(workdir).success);
    EXPECT_FALSE(exists(workdir / "__pycache__"));
    run_result result = run(*python, "1 2 3\n");
    EXPECT_EQ(result.status, status::OK);
    EXPECT_EQ(result.stdout_text, "6\n");
}

TEST_F(LanguageAdapterTest, PythonSyntaxError) {
    REQUIRE_TOOLCHAIN("python3");
    auto python = prepare("python", "def broken(:\n    pass\n");
    compile_result result = python->compile(workdir);
    EXPECT_FALSE(result.success);
    EXPECT_NE(result.stderr_text.find("SyntaxError"), string::npos);
}

TEST_F(LanguageAdapterTest, PythonHashSeedIsFixed) {
    REQUIRE_TOOLCHAIN("python3");
    auto python = prepare("python", "print(list({'apple', 'banana', 'cherry', 'durian', 'elderberry'}))\n");
    run_result first = run(*python, "");
    run_result second = run(*python, "");
    EXPECT_EQ(first.status, status::OK);
    EXPECT_EQ(first.stdout_text, second.stdout_text);
}

TEST_F(LanguageAdapterTest, PythonRuntimeError) {
    REQUIRE_TOOLCHAIN("python3");
    auto python = prepare("python", "raise ValueError('boom')\n");
    run_result result = run(*python, "");
    EXPECT_EQ(result.status, status::RUNTIME_ERROR);
    EXPECT_EQ(result.exit_code, 1);
    EXPECT_NE(result.stderr_text.find("ValueError: boom"), string::npos);
}

TEST_F(LanguageAdapterTest, CppCompileAndRun) {
    REQUIRE_TOOLCHAIN("g++");
    auto cpp = prepare("cpp", R"(#include <iostream>
int main() {
    long long a, b;
    std::cin >> a >> b;
    std::cout << a + b << std::endl;
    return 0;
}
)");
    compile_result compiled = cpp->compile(workdir);
    ASSERT_TRUE(compiled.success) << compiled.stderr_text;
    EXPECT_TRUE(exists(workdir / "app"));
    run_result result = run(*cpp, "40 2\n");
    EXPECT_EQ(result.status, status::OK);
    EXPECT_EQ(result.stdout_text, "42\n");
}

TEST_F(LanguageAdapterTest, CCompileError) {
    REQUIRE_TOOLCHAIN("gcc");
    auto c = prepare("c", "#include <stdio.h>\nint main(void) { printf(\"hi\") return 0; }\n");
    compile_result compiled = c->compile(workdir);
    EXPECT_FALSE(compiled.success);
    EXPECT_NE(compiled.exit_code, 0);
    EXPECT_NE(compiled.stderr_text.find("error"), string::npos);
}

TEST_F(LanguageAdapterTest, CppSegmentationFault) {
    REQUIRE_TOOLCHAIN("g++");
    auto cpp = prepare("cpp", R"(#include <csignal>
int main() {
    std::raise(SIGSEGV);
    return 0;
}
)");
    ASSERT_TRUE(cpp->compile(workdir).success);
    run_result result = run(*cpp, "");
    EXPECT_EQ(result.status, status::RUNTIME_ERROR);
    EXPECT_EQ(result.signal, SIGSEGV);
}

TEST_F(LanguageAdapterTest, JavaScriptCompileAndRun) {
    REQUIRE_TOOLCHAIN("node");
    auto js = prepare("javascript", "const fs = require('fs');\nconst x = fs.readFileSync(0, 'utf8').trim();\nconsole.log(x.split('').reverse().join(''));\n");
    EXPECT_TRUE(js->compile(workdir).success);
    run_result result = run(*js, "abc\n");
    EXPECT_EQ(result.status, status::OK) << result.stderr_text;
    EXPECT_EQ(result.stdout_text, "cba\n");
}

TEST_F(LanguageAdapterTest, JavaCompileAndRun) {
    REQUIRE_TOOLCHAIN("javac");
    REQUIRE_TOOLCHAIN("java");
    auto java = prepare("java", R"(import java.util.Scanner;

public class Main {
    public static void main(String[] args) {
        Scanner in = new Scanner(System.in);
        System.out.println(in.nextInt() * 3);
    }
}
)");
    compile_result compiled = java->compile(workdir);
    ASSERT_TRUE(compiled.success) << compiled.stderr_text;
    run_result result = run(*java, "14\n");
    EXPECT_EQ(result.status, status::OK) << result.stderr_text;
    EXPECT_EQ(result.stdout_text, "42\n");
}

#include <boost/algorithm/string/predicate.hpp>
#include "common/exceptions.hpp"
#include "config.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "judge/orchestrator.hpp"
#include "test/assertions.hpp"
#include "test/test_adapters.hpp"

using namespace std;
using namespace std::filesystem;
using namespace grader;
using ::testing::_;
using ::testing::Invoke;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::Throw;

static test_case make_test(const string &id, const string &input, const string &expected) {
    test_case test;
    test.id = id;
    test.input = input;
    test.expected_output = expected;
    return test;
}

/**
 * @brief RUN_DIR 中剩余的临时目录数
 */
static size_t scratch_count() {
    size_t count = 0;
    for (auto &entry : directory_iterator(RUN_DIR)) {
        (void)entry;
        ++count;
    }
    return count;
}

class OrchestratorTest : public ::testing::Test {
protected:
    language_registry registry;

    void SetUp() override {
        registry.add(make_shared<test::shell_adapter>(), {"sh"});
        // 每个测试开始时 RUN_DIR 中不应该有其他测试遗留的目录
        for (auto &entry : directory_iterator(RUN_DIR)) remove_all(entry.path());
    }

    submission shell_submission(const string &source) {
        submission submit;
        submit.language = "shell";
        submit.source = source;
        return submit;
    }
};

TEST_F(OrchestratorTest, AllTestsPass) {
    submission submit = shell_submission("read x\necho $((x * x))\n");
    submit.test_cases = {make_test("1", "2\n", "4"), make_test("2", "3\n", "9"), make_test("3", "12\n", "144\n")};

    execution_orchestrator orchestrator(registry, 2);
    judge_report report = orchestrator.grade(submit);

    EXPECT_EQ(report.verdict, status::OK);
    EXPECT_EQ(report.passed, 3u);
    EXPECT_EQ(report.total, 3u);
    ASSERT_EQ(report.results.size(), 3u);
    for (auto &row : report.results) {
        EXPECT_EQ(row.status, status::OK) << row.id << ": " << row.error;
        EXPECT_DOUBLE_EQ(row.similarity, 1.0);
        EXPECT_FALSE(row.diff);
        EXPECT_EQ(row.comparator, "JSON");
    }
    EXPECT_FALSE(report.compile);
    EXPECT_EQ(report.message, "All 3 test cases passed");
    EXPECT_EQ(scratch_count(), 0u);
}

TEST_F(OrchestratorTest, ResultsKeepCallerOrderUnderConcurrency) {
    // 前面的测试点睡得更久，因此会更晚结束
    submission submit = shell_submission("read x\nsleep \"0.$((9 - x))\"\necho $x\n");
    for (int i = 0; i < 8; ++i)
        submit.test_cases.push_back(make_test("case-" + to_string(i), to_string(i) + "\n", to_string(i)));

    execution_orchestrator orchestrator(registry, 8);
    judge_report report = orchestrator.grade(submit);

    ASSERT_EQ(report.results.size(), 8u);
    for (int i = 0; i < 8; ++i) {
        EXPECT_EQ(report.results[i].id, "case-" + to_string(i));
        EXPECT_EQ(report.results[i].actual, to_string(i) + "\n");
        EXPECT_EQ(report.results[i].status, status::OK);
    }
    EXPECT_EQ(report.verdict, status::OK);
}

TEST_F(OrchestratorTest, WrongAnswerCarriesDiff) {
    submission submit = shell_submission("echo 0\n");
    submit.test_cases = {make_test("1", "", "0"), make_test("2", "", "120")};
    submit.test_cases[1].comparison_type = "exact";

    judge_report report = execution_orchestrator(registry).grade(submit);
    EXPECT_EQ(report.verdict, status::WRONG_ANSWER);
    EXPECT_EQ(report.passed, 1u);
    ASSERT_EQ(report.results.size(), 2u);
    EXPECT_EQ(report.results[0].status, status::OK);

    auto &row = report.results[1];
    EXPECT_EQ(row.status, status::WRONG_ANSWER);
    EXPECT_EQ(row.comparator, "TextExact");
    ASSERT_TRUE(row.diff);
    EXPECT_NE(row.diff->find("Expected: '120'"), string::npos);
    EXPECT_GT(row.similarity, 0);
    EXPECT_LT(row.similarity, 1);
    EXPECT_TRUE(boost::algorithm::starts_with(row.error, "Text mismatch"));
}

TEST_F(OrchestratorTest, FirstFailureDecidesVerdict) {
    submission submit = shell_submission("read x\nif [ \"$x\" = crash ]; then exit 7; fi\necho $x\n");
    submit.test_cases = {make_test("a", "ok\n", "ok"), make_test("b", "crash\n", "crash"), make_test("c", "bad\n", "good")};

    judge_report report = execution_orchestrator(registry, 3).grade(submit);
    EXPECT_EQ(report.verdict, status::RUNTIME_ERROR);
    EXPECT_EQ(report.passed, 1u);
    EXPECT_EQ(report.results[1].status, status::RUNTIME_ERROR);
    EXPECT_EQ(report.results[1].exit_code, 7);
    EXPECT_EQ(report.results[1].error, "Process exited with code 7");
    EXPECT_EQ(report.results[2].status, status::WRONG_ANSWER);
}

TEST_F(OrchestratorTest, TimeoutFoldsIntoTimeLimitExceeded) {
    submission submit = shell_submission("read x\nif [ \"$x\" = loop ]; then sleep 30; fi\necho $x\n");
    submit.test_cases = {make_test("fast", "1\n", "1"), make_test("slow", "loop\n", "loop")};
    submit.test_cases[1].time_limit_ms = 500;

    judge_report report = execution_orchestrator(registry, 2).grade(submit);
    EXPECT_EQ(report.verdict, status::TIME_LIMIT_EXCEEDED);
    ASSERT_EQ(report.results.size(), 2u);
    EXPECT_EQ(report.results[1].status, status::TIMEOUT);
    EXPECT_GE(report.results[1].time_ms, 500);
    EXPECT_EQ(report.results[1].error, "Time limit exceeded: killed after 500 ms wall clock");

    nlohmann::json j = report;
    EXPECT_EQ(j["verdict"], "TLE");
    EXPECT_EQ(j["results"][1]["status"], "TIMEOUT");
    EXPECT_EQ(scratch_count(), 0u);
}

TEST_F(OrchestratorTest, CompilationErrorRunsNoTests) {
    submission submit = shell_submission("if then fi (\n");
    submit.test_cases = {make_test("1", "", "")};

    judge_report report = execution_orchestrator(registry).grade(submit);
    EXPECT_EQ(report.verdict, status::COMPILATION_ERROR);
    EXPECT_TRUE(report.results.empty());
    EXPECT_EQ(report.passed, 0u);
    ASSERT_TRUE(report.compile);
    EXPECT_FALSE(report.compile->success);
    EXPECT_FALSE(report.compile->stderr_text.empty());
    EXPECT_EQ(scratch_count(), 0u);
}

TEST_F(OrchestratorTest, VerboseAttachesCompileLog) {
    submission submit = shell_submission("echo hi\n");
    submit.test_cases = {make_test("1", "", "hi")};
    EXPECT_FALSE(execution_orchestrator(registry).grade(submit).compile);

    submit.verbose = true;
    judge_report report = execution_orchestrator(registry).grade(submit);
    ASSERT_TRUE(report.compile);
    EXPECT_TRUE(report.compile->success);
}

TEST_F(OrchestratorTest, UnsupportedLanguage) {
    submission submit;
    submit.language = "cobol";
    submit.test_cases = {make_test("1", "", ""), make_test("2", "", "")};

    judge_report report = execution_orchestrator(registry).grade(submit);
    EXPECT_EQ(report.verdict, status::INTERNAL_ERROR);
    EXPECT_EQ(report.message, "Unsupported language: cobol");
    ASSERT_EQ(report.results.size(), 2u);
    for (auto &row : report.results)
        EXPECT_EQ(row.status, status::INTERNAL_ERROR);
    EXPECT_EQ(scratch_count(), 0u);
}

TEST_F(OrchestratorTest, InvalidComparisonConfigIsInternalError) {
    submission submit = shell_submission("echo 1\n");
    submit.test_cases = {make_test("1", "", "1"), make_test("2", "", "1")};
    submit.test_cases[0].comparison_type = "levenshtein";
    submit.test_cases[1].comparison_type = "numeric";
    submit.test_cases[1].comparison_config = {{"precision", 3}};

    judge_report report = execution_orchestrator(registry).grade(submit);
    EXPECT_EQ(report.verdict, status::INTERNAL_ERROR);
    EXPECT_EQ(report.results[0].status, status::INTERNAL_ERROR);
    EXPECT_EQ(report.results[1].status, status::INTERNAL_ERROR);
    EXPECT_NE(report.results[0].error.find("Unknown comparator type: levenshtein"), string::npos);
}

TEST_F(OrchestratorTest, InvalidTestLimitIsInternalError) {
    submission submit = shell_submission("echo 1\n");
    submit.test_cases = {make_test("1", "", "1")};
    submit.test_cases[0].time_limit_ms = 0;

    judge_report report = execution_orchestrator(registry).grade(submit);
    ASSERT_EQ(report.results.size(), 1u);
    EXPECT_EQ(report.results[0].status, status::INTERNAL_ERROR);
}

TEST_F(OrchestratorTest, LimitPrecedence) {
    // 题目级别的限制覆盖语言默认值，测试点级别的限制覆盖题目级别
    submission submit = shell_submission("sleep 1\necho done\n");
    submit.limits.wall_clock_ms = 300;
    submit.limits.cpu_time_ms = 300;
    submit.test_cases = {make_test("submission-limit", "", "done"), make_test("test-limit", "", "done")};
    submit.test_cases[1].time_limit_ms = 3000;

    judge_report report = execution_orchestrator(registry, 2).grade(submit);
    EXPECT_EQ(report.results[0].status, status::TIMEOUT);
    EXPECT_EQ(report.results[1].status, status::OK);
}

TEST_F(OrchestratorTest, EmptyTestList) {
    judge_report report = execution_orchestrator(registry).grade(shell_submission("echo hi\n"));
    EXPECT_EQ(report.verdict, status::OK);
    EXPECT_EQ(report.total, 0u);
    EXPECT_TRUE(report.results.empty());
}

TEST_F(OrchestratorTest, CompileExceptionBecomesInternalError) {
    auto adapter = make_shared<NiceMock<test::mock_adapter>>();
    ON_CALL(*adapter, name()).WillByDefault(Return("mock"));
    ON_CALL(*adapter, entry_file()).WillByDefault(Return("main.mock"));
    EXPECT_CALL(*adapter, compile(_)).WillOnce(Throw(internal_error("compiler vanished")));
    EXPECT_CALL(*adapter, run(_, _, _, _)).Times(0);

    language_registry local;
    local.add(adapter);

    submission submit;
    submit.language = "mock";
    submit.test_cases = {make_test("1", "", ""), make_test("2", "", "")};

    judge_report report = execution_orchestrator(local).grade(submit);
    EXPECT_EQ(report.verdict, status::INTERNAL_ERROR);
    ASSERT_EQ(report.results.size(), 2u);
    EXPECT_EQ(report.results[0].error, "Internal error: compiler vanished");
    EXPECT_EQ(scratch_count(), 0u);
}

TEST_F(OrchestratorTest, RunExceptionBecomesInternalErrorRow) {
    auto adapter = make_shared<NiceMock<test::mock_adapter>>();
    ON_CALL(*adapter, name()).WillByDefault(Return("mock"));
    ON_CALL(*adapter, entry_file()).WillByDefault(Return("main.mock"));
    compile_result compiled;
    compiled.success = true;
    compiled.exit_code = 0;
    EXPECT_CALL(*adapter, compile(_)).WillOnce(Return(compiled));

    path seen_workdir;
    EXPECT_CALL(*adapter, run(_, _, _, _))
        .WillOnce(Invoke([&](const path &workdir, const path &stdin_file, const path &, const resource_limits &) {
            seen_workdir = workdir;
            EXPECT_TRUE(exists(workdir / "main.mock"));
            EXPECT_TRUE(exists(stdin_file));
            run_result result;
            result.status = status::OK;
            result.exit_code = 0;
            result.stdout_text = "fine\n";
            return result;
        }))
        .WillOnce(Throw(system_error(make_error_code(errc::no_space_on_device), "disk full")));

    language_registry local;
    local.add(adapter);

    submission submit;
    submit.language = "mock";
    submit.source = "whatever";
    submit.test_cases = {make_test("1", "in", "fine"), make_test("2", "in", "fine")};

    judge_report report = execution_orchestrator(local).grade(submit);
    ASSERT_EQ(report.results.size(), 2u);
    EXPECT_EQ(report.results[0].status, status::OK);
    EXPECT_EQ(report.results[1].status, status::INTERNAL_ERROR);
    EXPECT_TRUE(boost::algorithm::starts_with(report.results[1].error, "Internal error: disk full"));
    EXPECT_EQ(report.verdict, status::INTERNAL_ERROR);
    EXPECT_FALSE(seen_workdir.empty());
    EXPECT_FALSE(exists(seen_workdir));
}

TEST_F(OrchestratorTest, ValidateSyntax) {
    execution_orchestrator orchestrator(registry);

    syntax_check ok = orchestrator.validate_syntax("sh", "echo hi\n");
    EXPECT_TRUE(ok.valid);
    EXPECT_TRUE(ok.structure_ok);
    EXPECT_EQ(ok.message, "Syntax OK");

    syntax_check broken = orchestrator.validate_syntax("shell", "if then fi (\n");
    EXPECT_FALSE(broken.valid);
    EXPECT_FALSE(broken.message.empty());

    syntax_check unsupported = orchestrator.validate_syntax("cobol", "");
    EXPECT_FALSE(unsupported.valid);
    EXPECT_EQ(unsupported.message, "Unsupported language: cobol");
    EXPECT_EQ(scratch_count(), 0u);
}

#include <atomic>
#include <thread>
#include "common/exceptions.hpp"
#include "gtest/gtest.h"
#include "sandbox/test_harness.hpp"
#include "test/assertions.hpp"
#include "test/mock_executor.hpp"

using namespace std;
using namespace runbox;
using namespace runbox::test;
using ::testing::_;
using ::testing::Field;
using ::testing::Invoke;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::StrictMock;
using ::testing::Throw;

static const char *SUM_CODE = "a, b = map(int, input().split())\nprint(a + b)";

static test_case make_case(const string &input, const string &expected, bool hidden = false) {
    test_case test;
    test.input = input;
    test.expected_output = expected;
    test.is_hidden = hidden;
    return test;
}

TEST(TestHarnessTest, NormalizeOutput) {
    EXPECT_EQ(normalize_output("8\r\n"), "8");
    EXPECT_EQ(normalize_output("8\n"), "8");
    EXPECT_EQ(normalize_output(" 8 "), "8");
    EXPECT_EQ(normalize_output("1\r\n2\r\n"), "1\n2");
    EXPECT_EQ(normalize_output(""), "");
}

TEST(TestHarnessTest, SumTestPasses) {
    StrictMock<mock_executor> exec;
    EXPECT_CALL(exec, execute(Field(&execution_request::stdin_text, optional<string>("3 5"))))
        .WillOnce(Return(output_result("8")));

    test_harness harness(exec, chrono::milliseconds(5000));
    test_run_summary summary = harness.run_tests(SUM_CODE, "python", {make_case("3 5", "8")});
    EXPECT_EQ(summary.total, 1);
    EXPECT_EQ(summary.passed, 1);
    ASSERT_EQ(summary.results.size(), 1);
    EXPECT_TRUE(summary.results[0].passed);
    EXPECT_EQ(summary.results[0].input, "3 5");
    EXPECT_EQ(summary.results[0].actual_output, "8");
    EXPECT_FALSE(summary.results[0].error.has_value());
}

TEST(TestHarnessTest, ResultsKeepOrder) {
    NiceMock<mock_executor> exec;
    EXPECT_CALL(exec, execute(_))
        .WillOnce(Return(output_result("2")))
        .WillOnce(Return(output_result("5")))
        .WillOnce(Return(output_result("100")));

    test_harness harness(exec, chrono::milliseconds(5000));
    test_run_summary summary = harness.run_tests(SUM_CODE, "python",
                                                 {make_case("1 1", "2"), make_case("2 2", "4"), make_case("50 50", "100\r\n")});
    EXPECT_EQ(summary.total, 3);
    EXPECT_EQ(summary.passed, 2);
    for (size_t i = 0; i < summary.results.size(); ++i)
        EXPECT_EQ(summary.results[i].index, i);
    EXPECT_TRUE(summary.results[0].passed);
    EXPECT_FALSE(summary.results[1].passed);
    EXPECT_EQ(summary.results[1].actual_output, "5");
    EXPECT_TRUE(summary.results[2].passed);
}

TEST(TestHarnessTest, HiddenCasesAreRedacted) {
    NiceMock<mock_executor> exec;
    EXPECT_CALL(exec, execute(_))
        .WillOnce(Return(output_result("42")))
        .WillOnce(Return(output_result("41")));

    test_harness harness(exec, chrono::milliseconds(5000));
    test_run_summary summary = harness.run_tests(SUM_CODE, "python",
                                                 {make_case("40 2", "42", true), make_case("40 2", "secret 42", true)});
    EXPECT_EQ(summary.results[0].input, "(hidden)");
    EXPECT_EQ(summary.results[0].actual_output, "(correct)");
    EXPECT_EQ(summary.results[1].input, "(hidden)");
    EXPECT_EQ(summary.results[1].actual_output, "(incorrect)");
}

TEST(TestHarnessTest, HiddenStderrDoesNotLeakInput) {
    NiceMock<mock_executor> exec;
    ON_CALL(exec, execute(_)).WillByDefault(Invoke([](const execution_request &request) {
        return output_result("", "echo:" + request.stdin_text.value_or(""));
    }));

    test_harness harness(exec, chrono::milliseconds(5000));
    test_run_summary summary = harness.run_tests("import sys; sys.stderr.write(input())", "python",
                                                 {make_case("secret-input", "x", true), make_case("visible", "x")});
    EXPECT_EQ(summary.results[0].input, "(hidden)");
    EXPECT_EQ(summary.results[0].actual_output, "(incorrect)");
    EXPECT_EQ(summary.results[0].error, optional<string>("Runtime error"));
    EXPECT_EQ(nlohmann::json(summary).dump().find("secret-input"), string::npos);

    EXPECT_EQ(summary.results[1].error, optional<string>("echo:visible"));
}

TEST(TestHarnessTest, HiddenTimeoutKeepsMessage) {
    NiceMock<mock_executor> exec;
    execution_result timeout;
    timeout.status = execution_status::TIMEOUT;
    timeout.stderr_text = "Execution timed out (maximum 10 seconds allowed)";
    EXPECT_CALL(exec, execute(_)).WillOnce(Return(timeout));

    test_harness harness(exec, chrono::milliseconds(5000));
    test_run_summary summary = harness.run_tests("while True: pass", "python", {make_case("1", "1", true)});
    EXPECT_EQ(summary.results[0].error, optional<string>("Execution timed out (maximum 10 seconds allowed)"));
}

TEST(TestHarnessTest, StderrFailsTheCase) {
    NiceMock<mock_executor> exec;
    EXPECT_CALL(exec, execute(_)).WillOnce(Return(output_result("8", "DeprecationWarning: old api")));

    test_harness harness(exec, chrono::milliseconds(5000));
    test_run_summary summary = harness.run_tests(SUM_CODE, "python", {make_case("3 5", "8")});
    EXPECT_FALSE(summary.results[0].passed);
    EXPECT_EQ(summary.results[0].actual_output, "DeprecationWarning: old api");
    EXPECT_EQ(summary.results[0].error, optional<string>("DeprecationWarning: old api"));
    EXPECT_EQ(summary.passed, 0);
}

TEST(TestHarnessTest, TimeoutResultFailsTheCase) {
    NiceMock<mock_executor> exec;
    execution_result timeout;
    timeout.status = execution_status::TIMEOUT;
    timeout.stderr_text = "Execution timed out (maximum 10 seconds allowed)";
    EXPECT_CALL(exec, execute(_)).WillOnce(Return(timeout));

    test_harness harness(exec, chrono::milliseconds(5000));
    test_run_summary summary = harness.run_tests("while True: pass", "python", {make_case("", "")});
    EXPECT_FALSE(summary.results[0].passed);
    EXPECT_EQ(summary.results[0].error, optional<string>("Execution timed out (maximum 10 seconds allowed)"));
}

TEST(TestHarnessTest, EmptyInputMeansNoStdin) {
    StrictMock<mock_executor> exec;
    EXPECT_CALL(exec, execute(Field(&execution_request::stdin_text, optional<string>())))
        .WillOnce(Return(output_result("Hello")));

    test_harness harness(exec, chrono::milliseconds(5000));
    EXPECT_EQ(harness.run_tests("print('Hello')", "python", {make_case("", "Hello")}).passed, 1);
}

TEST(TestHarnessTest, RequestCarriesCodeLanguageAndMode) {
    StrictMock<mock_executor> exec;
    EXPECT_CALL(exec, execute(_)).WillOnce(Invoke([](const execution_request &request) {
        EXPECT_EQ(request.code, "console.log(1)");
        EXPECT_EQ(request.language, "javascript");
        EXPECT_EQ(request.mode, container_mode::PERSISTENT);
        return output_result("1");
    }));

    test_harness harness(exec, chrono::milliseconds(5000), container_mode::PERSISTENT);
    harness.run_tests("console.log(1)", "javascript", {make_case("", "1")});
}

TEST(TestHarnessTest, ValidationErrors) {
    StrictMock<mock_executor> exec;
    test_harness harness(exec, chrono::milliseconds(5000));
    EXPECT_THROW(harness.run_tests("", "python", {make_case("", "")}), validation_error);
    EXPECT_THROW(harness.run_tests("  \n", "python", {make_case("", "")}), validation_error);
    EXPECT_THROW(harness.run_tests(SUM_CODE, "python", {}), validation_error);
}

TEST(TestHarnessTest, ValidationErrorFromExecutorPropagates) {
    NiceMock<mock_executor> exec;
    EXPECT_CALL(exec, execute(_)).WillOnce(Throw(validation_error("Code is too long (maximum 50000 bytes allowed)")));

    test_harness harness(exec, chrono::milliseconds(5000));
    EXPECT_THROW(harness.run_tests(SUM_CODE, "python", {make_case("1 2", "3"), make_case("2 3", "5")}), validation_error);
}

TEST(TestHarnessTest, ExecutorErrorFailsOnlyThatCase) {
    NiceMock<mock_executor> exec;
    EXPECT_CALL(exec, execute(_))
        .WillOnce(Throw(internal_error("engine went away")))
        .WillOnce(Return(output_result("5")));

    test_harness harness(exec, chrono::milliseconds(5000));
    test_run_summary summary = harness.run_tests(SUM_CODE, "python", {make_case("1 2", "3", true), make_case("2 3", "5")});
    EXPECT_FALSE(summary.results[0].passed);
    EXPECT_EQ(summary.results[0].actual_output, "(incorrect)");
    EXPECT_EQ(summary.results[0].error, optional<string>("engine went away"));
    EXPECT_TRUE(summary.results[1].passed);
}

TEST(TestHarnessTest, OuterGuardWaitsForSlowRun) {
    NiceMock<mock_executor> exec;
    EXPECT_CALL(exec, execute(_))
        .WillOnce(Invoke([](const execution_request &) {
            this_thread::sleep_for(chrono::milliseconds(500));
            return output_result("3");
        }))
        .WillOnce(Return(output_result("5")));

    elapsed_time timer;
    test_harness harness(exec, chrono::milliseconds(100));
    test_run_summary summary = harness.run_tests(SUM_CODE, "python", {make_case("1 2", "3"), make_case("2 3", "5")});
    // 第二个用例要等第一个用例的运行结束后才开始
    EXPECT_GE(timer.milliseconds(), 500);

    EXPECT_EQ(summary.total, 2);
    EXPECT_EQ(summary.passed, 1);
    EXPECT_FALSE(summary.results[0].passed);
    EXPECT_EQ(summary.results[0].actual_output, "");
    EXPECT_EQ(summary.results[0].error, optional<string>("Test execution timeout (0.1 seconds)"));
    EXPECT_TRUE(summary.results[1].passed);
}

TEST(TestHarnessTest, CasesNeverOverlapInPersistentContainer) {
    atomic<int> running(0), max_running(0);
    NiceMock<mock_executor> exec;
    ON_CALL(exec, execute(_)).WillByDefault(Invoke([&](const execution_request &request) {
        int now = ++running;
        int seen = max_running.load();
        while (now > seen && !max_running.compare_exchange_weak(seen, now)) {}
        this_thread::sleep_for(chrono::milliseconds(request.stdin_text == optional<string>("slow") ? 400 : 20));
        --running;
        return output_result("ok");
    }));

    test_harness harness(exec, chrono::milliseconds(100), container_mode::PERSISTENT);
    test_run_summary summary = harness.run_tests(SUM_CODE, "python",
                                                 {make_case("slow", "ok"), make_case("fast", "ok"), make_case("slow", "ok")});
    EXPECT_EQ(max_running.load(), 1);
    EXPECT_EQ(summary.passed, 1);
    EXPECT_TRUE(summary.results[1].passed);
}

TEST(TestHarnessTest, SummaryToJson) {
    test_run_summary summary;
    summary.total = 2;
    summary.passed = 1;

    test_case_result first;
    first.index = 0;
    first.passed = true;
    first.input = "3 5";
    first.actual_output = "8";
    summary.results.push_back(first);

    test_case_result second;
    second.index = 1;
    second.input = "(hidden)";
    second.actual_output = "(incorrect)";
    second.error = "Test execution timeout (10 seconds)";
    summary.results.push_back(second);

    nlohmann::json actual = summary;
    nlohmann::json expected = nlohmann::json::parse(R"json({
        "total": 2,
        "passed": 1,
        "results": [
            {"index": 0, "passed": true, "input": "3 5", "actualOutput": "8"},
            {"index": 1, "passed": false, "input": "(hidden)", "actualOutput": "(incorrect)", "error": "Test execution timeout (10 seconds)"}
        ]
    })json");
    EXPECT_JSON_EQ(actual, expected);
}

TEST(TestHarnessTest, TestCaseFromJson) {
    auto cases = nlohmann::json::parse(R"([
        {"input": "3 5", "expectedOutput": "8"},
        {"input": "", "expectedOutput": "Hello", "isHidden": true}
    ])").get<vector<test_case>>();
    ASSERT_EQ(cases.size(), 2);
    EXPECT_EQ(cases[0].input, "3 5");
    EXPECT_EQ(cases[0].expected_output, "8");
    EXPECT_FALSE(cases[0].is_hidden);
    EXPECT_TRUE(cases[1].is_hidden);
}

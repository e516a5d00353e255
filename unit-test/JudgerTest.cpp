#include <boost/algorithm/string.hpp>
#include <filesystem>
#include <limits>
#include <memory>
#include "common/exceptions.hpp"
#include "config.hpp"
#include "gtest/gtest.h"
#include "judge/executor.hpp"
#include "judge/judger.hpp"
#include "test/environment.hpp"
#include "test/fake_toolchain.hpp"

using namespace std;
using namespace codejudge;
namespace fs = std::filesystem;

static const string DOUBLE_PROGRAM = "read n\necho $((n * 2))";

class JudgerTest : public ::testing::Test {
protected:
    static void SetUpTestCase() {
        setup_test_environment();
    }

    judge_request prepare(const string &language = "c") {
        judge_request request;
        request.language = language;
        request.code = "int main() { return 0; }\n";
        request.problem.id = "1";
        request.problem.title = "Double the Number";
        request.problem.time_limit = 1000;
        request.problem.memory_limit = 64;
        request.problem.test_cases = {{"5\n", "10\n", false}, {"10\n", "20\n", true}};
        return request;
    }
};

TEST_F(JudgerTest, AcceptedTest) {
    auto chain = make_shared<mock::counting_toolchain>(DOUBLE_PROGRAM);
    judger j(chain);

    auto response = j.judge(prepare());
    EXPECT_TRUE(response.success);
    EXPECT_EQ(response.status, overall_status::OK);
    EXPECT_FALSE(response.error);
    ASSERT_TRUE(response.result);

    auto &result = *response.result;
    EXPECT_EQ(result.problem_id, "1");
    EXPECT_TRUE(result.compilation_successful);
    EXPECT_FALSE(result.compilation_error);
    EXPECT_EQ(result.total_test_cases, 2u);
    EXPECT_EQ(result.passed_test_cases, 2u);
    EXPECT_DOUBLE_EQ(result.score, 100.0);
    EXPECT_TRUE(result.compile_time_ms);
    EXPECT_TRUE(result.executable_size_bytes);
    EXPECT_FALSE(result.cached);

    ASSERT_EQ(result.test_case_results.size(), 2u);
    for (size_t i = 0; i < 2; ++i) {
        EXPECT_EQ(result.test_case_results[i].test_case_id, i);
        EXPECT_TRUE(result.test_case_results[i].passed);
    }
    EXPECT_EQ(result.test_case_results[0].actual_output, "10\n");
    EXPECT_EQ(result.test_case_results[1].actual_output, "20\n");
    EXPECT_EQ(result.test_case_results[1].expected_output, "20\n");
}

TEST_F(JudgerTest, WrongAnswerTest) {
    auto chain = make_shared<mock::counting_toolchain>(DOUBLE_PROGRAM);
    judger j(chain);

    auto request = prepare();
    request.problem.test_cases[1].expected_output = "21\n";
    auto response = j.judge(request);

    EXPECT_TRUE(response.success);
    EXPECT_EQ(response.status, overall_status::OK);
    ASSERT_TRUE(response.result);
    EXPECT_EQ(response.result->passed_test_cases, 1u);
    EXPECT_DOUBLE_EQ(response.result->score, 50.0);
    EXPECT_TRUE(response.result->test_case_results[0].passed);
    EXPECT_FALSE(response.result->test_case_results[1].passed);
    EXPECT_TRUE(response.result->test_case_results[1].result.success);
}

TEST_F(JudgerTest, TimeoutTest) {
    auto chain = make_shared<mock::counting_toolchain>("sleep 5");
    judger j(chain);

    auto request = prepare();
    request.problem.time_limit = 200;
    auto response = j.judge(request);

    EXPECT_TRUE(response.success);
    EXPECT_EQ(response.status, overall_status::TIMEOUT);
    ASSERT_TRUE(response.result);
    EXPECT_DOUBLE_EQ(response.result->score, 0.0);
    for (auto &tcr : response.result->test_case_results) {
        EXPECT_FALSE(tcr.passed);
        EXPECT_EQ(tcr.result.error, TIME_LIMIT_EXCEEDED_MESSAGE);
    }
}

TEST_F(JudgerTest, RuntimeErrorTest) {
    auto chain = make_shared<mock::counting_toolchain>("echo 'Segmentation fault' >&2\nexit 139");
    judger j(chain);

    auto response = j.judge(prepare());
    EXPECT_TRUE(response.success);
    EXPECT_EQ(response.status, overall_status::RUNTIME_ERROR);
    ASSERT_TRUE(response.result);
    EXPECT_EQ(response.result->passed_test_cases, 0u);
    EXPECT_EQ(response.result->test_case_results[0].result.exit_code, 139);
}

TEST_F(JudgerTest, SilentFailureTest) {
    // 非零退出但没有错误输出时只体现在分数上
    auto chain = make_shared<mock::counting_toolchain>("exit 1");
    judger j(chain);

    auto response = j.judge(prepare());
    EXPECT_TRUE(response.success);
    EXPECT_EQ(response.status, overall_status::OK);
    ASSERT_TRUE(response.result);
    EXPECT_DOUBLE_EQ(response.result->score, 0.0);
}

TEST_F(JudgerTest, TimeoutBeforeRuntimeErrorTest) {
    auto chain = make_shared<mock::counting_toolchain>(
        "read n\nif [ \"$n\" = 5 ]; then echo crash >&2; exit 1; fi\nsleep 5");
    judger j(chain);

    auto request = prepare();
    request.problem.time_limit = 300;
    auto response = j.judge(request);
    EXPECT_EQ(response.status, overall_status::TIMEOUT);
}

TEST_F(JudgerTest, CompileErrorTest) {
    auto chain = make_shared<mock::counting_toolchain>(DOUBLE_PROGRAM);
    chain->diagnostic = "solution.c:1:13: error: expected '}'";
    judger j(chain);

    auto response = j.judge(prepare());
    EXPECT_FALSE(response.success);
    EXPECT_EQ(response.status, overall_status::COMPILE_ERROR);
    EXPECT_FALSE(response.result);
    EXPECT_EQ(response.error, "Compilation failed: solution.c:1:13: error: expected '}'");
}

TEST_F(JudgerTest, CompileTimeoutTest) {
    auto chain = make_shared<mock::counting_toolchain>(DOUBLE_PROGRAM);
    chain->time_out = true;
    judger j(chain);

    auto response = j.judge(prepare());
    EXPECT_FALSE(response.success);
    EXPECT_EQ(response.status, overall_status::COMPILE_ERROR);
    ASSERT_TRUE(response.error);
    EXPECT_TRUE(boost::starts_with(*response.error, "Compilation failed: "));
}

TEST_F(JudgerTest, SourceTooLargeTest) {
    auto chain = make_shared<mock::counting_toolchain>(DOUBLE_PROGRAM);
    judger j(chain);

    auto request = prepare();
    request.code = string(SOURCE_SIZE_LIMIT + 1, ' ');
    auto response = j.judge(request);
    EXPECT_FALSE(response.success);
    EXPECT_EQ(response.status, overall_status::COMPILE_ERROR);
    ASSERT_TRUE(response.error);
    EXPECT_TRUE(boost::starts_with(*response.error, "Source code too large"));
    EXPECT_EQ(chain->invocations, 0);
}

TEST_F(JudgerTest, UnsupportedLanguageTest) {
    auto chain = make_shared<mock::counting_toolchain>(DOUBLE_PROGRAM);
    judger j(chain);

    auto response = j.judge(prepare("python"));
    EXPECT_FALSE(response.success);
    EXPECT_EQ(response.status, overall_status::UNSUPPORTED_LANGUAGE);
    EXPECT_EQ(response.error, "Unsupported language: python");
    EXPECT_FALSE(response.result);
    EXPECT_EQ(chain->invocations, 0);
}

TEST_F(JudgerTest, NoTestCasesTest) {
    auto chain = make_shared<mock::counting_toolchain>(DOUBLE_PROGRAM);
    judger j(chain);

    auto request = prepare();
    request.problem.test_cases.clear();
    EXPECT_THROW(j.judge(request), invalid_argument);
    EXPECT_EQ(chain->invocations, 0);
}

TEST_F(JudgerTest, CarriageReturnTest) {
    auto chain = make_shared<mock::counting_toolchain>("read n\nprintf '%d\\r\\n' $((n * 2))");
    judger j(chain);

    auto request = prepare();
    request.normalization.normalize_crlf = true;
    auto response = j.judge(request);
    ASSERT_TRUE(response.result);
    EXPECT_EQ(response.result->passed_test_cases, 2u);
    EXPECT_EQ(response.result->test_case_results[0].actual_output, "10\r\n");
}

TEST_F(JudgerTest, ExtraWhitespaceTest) {
    auto chain = make_shared<mock::counting_toolchain>("echo '1    2'");
    judger j(chain);

    auto request = prepare();
    request.problem.test_cases = {{"", "1 2\n", false}};
    EXPECT_DOUBLE_EQ(j.judge(request).result->score, 0.0);

    request.normalization.ignore_extra_whitespace = true;
    EXPECT_DOUBLE_EQ(j.judge(request).result->score, 100.0);
}

TEST_F(JudgerTest, CachedTest) {
    auto chain = make_shared<mock::counting_toolchain>(DOUBLE_PROGRAM);
    judger j(chain);

    auto first = j.judge(prepare());
    auto second = j.judge(prepare());
    ASSERT_TRUE(first.result);
    ASSERT_TRUE(second.result);
    EXPECT_FALSE(first.result->cached);
    EXPECT_TRUE(second.result->cached);
    EXPECT_DOUBLE_EQ(second.result->score, 100.0);
    EXPECT_EQ(chain->invocations, 1);
    EXPECT_EQ(j.get_cache().directory(), CACHE_DIR);
}

TEST_F(JudgerTest, RelativeCacheDirectoryTest) {
    fs::path old_cache = CACHE_DIR;
    fs::path cache_root = make_temp_dir("codejudge-relative-cache");
    CACHE_DIR = fs::relative(cache_root, fs::current_path());
    ASSERT_TRUE(CACHE_DIR.is_relative());

    auto chain = make_shared<mock::counting_toolchain>(DOUBLE_PROGRAM);
    {
        judger j(chain);
        EXPECT_TRUE(j.get_cache().directory().is_absolute());

        auto first = j.judge(prepare());
        auto second = j.judge(prepare());
        ASSERT_TRUE(first.result);
        ASSERT_TRUE(second.result);
        EXPECT_TRUE(second.result->cached);
        EXPECT_EQ(second.status, overall_status::OK);
        EXPECT_DOUBLE_EQ(second.result->score, 100.0);
        for (auto &tcr : second.result->test_case_results)
            EXPECT_TRUE(tcr.result.success) << tcr.result.error.value_or("");
    }
    EXPECT_EQ(chain->invocations, 1);

    CACHE_DIR = old_cache;
    fs::remove_all(cache_root);
}

TEST_F(JudgerTest, HugeTimeLimitTest) {
    auto chain = make_shared<mock::counting_toolchain>(DOUBLE_PROGRAM);
    judger j(chain);

    auto request = prepare();
    request.problem.time_limit = numeric_limits<uint64_t>::max();
    auto response = j.judge(request);
    EXPECT_EQ(response.status, overall_status::OK);
    ASSERT_TRUE(response.result);
    EXPECT_DOUBLE_EQ(response.result->score, 100.0);
}

TEST_F(JudgerTest, SandboxLifecycleTest) {
    if (DEBUG) GTEST_SKIP() << "sandbox is kept in debug mode";

    auto chain = make_shared<mock::counting_toolchain>(DOUBLE_PROGRAM);
    fs::path dir;
    {
        judger j(chain);
        dir = j.get_sandbox().working_dir();
        EXPECT_TRUE(j.get_sandbox().is_secure());
        j.judge(prepare());
        EXPECT_TRUE(fs::is_directory(dir));
    }
    EXPECT_FALSE(fs::exists(dir));
}

TEST_F(JudgerTest, CheckEnvironmentTest) {
    auto chain = make_shared<mock::counting_toolchain>(DOUBLE_PROGRAM);
    judger j(chain);
    EXPECT_NO_THROW(j.check_environment());

    chain->diagnostic = "gcc: command not found";
    EXPECT_THROW(j.check_environment(), environment_error);
}

static test_case_result make_result(bool passed, bool success, optional<string> error) {
    test_case_result tcr;
    tcr.passed = passed;
    tcr.result.success = success;
    tcr.result.error = move(error);
    return tcr;
}

TEST(OverallStatusTest, DeriveTest) {
    EXPECT_EQ(derive_overall_status({make_result(true, true, nullopt)}), overall_status::OK);
    EXPECT_EQ(derive_overall_status({make_result(true, true, nullopt), make_result(false, true, nullopt)}),
              overall_status::OK);
    EXPECT_EQ(derive_overall_status({make_result(false, false, string("boom")), make_result(false, false, string(TIME_LIMIT_EXCEEDED_MESSAGE))}),
              overall_status::TIMEOUT);
    EXPECT_EQ(derive_overall_status({make_result(true, true, nullopt), make_result(false, false, string("boom"))}),
              overall_status::RUNTIME_ERROR);
    EXPECT_EQ(derive_overall_status({make_result(false, false, string(""))}), overall_status::OK);
    EXPECT_EQ(derive_overall_status({make_result(false, false, nullopt)}), overall_status::OK);
}

TEST(OverallStatusTest, ScoreTest) {
    EXPECT_DOUBLE_EQ(compute_score(0, 4), 0.0);
    EXPECT_DOUBLE_EQ(compute_score(3, 4), 75.0);
    EXPECT_DOUBLE_EQ(compute_score(4, 4), 100.0);
    EXPECT_NEAR(compute_score(1, 3), 33.333, 0.001);
    EXPECT_THROW(compute_score(0, 0), invalid_argument);
}

TEST(OverallStatusTest, DisplayMessageTest) {
    EXPECT_STREQ(get_display_message(overall_status::OK), "Ok");
    EXPECT_STREQ(get_display_message(overall_status::COMPILE_ERROR), "CompileError");
    EXPECT_STREQ(get_display_message(overall_status::RUNTIME_ERROR), "RuntimeError");
    EXPECT_STREQ(get_display_message(overall_status::TIMEOUT), "Timeout");
    EXPECT_STREQ(get_display_message(overall_status::UNSUPPORTED_LANGUAGE), "UnsupportedLanguage");
    EXPECT_STREQ(get_display_message(overall_status::ENV_ERROR), "EnvError");
    EXPECT_EQ(parse_overall_status("Timeout"), overall_status::TIMEOUT);
}

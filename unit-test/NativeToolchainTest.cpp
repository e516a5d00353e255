#include <boost/algorithm/string.hpp>
#include <memory>
#include "common/exceptions.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "gtest/gtest.h"
#include "judge/judger.hpp"
#include "test/environment.hpp"

using namespace std;
using namespace codejudge;

static const string DOUBLE_C = R"(#include <stdio.h>

int main() {
    int n;
    scanf("%d", &n);
    printf("%d\n", n * 2);
    return 0;
}
)";

static const string DOUBLE_CPP = R"(#include <iostream>

int main() {
    long long n;
    std::cin >> n;
    std::cout << n * 2 << std::endl;
    return 0;
}
)";

class NativeToolchainTest : public ::testing::Test {
protected:
    static void SetUpTestCase() {
        setup_test_environment();
    }

    void SetUp() override {
        if (which(C_COMPILER).empty() || which(CXX_COMPILER).empty())
            GTEST_SKIP() << "gcc and g++ are required";
    }

    judge_request prepare(const string &language, const string &code) {
        judge_request request;
        request.language = language;
        request.code = code;
        request.problem.id = "1";
        request.problem.title = "Double the Number";
        request.problem.time_limit = 1000;
        request.problem.memory_limit = 64;
        request.problem.test_cases = {{"5\n", "10\n", false}, {"10\n", "20\n", true}};
        return request;
    }
};

TEST_F(NativeToolchainTest, CheckEnvironmentTest) {
    judger j;
    EXPECT_NO_THROW(j.check_environment());
}

TEST_F(NativeToolchainTest, AcceptedCTest) {
    judger j;
    auto response = j.judge(prepare("c", DOUBLE_C));
    EXPECT_TRUE(response.success);
    EXPECT_EQ(response.status, overall_status::OK);
    ASSERT_TRUE(response.result);
    EXPECT_EQ(response.result->passed_test_cases, 2u);
    EXPECT_DOUBLE_EQ(response.result->score, 100.0);
    EXPECT_GT(*response.result->executable_size_bytes, 0u);
}

TEST_F(NativeToolchainTest, AcceptedCppTest) {
    judger j;
    auto response = j.judge(prepare("cpp", DOUBLE_CPP));
    EXPECT_EQ(response.status, overall_status::OK);
    ASSERT_TRUE(response.result);
    EXPECT_DOUBLE_EQ(response.result->score, 100.0);
}

TEST_F(NativeToolchainTest, WrongAnswerTest) {
    judger j;
    auto request = prepare("c", DOUBLE_C);
    request.problem.test_cases = {{"5\n", "11\n", false}};
    auto response = j.judge(request);
    EXPECT_TRUE(response.success);
    EXPECT_EQ(response.status, overall_status::OK);
    ASSERT_TRUE(response.result);
    EXPECT_EQ(response.result->passed_test_cases, 0u);
    EXPECT_DOUBLE_EQ(response.result->score, 0.0);
}

TEST_F(NativeToolchainTest, CompileErrorTest) {
    judger j;
    auto response = j.judge(prepare("c", "int main( {"));
    EXPECT_FALSE(response.success);
    EXPECT_EQ(response.status, overall_status::COMPILE_ERROR);
    ASSERT_TRUE(response.error);
    EXPECT_TRUE(boost::starts_with(*response.error, "Compilation failed: "));
    EXPECT_NE(response.error->find("error"), string::npos);
}

TEST_F(NativeToolchainTest, RuntimeErrorTest) {
    judger j;
    auto response = j.judge(prepare("c", R"(#include <stdio.h>
int main() { fprintf(stderr, "fatal\n"); return 1; }
)"));
    EXPECT_EQ(response.status, overall_status::RUNTIME_ERROR);
}

TEST_F(NativeToolchainTest, InfiniteLoopTest) {
    judger j;
    auto request = prepare("c", "int main() { volatile int x = 0; for (;;) ++x; }\n");
    request.problem.time_limit = 300;
    auto response = j.judge(request);
    EXPECT_EQ(response.status, overall_status::TIMEOUT);
}

TEST_F(NativeToolchainTest, FingerprintTest) {
    native_toolchain chain;
    auto spec = get_language_spec(language::C);
    string fingerprint = chain.fingerprint(spec);
    EXPECT_TRUE(boost::starts_with(fingerprint, spec.compiler + " "));
    EXPECT_EQ(chain.fingerprint(spec), fingerprint);
}

TEST(NativeToolchainMissingTest, MissingCompilerTest) {
    native_toolchain chain;
    EXPECT_THROW(chain.invoke({"codejudge-no-such-compiler", "--version"}, {}, 1000), environment_error);
}

#include <string>
#include <vector>
#include "gtest/gtest.h"
#include "judge/compare.hpp"

using namespace std;
using namespace codejudge;

static normalization_options make_options(bool normalize_crlf, bool ignore_extra_whitespace) {
    normalization_options options;
    options.normalize_crlf = normalize_crlf;
    options.ignore_extra_whitespace = ignore_extra_whitespace;
    return options;
}

TEST(CompareTest, TrimLinesTest) {
    auto options = make_options(false, false);
    EXPECT_EQ(normalize_output("1 2  \n  3\n\n", options), "1 2\n3");
    EXPECT_EQ(normalize_output("a  b", options), "a  b");
    EXPECT_EQ(normalize_output("", options), "");
    EXPECT_EQ(normalize_output("\n\n", options), "");
}

TEST(CompareTest, BlankLinesInsideTest) {
    auto options = make_options(false, false);
    EXPECT_EQ(normalize_output("a\n\nb\n", options), "a\n\nb");
    EXPECT_FALSE(outputs_match("a\n\nb", "a\nb", options));
}

TEST(CompareTest, IgnoreExtraWhitespaceTest) {
    auto options = make_options(false, true);
    EXPECT_EQ(normalize_output("  a   b\t c  \n1\t\t2", options), "a b c\n1 2");
    EXPECT_TRUE(outputs_match("1    2\n", "1 2", options));
    EXPECT_FALSE(outputs_match("1    2\n", "1 2", make_options(false, false)));
}

TEST(CompareTest, CarriageReturnTest) {
    auto options = make_options(true, false);
    EXPECT_EQ(normalize_output("a\r\nb\r\n", options), "a\nb");
    EXPECT_TRUE(outputs_match("10\r\n20\r\n", "10\n20\n", options));
}

TEST(CompareTest, OutputsMatchTest) {
    auto options = make_options(false, false);
    EXPECT_TRUE(outputs_match("10\n", "10", options));
    EXPECT_TRUE(outputs_match("10", "10\n\n", options));
    EXPECT_FALSE(outputs_match("10", "11", options));
    EXPECT_FALSE(outputs_match("1 0", "10", options));
}

TEST(CompareTest, IdempotentTest) {
    vector<string> samples = {
        "",
        "hello\n",
        "  1   2  \r\n3\t4\r\n\r\n",
        "\n\na\n\n\nb\n\n",
        "x\ty  z\r\n",
        "\r\n \r\n",
    };
    for (bool crlf : {false, true}) {
        for (bool whitespace : {false, true}) {
            auto options = make_options(crlf, whitespace);
            for (auto &sample : samples) {
                string once = normalize_output(sample, options);
                EXPECT_EQ(normalize_output(once, options), once)
                    << "sample " << sample << " crlf " << crlf << " whitespace " << whitespace;
            }
        }
    }
}

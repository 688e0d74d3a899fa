#include <gtest/gtest.h>
#include <codeloop/sandbox/policy.hpp>

namespace codeloop {
namespace {

class PolicyFilterTest : public ::testing::Test {
protected:
    PolicyFilter filter;
};

TEST_F(PolicyFilterTest, AllowsPlainComputation) {
    PolicyCheck check = filter.check("import math\nprint(math.sqrt(16))\n");
    EXPECT_TRUE(check.allowed);
    EXPECT_TRUE(check.pattern.empty());
}

TEST_F(PolicyFilterTest, BlocksEveryDeniedModuleImport) {
    const char* modules[] = { "os", "subprocess", "socket", "requests", "http", "urllib", "pathlib" };
    for (const char* m : modules) {
        PolicyCheck check = filter.check(std::string("import ") + m + "\nprint(1)");
        EXPECT_FALSE(check.allowed) << "import " << m << " should be blocked";
    }
}

TEST_F(PolicyFilterTest, BlocksDynamicPrimitives) {
    const char* snippets[] = {
        "f = open('x.txt')",
        "eval('1+1')",
        "exec ('print(1)')",
        "m = __import__('os')",
    };
    for (const char* s : snippets) {
        EXPECT_FALSE(filter.check(s).allowed) << s;
    }
}

TEST_F(PolicyFilterTest, ReportsPatternVerbatim) {
    PolicyCheck check = filter.check("import subprocess\nsubprocess.run(['ls'])");
    ASSERT_FALSE(check.allowed);
    EXPECT_EQ(check.pattern, R"(\bimport\s+subprocess\b)");
    EXPECT_EQ(check.message(), "Blocked by policy (matched pattern: \\bimport\\s+subprocess\\b).");
}

TEST_F(PolicyFilterTest, FirstPatternInOrderWins) {
    // open( appears first in the text, but the os import rule comes first in the list
    PolicyCheck check = filter.check("data = open('f').read()\nimport os\n");
    ASSERT_FALSE(check.allowed);
    EXPECT_EQ(check.pattern, PolicyFilter::default_patterns()[0]);
}

TEST_F(PolicyFilterTest, WordBoundariesAvoidFalsePositives) {
    EXPECT_TRUE(filter.check("import osmosis").allowed);
    EXPECT_TRUE(filter.check("import httpx_like_name").allowed);
    EXPECT_TRUE(filter.check("reopen = 1\nprint(reopen)").allowed);
    EXPECT_TRUE(filter.check("evaluate = 2\nprint(evaluate)").allowed);
}

TEST_F(PolicyFilterTest, OnlyCatchesLiteralForms) {
    // Documented limitation: the filter is a lint, not a boundary
    EXPECT_TRUE(filter.check("from os import path").allowed);
    EXPECT_TRUE(filter.check("getattr(__builtins__, 'op' + 'en')").allowed);
}

TEST_F(PolicyFilterTest, LongWhitespaceRunsAreMatchedSafely) {
    const std::string spaces(1024 * 1024, ' ');

    PolicyCheck allowed = filter.check("x = 1\nimport" + spaces + "math\nprint(x)\n");
    EXPECT_TRUE(allowed.allowed);

    PolicyCheck blocked = filter.check("x = 1\nimport" + spaces + "os\nprint(x)\n");
    EXPECT_FALSE(blocked.allowed);
    EXPECT_EQ(blocked.pattern, R"(\bimport\s+os\b)");

    PolicyCheck call = filter.check("data = open" + std::string(1024 * 1024, '\t') + "('f')");
    EXPECT_FALSE(call.allowed);
    EXPECT_EQ(call.pattern, R"(\bopen\s*\()");
}

TEST_F(PolicyFilterTest, MixedWhitespaceBetweenTokensStillMatches) {
    EXPECT_FALSE(filter.check("import \t \r\n  subprocess").allowed);
    EXPECT_FALSE(filter.check("eval \n\n (code)").allowed);
    EXPECT_TRUE(filter.check("important = 1\nevaluate = 2").allowed);
}

TEST(PolicyFilterCustom, UsesGivenPatternsInOrder) {
    std::vector<std::string> patterns;
    patterns.push_back(R"(\bwhile\s+True\b)");
    patterns.push_back(R"(\bprint\b)");
    PolicyFilter filter(patterns);

    EXPECT_TRUE(filter.check("x = 1").allowed);
    EXPECT_EQ(filter.check("while True:\n    print(1)").pattern, patterns[0]);
    EXPECT_EQ(filter.check("print(1)").pattern, patterns[1]);
}

TEST(PolicyFilterCustom, RejectsInvalidRegex) {
    std::vector<std::string> patterns(1, "(unclosed");
    EXPECT_THROW(PolicyFilter filter(patterns), std::regex_error);
}

TEST(PolicyFilterDefaults, ElevenPatterns) {
    EXPECT_EQ(PolicyFilter::default_patterns().size(), 11u);
    EXPECT_EQ(PolicyFilter().patterns(), PolicyFilter::default_patterns());
}

} // namespace
} // namespace codeloop

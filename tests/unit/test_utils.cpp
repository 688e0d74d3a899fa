#include <gtest/gtest.h>
#include <codeloop/core/utils.hpp>
#include <codeloop/core/logger.hpp>
#include <regex>
#include <set>

namespace codeloop {
namespace {

TEST(UtilsTest, TrimFamily) {
    EXPECT_EQ(trim("  \t hello \r\n"), "hello");
    EXPECT_EQ(ltrim("  x  "), "x  ");
    EXPECT_EQ(rtrim("  x  "), "  x");
    EXPECT_EQ(trim("   "), "");
    EXPECT_EQ(trim(""), "");
}

TEST(UtilsTest, ToLowerAndStartsWith) {
    EXPECT_EQ(to_lower("PyThOn3"), "python3");
    EXPECT_TRUE(starts_with("async def f():", "async def "));
    EXPECT_FALSE(starts_with("def", "def "));
    EXPECT_TRUE(starts_with("anything", ""));
}

TEST(UtilsTest, SplitKeepsEmptyParts) {
    std::vector<std::string> parts = split("a```b``````c", "```");
    ASSERT_EQ(parts.size(), 4u);
    EXPECT_EQ(parts[0], "a");
    EXPECT_EQ(parts[1], "b");
    EXPECT_EQ(parts[2], "");
    EXPECT_EQ(parts[3], "c");

    parts = split("no fences here", "```");
    ASSERT_EQ(parts.size(), 1u);
    EXPECT_EQ(parts[0], "no fences here");

    parts = split("", ":");
    ASSERT_EQ(parts.size(), 1u);
    EXPECT_EQ(parts[0], "");
}

TEST(UtilsTest, SplitLinesDropsCarriageReturns) {
    std::vector<std::string> lines = split_lines("one\r\ntwo\n\nfour");
    ASSERT_EQ(lines.size(), 4u);
    EXPECT_EQ(lines[0], "one");
    EXPECT_EQ(lines[1], "two");
    EXPECT_EQ(lines[2], "");
    EXPECT_EQ(lines[3], "four");
    EXPECT_TRUE(split_lines("").empty());
}

TEST(UtilsTest, JoinIsInverseOfSplitLines) {
    std::vector<std::string> lines;
    lines.push_back("x = 1");
    lines.push_back("print(x)");
    EXPECT_EQ(join(lines, "\n"), "x = 1\nprint(x)");
    EXPECT_EQ(join(std::vector<std::string>(), "\n"), "");
}

TEST(UtilsTest, TruncateSafeRespectsMultibyte) {
    EXPECT_EQ(truncate_safe("hello", 10), "hello");
    EXPECT_EQ(truncate_safe("hello", 3), "hel");
    // "é" is two bytes; cutting after its first byte backs up
    EXPECT_EQ(truncate_safe("a\xC3\xA9z", 2), "a");
}

TEST(UtilsTest, SanitizeUtf8) {
    EXPECT_EQ(sanitize_utf8("tab\there\nline\r\n"), "tab\there\nline\r\n");
    EXPECT_EQ(sanitize_utf8("caf\xC3\xA9"), "caf\xC3\xA9");
    EXPECT_EQ(sanitize_utf8(std::string("a\x01" "b")), "a b");
    EXPECT_EQ(sanitize_utf8("bad\xFFz"), "bad\xEF\xBF\xBDz");
    EXPECT_EQ(sanitize_utf8("cut\xE2\x82"), "cut\xEF\xBF\xBD\xEF\xBF\xBD");
}

TEST(UtilsTest, GenerateUuidIsVersion4) {
    std::regex pattern("^[0-9a-f]{8}-[0-9a-f]{4}-4[0-9a-f]{3}-[89ab][0-9a-f]{3}-[0-9a-f]{12}$");
    std::set<std::string> seen;
    for (int i = 0; i < 50; ++i) {
        std::string id = generate_uuid();
        EXPECT_TRUE(std::regex_match(id, pattern)) << id;
        seen.insert(id);
    }
    EXPECT_EQ(seen.size(), 50u);
}

TEST(UtilsTest, MonotonicClockAdvances) {
    int64_t a = monotonic_ms();
    int64_t b = monotonic_ms();
    EXPECT_GE(b, a);
    EXPECT_GT(current_timestamp_ms(), 1600000000000LL);
}

TEST(LoggerTest, ParseLogLevel) {
    EXPECT_EQ(parse_log_level("debug"), LogLevel::DEBUG);
    EXPECT_EQ(parse_log_level("INFO"), LogLevel::INFO);
    EXPECT_EQ(parse_log_level("Warning"), LogLevel::WARN);
    EXPECT_EQ(parse_log_level("warn"), LogLevel::WARN);
    EXPECT_EQ(parse_log_level("error"), LogLevel::ERROR);
    EXPECT_EQ(parse_log_level("loud"), LogLevel::INFO);
    EXPECT_EQ(parse_log_level("", LogLevel::ERROR), LogLevel::ERROR);
}

TEST(LoggerTest, LevelIsSettable) {
    Logger& log = Logger::instance();
    LogLevel saved = log.level();
    log.set_level(LogLevel::ERROR);
    EXPECT_EQ(log.level(), LogLevel::ERROR);
    log.set_level(saved);
}

} // namespace
} // namespace codeloop

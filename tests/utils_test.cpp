#include <gtest/gtest.h>

#include <cstdint>
#include <limits>
#include <stdexcept>

#include <meridian/utils/finally.hpp>
#include <meridian/utils/param_parser.hpp>
#include <meridian/utils/string_match.hpp>

using namespace meridian;

TEST(WildcardMatchTest, MatchesStarsAnywhere) {
    EXPECT_TRUE(utils::wildcard_match("admin.*", "admin.users.index"));
    EXPECT_TRUE(utils::wildcard_match("*.index", "admin.users.index"));
    EXPECT_TRUE(utils::wildcard_match("admin.*.index", "admin.users.index"));
    EXPECT_TRUE(utils::wildcard_match("*", ""));
    EXPECT_TRUE(utils::wildcard_match("users", "users"));
    EXPECT_FALSE(utils::wildcard_match("users", "users.index"));
    EXPECT_FALSE(utils::wildcard_match("admin.*", "public.index"));
    EXPECT_FALSE(utils::wildcard_match("", "x"));
}

TEST(LevenshteinTest, CountsEdits) {
    EXPECT_EQ(utils::levenshtein("", ""), 0u);
    EXPECT_EQ(utils::levenshtein("abc", ""), 3u);
    EXPECT_EQ(utils::levenshtein("kitten", "sitting"), 3u);
    EXPECT_EQ(utils::levenshtein("posts.show", "post.show"), 1u);
}

TEST(ParamParserTest, StrictParsing) {
    EXPECT_EQ(param_parser::tryParse<int>("42"), 42);
    EXPECT_FALSE(param_parser::tryParse<int>("42abc").has_value());
    EXPECT_FALSE(param_parser::tryParse<int>("").has_value());
    EXPECT_EQ(param_parser::tryParse<bool>("Yes"), true);
    EXPECT_EQ(param_parser::tryParse<bool>("off"), false);
    EXPECT_FALSE(param_parser::tryParse<bool>("maybe").has_value());
    EXPECT_EQ(param_parser::tryParse<std::string>("text"), "text");
}

TEST(ParamParserTest, LeadingNumberParsing) {
    EXPECT_EQ(param_parser::parseLeading<long long>("42abc"), 42);
    EXPECT_EQ(param_parser::parseLeading<long long>("  +7"), 7);
    EXPECT_EQ(param_parser::parseLeading<long long>("-3"), -3);
    EXPECT_EQ(param_parser::parseLeading<long long>("abc"), 0);
    EXPECT_DOUBLE_EQ(param_parser::parseLeading<double>("3.5kg"), 3.5);
}

TEST(ParamParserTest, LeadingNumberClampsOnOverflow) {
    EXPECT_EQ(param_parser::parseLeading<std::int64_t>("99999999999999999999"), std::numeric_limits<std::int64_t>::max());
    EXPECT_EQ(param_parser::parseLeading<std::int64_t>("-99999999999999999999abc"), std::numeric_limits<std::int64_t>::min());
    EXPECT_EQ(param_parser::parseLeading<int>("3000000000"), std::numeric_limits<int>::max());
    EXPECT_EQ(param_parser::parseLeading<double>("1e999"), std::numeric_limits<double>::max());
    EXPECT_EQ(param_parser::parseLeading<double>("-1e999"), std::numeric_limits<double>::lowest());
    EXPECT_EQ(param_parser::parseLeading<double>("1e-999"), 0.0);
}

TEST(ParamParserTest, CaseInsensitiveEquality) {
    EXPECT_TRUE(param_parser::isEquals("DELETE", "delete"));
    EXPECT_FALSE(param_parser::isEquals("DELETE", "DELETES"));
}

TEST(FinallyTest, RunsOnScopeExitAndUnwinding) {
    int runs = 0;
    {
        auto guard = make_finally([&runs] { ++runs; });
    }
    EXPECT_EQ(runs, 1);

    try {
        auto guard = make_finally([&runs] { ++runs; });
        throw std::runtime_error("boom");
    } catch (const std::runtime_error&) {
    }
    EXPECT_EQ(runs, 2);
}

TEST(FinallyTest, ReleasedGuardDoesNothing) {
    int runs = 0;
    {
        auto guard = make_finally([&runs] { ++runs; });
        guard.release();
    }
    EXPECT_EQ(runs, 0);
}

TEST(FinallyTest, MovedGuardRunsOnce) {
    int runs = 0;
    {
        auto first = make_finally([&runs] { ++runs; });
        auto second = std::move(first);
    }
    EXPECT_EQ(runs, 1);
}

#include "../../src/utils/string_utils.hpp"

#include <gtest/gtest.h>

#include "../../src/utils/logging.hpp"

namespace {
    TEST(StringUtilsTest, TrimAndCase) {
        EXPECT_EQ(string_utils::trim("  value \r\n"), "value");
        EXPECT_EQ(string_utils::to_lower("Content-Type"), "content-type");
        EXPECT_EQ(string_utils::to_upper("get"), "GET");
    }

    TEST(StringUtilsTest, PrefixChecks) {
        EXPECT_TRUE(string_utils::starts_with("fisio-static-v1", "fisio-"));
        EXPECT_FALSE(string_utils::starts_with("static", "static-v"));
        EXPECT_TRUE(string_utils::ieq_prefix("http/1.1 200 OK", 15, "HTTP/"));
        EXPECT_FALSE(string_utils::ieq_prefix("HT", 2, "HTTP/"));
    }

    TEST(StringUtilsTest, SplitsCommaListsAndDropsBlanks) {
        EXPECT_EQ(string_utils::split_comma_delimited_string("/a, /b ,,/c"), (std::vector<std::string>{"/a", "/b", "/c"}));
        EXPECT_TRUE(string_utils::split_comma_delimited_string("  ").empty());
    }

    TEST(StringUtilsTest, Iso8601Utc) {
        EXPECT_EQ(string_utils::iso8601_utc(0), "1970-01-01T00:00:00.000Z");
        EXPECT_EQ(string_utils::iso8601_utc(1'700'000'000'123LL), "2023-11-14T22:13:20.123Z");
    }

    TEST(LoggingTest, ParsesKnownLevels) {
        EXPECT_EQ(logging::parse_level("debug"), spdlog::level::debug);
        EXPECT_EQ(logging::parse_level("error"), spdlog::level::err);
        EXPECT_THROW(logging::parse_level("verbose"), std::invalid_argument);
    }
}  // namespace

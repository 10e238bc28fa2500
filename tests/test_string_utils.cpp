#include <gtest/gtest.h>
#include <util/string_utils.hpp>

TEST(StringUtils, SplitLinesDropsFinalNewlineOnly) {
    EXPECT_EQ(StringUtils::split_lines("a\nb\n"), (std::vector<std::string>{"a", "b"}));
    EXPECT_EQ(StringUtils::split_lines("a\n\nb"), (std::vector<std::string>{"a", "", "b"}));
    EXPECT_EQ(StringUtils::split_lines("a\r\nb\r\n"), (std::vector<std::string>{"a", "b"}));
    EXPECT_TRUE(StringUtils::split_lines("").empty());
}

TEST(StringUtils, TailLines) {
    EXPECT_EQ(StringUtils::tail_lines("1\n2\n3\n4\n5\n", 2), "4\n5");
    EXPECT_EQ(StringUtils::tail_lines("1\n2\n", 5), "1\n2");
    EXPECT_EQ(StringUtils::tail_lines("1\n2\n", 0), "");
}

TEST(StringUtils, EndsWithAndTrim) {
    EXPECT_TRUE(StringUtils::ends_with("$ ls -la", "ls -la"));
    EXPECT_FALSE(StringUtils::ends_with("la", "ls -la"));
    EXPECT_EQ(StringUtils::trim("  x y \n"), "x y");
    EXPECT_EQ(StringUtils::trim(" \t\n"), "");
}

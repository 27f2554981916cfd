#include <gtest/gtest.h>

#include <sandrun/utils/string_utils.hpp>

using sandrun::utils::StringUtils;

TEST(StringUtils, TrimStripsBothEnds) {
  EXPECT_EQ(StringUtils::Trim("  hello\n"), "hello");
  EXPECT_EQ(StringUtils::Trim("\t a b \r\n"), "a b");
  EXPECT_EQ(StringUtils::Trim(" \n\t "), "");
  EXPECT_EQ(StringUtils::Trim(""), "");
}

TEST(StringUtils, SplitSkipsEmptyTokens) {
  auto parts = StringUtils::Split("a\n\nb\nc\n", '\n');
  ASSERT_EQ(parts.size(), 3u);
  EXPECT_EQ(parts[0], "a");
  EXPECT_EQ(parts[2], "c");
  EXPECT_TRUE(StringUtils::Split("", ',').empty());
}

TEST(StringUtils, Join) {
  EXPECT_EQ(StringUtils::Join({"python3", "-B", "main.py"}, " "), "python3 -B main.py");
  EXPECT_EQ(StringUtils::Join({}, " "), "");
}

TEST(StringUtils, Predicates) {
  EXPECT_EQ(StringUtils::ToLower("Is NOT Running"), "is not running");
  EXPECT_TRUE(StringUtils::StartsWith("WARNING: x", "WARNING:"));
  EXPECT_FALSE(StringUtils::StartsWith("WARN", "WARNING:"));
  EXPECT_TRUE(StringUtils::Contains("/tmp/a,b", ","));
  EXPECT_FALSE(StringUtils::Contains("/tmp/ab", ","));
}

/**
 * @file test_path.cpp
 * @brief Path normalization and string helper tests
 */

#include "verso/common.hpp"

#include <gtest/gtest.h>

using namespace verso::common;

TEST(PathNormalization, UnixPaths)
{
    EXPECT_EQ(normalize_path("/home/user/project"), "/home/user/project");
    EXPECT_EQ(normalize_path("/home/user/project/"), "/home/user/project");
    EXPECT_EQ(normalize_path("/home/user/../user/project"), "/home/user/project");
    EXPECT_EQ(normalize_path("/home/user/./project"), "/home/user/project");
}

TEST(PathNormalization, Backslashes)
{
    EXPECT_EQ(normalize_path("C:\\Users\\dev\\project"), "c:/Users/dev/project");
    EXPECT_EQ(normalize_path("org\\repo"), "org/repo");
}

TEST(PathNormalization, DotSegments)
{
    EXPECT_EQ(normalize_path("a/b/../c"), "a/c");
    EXPECT_EQ(normalize_path("../a/b"), "../a/b");
    EXPECT_EQ(normalize_path("/../a"), "/a");
    EXPECT_EQ(normalize_path("./a//b/."), "a/b");
    EXPECT_EQ(normalize_path(""), ".");
}

TEST(PathNormalization, IsAbsolute)
{
    EXPECT_TRUE(is_absolute_path("/home/user"));
    EXPECT_TRUE(is_absolute_path("C:/Users"));
    EXPECT_TRUE(is_absolute_path("C:\\Users"));
    EXPECT_FALSE(is_absolute_path("relative/path"));
    EXPECT_FALSE(is_absolute_path(""));
}

TEST(StringHelpers, TrimAndLower)
{
    EXPECT_EQ(trim("  main \n"), "main");
    EXPECT_EQ(trim("\t\t"), "");
    EXPECT_EQ(to_lower("GitHub.COM"), "github.com");
}

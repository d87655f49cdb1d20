/**
 * @file test_path.cpp
 * @brief Location token path normalization tests
 */

#include "capslock/common.hpp"

#include <gtest/gtest.h>

using namespace capslock::common;

TEST(PathNormalization, UnixPaths)
{
    EXPECT_EQ(normalize_path("/home/user/project"), "/home/user/project");
    EXPECT_EQ(normalize_path("/home/user/project/"), "/home/user/project");
    EXPECT_EQ(normalize_path("/home/user/../user/project"), "/home/user/project");
    EXPECT_EQ(normalize_path("/home//user/./project"), "/home/user/project");
}

TEST(PathNormalization, WindowsToUnix)
{
    EXPECT_EQ(normalize_path("C:\\Users\\dev\\project"), "c:/Users/dev/project");
    EXPECT_EQ(normalize_path("src\\main.rs"), "src/main.rs");
}

TEST(PathNormalization, DotDot)
{
    EXPECT_EQ(normalize_path("a/b/../c"), "a/c");
    EXPECT_EQ(normalize_path("a/b/c/../../d"), "a/d");
    EXPECT_EQ(normalize_path("../a/b"), "../a/b");
    EXPECT_EQ(normalize_path("/../a"), "/a");
}

TEST(PathNormalization, EmptyAndRoot)
{
    EXPECT_EQ(normalize_path(""), ".");
    EXPECT_EQ(normalize_path("./"), ".");
    EXPECT_EQ(normalize_path("/"), "/");
}

TEST(PathNormalization, IsAbsolute)
{
    EXPECT_TRUE(is_absolute_path("/home/user"));
    EXPECT_TRUE(is_absolute_path("C:/Users"));
    EXPECT_TRUE(is_absolute_path("C:\\Users"));
    EXPECT_FALSE(is_absolute_path("relative/path"));
    EXPECT_FALSE(is_absolute_path("./relative"));
    EXPECT_FALSE(is_absolute_path(""));
}

TEST(JoinSourcePath, DebugInfoDirectoryAndFile)
{
    EXPECT_EQ(join_source_path("/build/crate", "src/lib.rs"), "/build/crate/src/lib.rs");
    EXPECT_EQ(join_source_path("/build/crate", "/rustc/library/std/src/fs.rs"),
              "/rustc/library/std/src/fs.rs");
    EXPECT_EQ(join_source_path("", "src/../src/lib.rs"), "src/lib.rs");
    EXPECT_EQ(join_source_path("/build", ""), "/build");
    EXPECT_EQ(join_source_path("", ""), "");
}

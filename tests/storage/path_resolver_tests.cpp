/**
 * @file path_resolver_tests.cpp
 * @brief Unit tests for include path handling.
 */
#include <gtest/gtest.h>
#include "giantt/storage/path_resolver.hpp"

using namespace giantt;

TEST(PathResolverTests, Normalize_CollapsesDotsAndTrailingSlash)
{
    EXPECT_EQ(normalize_path("a/./b/../c/"), "a/c");
    EXPECT_EQ(normalize_path("a\\b"), "a/b");
    EXPECT_EQ(normalize_path(""), ".");
}

TEST(PathResolverTests, IsAbsolute)
{
    EXPECT_TRUE(is_absolute_path("/etc/giantt"));
    EXPECT_FALSE(is_absolute_path("items.txt"));
    EXPECT_FALSE(is_absolute_path("../shared/items.txt"));
    EXPECT_FALSE(is_absolute_path(""));
}

TEST(PathResolverTests, Resolve_RelativeToBase)
{
    EXPECT_EQ(resolve_path("/w/include", "../shared/x.txt"), std::filesystem::path("/w/shared/x.txt"));
    EXPECT_EQ(resolve_path("/w/include", "sub/y.txt"), std::filesystem::path("/w/include/sub/y.txt"));
}

TEST(PathResolverTests, Resolve_AbsoluteIgnoresBase)
{
    EXPECT_EQ(resolve_path("/w/include", "/abs/z.txt"), std::filesystem::path("/abs/z.txt"));
}

TEST(PathResolverTests, Relative_Paths)
{
    EXPECT_EQ(relative_path("/w/include", "/w/include/items.txt"), "items.txt");
    EXPECT_EQ(relative_path("/w/include", "/w/occlude/items.txt"), "../occlude/items.txt");
    EXPECT_EQ(relative_path("/w/include/", "/w/include"), ".");
}

TEST(PathResolverTests, SafeFilename_StripsReservedCharacters)
{
    EXPECT_EQ(safe_filename("my:plan?.txt"), "myplan.txt");
    EXPECT_EQ(safe_filename("a/b\\c"), "abc");
    EXPECT_EQ(safe_filename("tab\there"), "tabhere");
    EXPECT_EQ(safe_filename("<>|*"), "untitled");
    EXPECT_EQ(safe_filename(""), "untitled");
}

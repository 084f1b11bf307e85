#include "util/remotePath.hpp"

#include <gtest/gtest.h>

using namespace rfs::util;

TEST(RemotePathTest, SegmentsSkipEmptyAndDot) {
    EXPECT_EQ(pathSegments("/a//b/./c/"), (std::vector<std::string>{"a", "b", "c"}));
    EXPECT_TRUE(pathSegments("").empty());
    EXPECT_TRUE(pathSegments("/").empty());
}

TEST(RemotePathTest, JoinPrefixes) {
    const std::vector<std::string> segs{"a", "b", "c"};
    EXPECT_EQ(joinSegments(segs, 0), "");
    EXPECT_EQ(joinSegments(segs, 2), "a/b");
    EXPECT_EQ(joinSegments(segs), "a/b/c");
    EXPECT_EQ(joinSegments(segs, 10), "a/b/c");
}

TEST(RemotePathTest, JoinPathSkipsEmptySides) {
    EXPECT_EQ(joinPath("", "a"), "a");
    EXPECT_EQ(joinPath("a", ""), "a");
    EXPECT_EQ(joinPath("a/b", "c"), "a/b/c");
}

TEST(RemotePathTest, CleanNormalises) {
    EXPECT_EQ(cleanPath("/docs//2024/./"), "docs/2024");
    EXPECT_EQ(cleanPath("a/../b"), "b");
    EXPECT_EQ(cleanPath("../../a"), "a");
    EXPECT_EQ(cleanPath(""), "");
}

TEST(RemotePathTest, CleanRejectsInvalidCharacters) {
    for (const auto* bad : {"a*b", "what?", "x|y", "<tag>", "c:d"})
        EXPECT_THROW(cleanPath(bad), std::invalid_argument) << bad;
}

TEST(RemotePathTest, SplitSeparatesLeaf) {
    EXPECT_EQ(splitPath("a/b/c"), std::make_pair(std::string("a/b"), std::string("c")));
    EXPECT_EQ(splitPath("/c/"), std::make_pair(std::string(""), std::string("c")));
    EXPECT_EQ(splitPath(""), std::make_pair(std::string(""), std::string("")));
}

TEST(RemotePathTest, RootPaths) {
    EXPECT_TRUE(isRootPath(""));
    EXPECT_TRUE(isRootPath("/"));
    EXPECT_TRUE(isRootPath("."));
    EXPECT_FALSE(isRootPath("a"));
}

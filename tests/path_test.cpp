#include "segmux/core/path.h"

#include <gtest/gtest.h>

#include <string>
#include <utility>

namespace segmux::core {

TEST(CleanPathTest, EmptyIsRoot) {
    EXPECT_EQ(clean_path(""), "/");
    EXPECT_EQ(clean_path("/"), "/");
    EXPECT_EQ(clean_path("//"), "/");
}

TEST(CleanPathTest, AddsLeadingSlash) {
    EXPECT_EQ(clean_path("foo/bar"), "/foo/bar");
}

TEST(CleanPathTest, CollapsesRepeatedSlashes) {
    EXPECT_EQ(clean_path("/foo//bar///baz"), "/foo/bar/baz");
}

TEST(CleanPathTest, DropsTrailingSlash) {
    EXPECT_EQ(clean_path("/foo/bar/"), "/foo/bar");
}

TEST(CleanPathTest, DotElements) {
    EXPECT_EQ(clean_path("/foo/./bar/."), "/foo/bar");
    EXPECT_EQ(clean_path("/foo/../bar"), "/bar");
    EXPECT_EQ(clean_path("/foo/bar/../.."), "/");
}

TEST(CleanPathTest, DotDotStopsAtRoot) {
    EXPECT_EQ(clean_path("/../../foo"), "/foo");
    EXPECT_EQ(clean_path(".."), "/");
}

TEST(CleanPathTest, KeepsDotsInsideNames) {
    EXPECT_EQ(clean_path("/a.b/..c/d.."), "/a.b/..c/d..");
}

TEST(ShiftSegmentTest, Root) {
    EXPECT_EQ(shift_segment("/"), std::make_pair(std::string{}, std::string{"/"}));
    EXPECT_EQ(shift_segment(""), std::make_pair(std::string{}, std::string{"/"}));
}

TEST(ShiftSegmentTest, SingleSegment) {
    EXPECT_EQ(shift_segment("/foo"), std::make_pair(std::string{"foo"}, std::string{"/"}));
}

TEST(ShiftSegmentTest, SplitsFirstSegment) {
    EXPECT_EQ(shift_segment("/foo/bar/baz"), std::make_pair(std::string{"foo"}, std::string{"/bar/baz"}));
}

TEST(ShiftSegmentTest, EquivalentInputsGiveSameResult) {
    const auto expected = shift_segment("/foo/bar");
    EXPECT_EQ(shift_segment("foo/bar"), expected);
    EXPECT_EQ(shift_segment("/foo//bar"), expected);
    EXPECT_EQ(shift_segment("/foo/./bar/"), expected);
    EXPECT_EQ(shift_segment("/baz/../foo/bar"), expected);
}

TEST(ShiftSegmentTest, IteratesToTheRootSentinel) {
    std::string rest = "/a/b/c";
    std::string collected;
    for (;;) {
        auto [head, tail] = shift_segment(rest);
        if (head.empty()) {
            EXPECT_EQ(tail, "/");
            break;
        }
        collected += head;
        rest = tail;
    }
    EXPECT_EQ(collected, "abc");
}

} // namespace segmux::core

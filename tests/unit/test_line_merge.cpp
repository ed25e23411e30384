#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "merge/line_merge.hpp"

namespace {

using hive::merge::contains_in_order;
using hive::merge::join_lines;
using hive::merge::longest_common_subsequence;
using hive::merge::split_lines;
using hive::merge::three_way_merge;

TEST(LineMergeTest, SplitAndJoinKeepTrailingNewline) {
    const auto lines = split_lines("a\nb\n");
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[2], "");
    EXPECT_EQ(join_lines(lines), "a\nb\n");
    EXPECT_EQ(split_lines("").size(), 1u);
}

TEST(LineMergeTest, LongestCommonSubsequencePairs) {
    const std::vector<std::string> a = {"a", "b", "c", "d"};
    const std::vector<std::string> b = {"a", "c", "x", "d"};
    const auto pairs = longest_common_subsequence(a, b);
    ASSERT_EQ(pairs.size(), 3u);
    EXPECT_EQ(pairs[0], std::make_pair(std::size_t{0}, std::size_t{0}));
    EXPECT_EQ(pairs[1], std::make_pair(std::size_t{2}, std::size_t{1}));
    EXPECT_EQ(pairs[2], std::make_pair(std::size_t{3}, std::size_t{3}));
}

TEST(LineMergeTest, NonOverlappingEditsMergeCleanly) {
    const std::string base = "a\nb\nc\nd\ne";
    const std::string ours = "a\nB\nc\nd\ne";
    const std::string theirs = "a\nb\nc\nD\ne";

    const auto result = three_way_merge(base, ours, theirs);
    EXPECT_TRUE(result.clean);
    EXPECT_TRUE(result.conflicts.empty());
    EXPECT_EQ(result.content, "a\nB\nc\nD\ne");
}

TEST(LineMergeTest, InsertionsOnBothSidesAreKept) {
    const std::string base = "one\ntwo\nthree";
    const std::string ours = "zero\none\ntwo\nthree";
    const std::string theirs = "one\ntwo\nthree\nfour";

    const auto result = three_way_merge(base, ours, theirs);
    EXPECT_TRUE(result.clean);
    EXPECT_EQ(result.content, "zero\none\ntwo\nthree\nfour");
}

TEST(LineMergeTest, IdenticalEditsAreNotConflicts) {
    const auto result = three_way_merge("a\nb\nc", "a\nX\nc", "a\nX\nc");
    EXPECT_TRUE(result.clean);
    EXPECT_EQ(result.content, "a\nX\nc");
}

TEST(LineMergeTest, CompetingEditsProduceMarkedHunk) {
    const auto result = three_way_merge("a\nb\nc", "a\nours\nc", "a\ntheirs\nc");
    EXPECT_FALSE(result.clean);
    ASSERT_EQ(result.conflicts.size(), 1u);
    EXPECT_EQ(result.conflicts[0].base_start, 1u);
    EXPECT_EQ(result.conflicts[0].base_end, 2u);
    EXPECT_EQ(result.conflicts[0].ours, std::vector<std::string>{"ours"});
    EXPECT_EQ(result.conflicts[0].theirs, std::vector<std::string>{"theirs"});
    EXPECT_EQ(result.content, "a\n<<<<<<< ours\nours\n=======\ntheirs\n>>>>>>> theirs\nc");
}

TEST(LineMergeTest, ContainsInOrder) {
    const std::vector<std::string> outer = {"a", "b", "c", "d"};
    EXPECT_TRUE(contains_in_order(outer, {"a", "c"}));
    EXPECT_TRUE(contains_in_order(outer, {}));
    EXPECT_FALSE(contains_in_order(outer, {"c", "a"}));
    EXPECT_FALSE(contains_in_order(outer, {"z"}));
}

}  // namespace

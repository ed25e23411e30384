#pragma once

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace hive::merge {

std::vector<std::string> split_lines(const std::string& text);
std::string join_lines(const std::vector<std::string>& lines);

// Index pairs (a, b) of a longest common subsequence, increasing in both.
std::vector<std::pair<std::size_t, std::size_t>> longest_common_subsequence(
    const std::vector<std::string>& a, const std::vector<std::string>& b);

struct ConflictHunk {
    std::size_t base_start = 0;  // 0-based, half open
    std::size_t base_end = 0;
    std::vector<std::string> ours;
    std::vector<std::string> theirs;
};

struct ThreeWayMergeResult {
    bool clean = false;
    std::string content;  // Carries conflict markers when not clean
    std::vector<ConflictHunk> conflicts;
};

// diff3-style merge of two descendants of `base`.
ThreeWayMergeResult three_way_merge(const std::string& base, const std::string& ours,
                                    const std::string& theirs);

// True when every line of `inner` appears in `outer` in the same order.
bool contains_in_order(const std::vector<std::string>& outer,
                       const std::vector<std::string>& inner);

}  // namespace hive::merge

#include "merge/line_merge.hpp"

#include <algorithm>
#include <optional>

namespace hive::merge {

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    std::string current;
    for (const char c : text) {
        if (c == '\n') {
            lines.push_back(current);
            current.clear();
        } else {
            current.push_back(c);
        }
    }
    lines.push_back(current);
    return lines;
}

std::string join_lines(const std::vector<std::string>& lines) {
    std::string text;
    for (std::size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) {
            text.push_back('\n');
        }
        text += lines[i];
    }
    return text;
}

std::vector<std::pair<std::size_t, std::size_t>> longest_common_subsequence(
    const std::vector<std::string>& a, const std::vector<std::string>& b) {
    const std::size_t n = a.size();
    const std::size_t m = b.size();
    std::vector<std::vector<std::size_t>> table(n + 1, std::vector<std::size_t>(m + 1, 0));
    for (std::size_t i = n; i-- > 0;) {
        for (std::size_t j = m; j-- > 0;) {
            if (a[i] == b[j]) {
                table[i][j] = table[i + 1][j + 1] + 1;
            } else {
                table[i][j] = std::max(table[i + 1][j], table[i][j + 1]);
            }
        }
    }

    std::vector<std::pair<std::size_t, std::size_t>> pairs;
    std::size_t i = 0;
    std::size_t j = 0;
    while (i < n && j < m) {
        if (a[i] == b[j]) {
            pairs.emplace_back(i, j);
            ++i;
            ++j;
        } else if (table[i + 1][j] >= table[i][j + 1]) {
            ++i;
        } else {
            ++j;
        }
    }
    return pairs;
}

namespace {

using Lines = std::vector<std::string>;

Lines slice(const Lines& lines, const std::size_t begin, const std::size_t end) {
    return Lines(lines.begin() + static_cast<std::ptrdiff_t>(begin),
                 lines.begin() + static_cast<std::ptrdiff_t>(end));
}

std::vector<std::optional<std::size_t>> match_map(const Lines& base, const Lines& other) {
    std::vector<std::optional<std::size_t>> matches(base.size());
    for (const auto& pair : longest_common_subsequence(base, other)) {
        matches[pair.first] = pair.second;
    }
    return matches;
}

}  // namespace

ThreeWayMergeResult three_way_merge(const std::string& base, const std::string& ours,
                                    const std::string& theirs) {
    const Lines base_lines = split_lines(base);
    const Lines our_lines = split_lines(ours);
    const Lines their_lines = split_lines(theirs);

    const auto ours_match = match_map(base_lines, our_lines);
    const auto theirs_match = match_map(base_lines, their_lines);

    ThreeWayMergeResult result;
    Lines merged;
    std::size_t b = 0;
    std::size_t o = 0;
    std::size_t t = 0;

    while (b < base_lines.size() || o < our_lines.size() || t < their_lines.size()) {
        // Next base line kept unchanged by both sides.
        std::size_t stable = b;
        while (stable < base_lines.size() &&
               !(ours_match[stable].has_value() && theirs_match[stable].has_value())) {
            ++stable;
        }

        if (stable == b && stable < base_lines.size() && ours_match[stable].value() == o &&
            theirs_match[stable].value() == t) {
            merged.push_back(base_lines[b]);
            ++b;
            ++o;
            ++t;
            continue;
        }

        const std::size_t o_end =
            stable < base_lines.size() ? ours_match[stable].value() : our_lines.size();
        const std::size_t t_end =
            stable < base_lines.size() ? theirs_match[stable].value() : their_lines.size();

        const Lines base_chunk = slice(base_lines, b, stable);
        const Lines our_chunk = slice(our_lines, o, o_end);
        const Lines their_chunk = slice(their_lines, t, t_end);

        const bool ours_changed = our_chunk != base_chunk;
        const bool theirs_changed = their_chunk != base_chunk;

        if (!ours_changed) {
            merged.insert(merged.end(), their_chunk.begin(), their_chunk.end());
        } else if (!theirs_changed || our_chunk == their_chunk) {
            merged.insert(merged.end(), our_chunk.begin(), our_chunk.end());
        } else {
            ConflictHunk hunk;
            hunk.base_start = b;
            hunk.base_end = stable;
            hunk.ours = our_chunk;
            hunk.theirs = their_chunk;
            result.conflicts.push_back(hunk);

            merged.push_back("<<<<<<< ours");
            merged.insert(merged.end(), our_chunk.begin(), our_chunk.end());
            merged.push_back("=======");
            merged.insert(merged.end(), their_chunk.begin(), their_chunk.end());
            merged.push_back(">>>>>>> theirs");
        }

        b = stable;
        o = o_end;
        t = t_end;
    }

    result.clean = result.conflicts.empty();
    result.content = join_lines(merged);
    return result;
}

bool contains_in_order(const Lines& outer, const Lines& inner) {
    std::size_t position = 0;
    for (const auto& line : inner) {
        while (position < outer.size() && outer[position] != line) {
            ++position;
        }
        if (position == outer.size()) {
            return false;
        }
        ++position;
    }
    return true;
}

}  // namespace hive::merge

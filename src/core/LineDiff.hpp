#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace gitcl {

namespace LineDiff {

/// Split into lines, each keeping its '\n' (the last one may lack it)
std::vector<std::string> splitLines(const std::string& text);

/**
 * @brief A changed region: a[aStart, aEnd) is replaced by b[bStart, bEnd)
 *
 * Pure insertions have aStart == aEnd, pure deletions bStart == bEnd.
 */
struct Region {
    size_t aStart{0};
    size_t aEnd{0};
    size_t bStart{0};
    size_t bEnd{0};
};

/**
 * @brief Minimal line diff (Myers O(ND)) as a list of changed regions
 *
 * Regions are sorted and separated by at least one unchanged line.
 */
std::vector<Region> diff(const std::vector<std::string>& a, const std::vector<std::string>& b);

struct MergeResult {
    bool clean{false};
    std::string text;       // Merged content; meaningful only when clean
    size_t conflicts{0};    // Number of conflicting chunks
};

/**
 * @brief Three-way merge of two descendants of `base`
 *
 * A chunk changed on one side takes that side; a chunk changed identically
 * on both sides merges. Overlapping or touching changes that differ are
 * conflicts.
 */
MergeResult merge3(const std::string& base, const std::string& ours, const std::string& theirs);

}

}

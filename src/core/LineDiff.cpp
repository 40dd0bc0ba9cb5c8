#include "core/LineDiff.hpp"

#include <algorithm>

namespace gitcl {

namespace LineDiff {

namespace {

enum class Op { Equal, Delete, Insert };

/**
 * Myers O(ND) diff over a[aLo, aHi) and b[bLo, bHi), appending ops.
 *
 * Each round d keeps a snapshot of the furthest-reaching x per diagonal
 * k in [-d-1, d+1]; backtracking walks the snapshots from the end point.
 */
void myersDiff(const std::vector<std::string>& a, size_t aLo, size_t aHi,
               const std::vector<std::string>& b, size_t bLo, size_t bHi,
               std::vector<Op>& ops) {
    const long n = static_cast<long>(aHi - aLo);
    const long m = static_cast<long>(bHi - bLo);
    const long maxD = n + m;
    if (maxD == 0) return;

    const long offset = maxD + 1;
    std::vector<long> v(static_cast<size_t>(2 * maxD + 3), 0);
    std::vector<std::vector<long>> trace;

    auto at = [&](long k) -> long& { return v[static_cast<size_t>(offset + k)]; };

    long finalD = -1;
    for (long d = 0; d <= maxD && finalD < 0; ++d) {
        trace.emplace_back(v.begin() + (offset - d - 1), v.begin() + (offset + d + 2));
        for (long k = -d; k <= d; k += 2) {
            long x;
            if (k == -d || (k != d && at(k - 1) < at(k + 1))) {
                x = at(k + 1);          // down: insertion
            } else {
                x = at(k - 1) + 1;      // right: deletion
            }
            long y = x - k;
            while (x < n && y < m && a[aLo + static_cast<size_t>(x)] == b[bLo + static_cast<size_t>(y)]) {
                ++x;
                ++y;
            }
            at(k) = x;
            if (x >= n && y >= m) {
                finalD = d;
                break;
            }
        }
    }

    std::vector<Op> reversed;
    long x = n;
    long y = m;
    for (long d = finalD; d >= 0; --d) {
        const std::vector<long>& snap = trace[static_cast<size_t>(d)];
        auto prev = [&](long k) { return snap[static_cast<size_t>(k + d + 1)]; };

        long k = x - y;
        long prevK;
        if (k == -d || (k != d && prev(k - 1) < prev(k + 1))) {
            prevK = k + 1;
        } else {
            prevK = k - 1;
        }
        long prevX = d == 0 ? 0 : prev(prevK);
        long prevY = d == 0 ? 0 : prevX - prevK;

        while (x > prevX && y > prevY) {
            reversed.push_back(Op::Equal);
            --x;
            --y;
        }
        if (d > 0) {
            reversed.push_back(x == prevX ? Op::Insert : Op::Delete);
        }
        x = prevX;
        y = prevY;
    }
    ops.insert(ops.end(), reversed.rbegin(), reversed.rend());
}

/// base[lo, hi) as seen by one side, given that side's regions inside the range
std::string sideText(const std::vector<std::string>& base, const std::vector<std::string>& side,
                     const std::vector<Region>& regions, size_t lo, size_t hi) {
    std::string out;
    size_t cur = lo;
    for (const auto& r : regions) {
        for (size_t i = cur; i < r.aStart; ++i) out += base[i];
        for (size_t i = r.bStart; i < r.bEnd; ++i) out += side[i];
        cur = r.aEnd;
    }
    for (size_t i = cur; i < hi; ++i) out += base[i];
    return out;
}

struct TaggedRegion {
    Region region;
    bool ours{false};
};

}

std::vector<std::string> splitLines(const std::string& text) {
    std::vector<std::string> out;
    size_t start = 0;
    while (start < text.size()) {
        size_t nl = text.find('\n', start);
        if (nl == std::string::npos) {
            out.push_back(text.substr(start));
            break;
        }
        out.push_back(text.substr(start, nl - start + 1));
        start = nl + 1;
    }
    return out;
}

std::vector<Region> diff(const std::vector<std::string>& a, const std::vector<std::string>& b) {
    // Common prefix and suffix never take part in the edit script
    size_t prefix = 0;
    while (prefix < a.size() && prefix < b.size() && a[prefix] == b[prefix]) {
        ++prefix;
    }
    size_t suffix = 0;
    while (suffix < a.size() - prefix && suffix < b.size() - prefix &&
           a[a.size() - 1 - suffix] == b[b.size() - 1 - suffix]) {
        ++suffix;
    }

    std::vector<Op> ops;
    myersDiff(a, prefix, a.size() - suffix, b, prefix, b.size() - suffix, ops);

    std::vector<Region> regions;
    size_t ia = prefix;
    size_t ib = prefix;
    size_t i = 0;
    while (i < ops.size()) {
        if (ops[i] == Op::Equal) {
            ++ia;
            ++ib;
            ++i;
            continue;
        }
        Region r{ia, ia, ib, ib};
        while (i < ops.size() && ops[i] != Op::Equal) {
            if (ops[i] == Op::Delete) {
                ++ia;
            } else {
                ++ib;
            }
            ++i;
        }
        r.aEnd = ia;
        r.bEnd = ib;
        regions.push_back(r);
    }
    return regions;
}

MergeResult merge3(const std::string& base, const std::string& ours, const std::string& theirs) {
    MergeResult result;
    if (ours == theirs) {
        result.clean = true;
        result.text = ours;
        return result;
    }
    if (ours == base) {
        result.clean = true;
        result.text = theirs;
        return result;
    }
    if (theirs == base) {
        result.clean = true;
        result.text = ours;
        return result;
    }

    std::vector<std::string> baseLines = splitLines(base);
    std::vector<std::string> ourLines = splitLines(ours);
    std::vector<std::string> theirLines = splitLines(theirs);

    std::vector<TaggedRegion> all;
    for (const auto& r : diff(baseLines, ourLines)) all.push_back({r, true});
    for (const auto& r : diff(baseLines, theirLines)) all.push_back({r, false});
    std::stable_sort(all.begin(), all.end(), [](const TaggedRegion& x, const TaggedRegion& y) {
        if (x.region.aStart != y.region.aStart) return x.region.aStart < y.region.aStart;
        return x.region.aEnd < y.region.aEnd;
    });

    size_t cur = 0;
    size_t i = 0;
    while (i < all.size()) {
        size_t lo = all[i].region.aStart;
        size_t hi = all[i].region.aEnd;
        std::vector<Region> ourChunk;
        std::vector<Region> theirChunk;

        // Grow the chunk while regions overlap or touch it
        size_t j = i;
        while (j < all.size() && (j == i || all[j].region.aStart <= hi)) {
            hi = std::max(hi, all[j].region.aEnd);
            (all[j].ours ? ourChunk : theirChunk).push_back(all[j].region);
            ++j;
        }

        for (size_t k = cur; k < lo; ++k) result.text += baseLines[k];

        if (theirChunk.empty()) {
            result.text += sideText(baseLines, ourLines, ourChunk, lo, hi);
        } else if (ourChunk.empty()) {
            result.text += sideText(baseLines, theirLines, theirChunk, lo, hi);
        } else {
            std::string ourText = sideText(baseLines, ourLines, ourChunk, lo, hi);
            std::string theirText = sideText(baseLines, theirLines, theirChunk, lo, hi);
            if (ourText == theirText) {
                result.text += ourText;
            } else {
                ++result.conflicts;
            }
        }
        cur = hi;
        i = j;
    }
    for (size_t k = cur; k < baseLines.size(); ++k) result.text += baseLines[k];

    result.clean = result.conflicts == 0;
    return result;
}

}

}

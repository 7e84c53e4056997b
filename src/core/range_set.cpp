/**
 * @file range_set.cpp
 * @brief range_set implementation
 */

#include "kcenon/path_migration/core/range_set.h"

#include <algorithm>
#include <iterator>

namespace kcenon::path_migration {

auto range_set::add(byte_range range) -> uint64_t {
    if (range.empty()) {
        return 0;
    }

    uint64_t start = range.offset;
    uint64_t end = range.end();
    uint64_t already = 0;

    // First range that could touch [start, end)
    auto it = ranges_.upper_bound(start);
    if (it != ranges_.begin()) {
        auto prev = std::prev(it);
        if (prev->second >= start) {
            it = prev;
        }
    }

    while (it != ranges_.end() && it->first <= end) {
        auto overlap_begin = std::max(it->first, range.offset);
        auto overlap_end = std::min(it->second, range.end());
        if (overlap_end > overlap_begin) {
            already += overlap_end - overlap_begin;
        }
        start = std::min(start, it->first);
        end = std::max(end, it->second);
        it = ranges_.erase(it);
    }

    ranges_.emplace(start, end);
    return range.length - already;
}

void range_set::erase_below(uint64_t offset) {
    auto it = ranges_.begin();
    while (it != ranges_.end() && it->first < offset) {
        if (it->second <= offset) {
            it = ranges_.erase(it);
            continue;
        }
        auto end = it->second;
        ranges_.erase(it);
        ranges_.emplace(offset, end);
        break;
    }
}

auto range_set::contains(byte_range range) const -> bool {
    if (range.empty()) {
        return true;
    }
    return contiguous_end(range.offset) >= range.end();
}

auto range_set::missing(byte_range range) const -> std::vector<byte_range> {
    std::vector<byte_range> gaps;
    if (range.empty()) {
        return gaps;
    }

    uint64_t cursor = range.offset;
    auto it = ranges_.upper_bound(cursor);
    if (it != ranges_.begin()) {
        --it;
    }

    for (; it != ranges_.end() && cursor < range.end(); ++it) {
        if (it->second <= cursor) {
            continue;
        }
        if (it->first >= range.end()) {
            break;
        }
        if (it->first > cursor) {
            gaps.push_back({cursor, it->first - cursor});
        }
        cursor = std::max(cursor, it->second);
    }

    if (cursor < range.end()) {
        gaps.push_back({cursor, range.end() - cursor});
    }
    return gaps;
}

auto range_set::contiguous_end(uint64_t from) const -> uint64_t {
    auto it = ranges_.upper_bound(from);
    if (it == ranges_.begin()) {
        return from;
    }
    --it;
    return it->second > from ? it->second : from;
}

auto range_set::ranges() const -> std::vector<byte_range> {
    std::vector<byte_range> out;
    out.reserve(ranges_.size());
    for (const auto& [start, end] : ranges_) {
        out.push_back({start, end - start});
    }
    return out;
}

auto range_set::covered_bytes() const -> uint64_t {
    uint64_t total = 0;
    for (const auto& [start, end] : ranges_) {
        total += end - start;
    }
    return total;
}

}  // namespace kcenon::path_migration

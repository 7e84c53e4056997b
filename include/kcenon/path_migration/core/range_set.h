/**
 * @file range_set.h
 * @brief Set of disjoint byte ranges used for ack and reassembly tracking
 */

#ifndef KCENON_PATH_MIGRATION_CORE_RANGE_SET_H
#define KCENON_PATH_MIGRATION_CORE_RANGE_SET_H

#include <cstdint>
#include <map>
#include <vector>

namespace kcenon::path_migration {

/**
 * @brief Half-open byte range [offset, offset + length)
 */
struct byte_range {
    uint64_t offset = 0;
    uint64_t length = 0;

    [[nodiscard]] auto end() const -> uint64_t { return offset + length; }
    [[nodiscard]] auto empty() const -> bool { return length == 0; }

    [[nodiscard]] auto operator==(const byte_range& other) const -> bool = default;
};

/**
 * @brief Ordered set of non-overlapping, non-adjacent byte ranges
 *
 * Adjacent and overlapping inserts are merged, so iteration always yields
 * maximal ranges in ascending order.
 */
class range_set {
public:
    range_set() = default;

    /**
     * @brief Insert a range, merging with neighbours
     * @return Number of bytes that were not already covered
     */
    auto add(byte_range range) -> uint64_t;

    /**
     * @brief Remove every byte below offset
     */
    void erase_below(uint64_t offset);

    /**
     * @brief Check whether every byte of range is covered
     */
    [[nodiscard]] auto contains(byte_range range) const -> bool;

    /**
     * @brief Portions of range not covered by this set, ascending
     */
    [[nodiscard]] auto missing(byte_range range) const -> std::vector<byte_range>;

    /**
     * @brief End of the contiguous coverage starting at from
     *
     * Returns from itself when from is not covered.
     */
    [[nodiscard]] auto contiguous_end(uint64_t from) const -> uint64_t;

    [[nodiscard]] auto ranges() const -> std::vector<byte_range>;
    [[nodiscard]] auto covered_bytes() const -> uint64_t;
    [[nodiscard]] auto empty() const -> bool { return ranges_.empty(); }
    void clear() { ranges_.clear(); }

private:
    std::map<uint64_t, uint64_t> ranges_;  ///< start -> end (exclusive)
};

}  // namespace kcenon::path_migration

#endif  // KCENON_PATH_MIGRATION_CORE_RANGE_SET_H

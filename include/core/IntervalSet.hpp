#pragma once

#include <string>
#include <vector>

#include "DataStructs.hpp"
#include "Types.hpp"

namespace AnnoEnrich {

/**
 * @brief Ordered collection of genomic intervals grouped by chromosome.
 *
 * Intervals are kept sorted by (chrom, start, end). A set is a value: the
 * algebra below always returns new sets and never mutates its operands.
 *
 * After reduce() the intervals of every chromosome are pairwise disjoint and
 * non-adjacent, so total_bases() equals the number of covered bases.
 */
class IntervalSet {
public:
    using const_iterator = std::vector<GenomicInterval>::const_iterator;

    IntervalSet() = default;

    /**
     * @brief Builds a set from already normalised intervals.
     * @throws MalformedInputError if an interval has start > end or start < 1.
     */
    explicit IntervalSet(std::vector<GenomicInterval> intervals);

    /**
     * @brief Builds a set from raw table rows.
     *
     * Each row is normalised with normalize_row(); rows that fail are dropped
     * and counted in @p stats (partial input loss is not fatal).
     *
     * @throws MalformedInputError if no row of a non-empty table has the
     *         columns required by @p format.
     */
    static IntervalSet from_rows(const std::vector<RawRow>& rows, InputFormat format, ParseStats* stats = nullptr);

    /**
     * @brief Converts one row into a 1-based inclusive interval.
     *
     * data.frame: chrom, start[, end] (end := start when absent), 1-based.
     * bed:        chrom, start, end with 0-based start.
     * chr:start-end: first column "chr:start-end" (0-based start) or "chr:pos".
     * GRanges:    chrom, start, end, 1-based, all three required.
     *
     * @throws MalformedInputError on missing columns or bad coordinates.
     */
    static GenomicInterval normalize_row(const RawRow& row, InputFormat format);

    /// Reduced union of several sets.
    static IntervalSet union_of(const std::vector<const IntervalSet*>& sets);

    /**
     * @brief Minimal disjoint cover: overlapping or adjacent ranges merged.
     */
    IntervalSet reduce() const;

    /// True if no two intervals on a chromosome overlap or touch.
    bool is_reduced() const;

    /// Sum of interval widths (double-counts overlaps unless reduced).
    Position total_bases() const;

    /**
     * @brief Sum of intersected widths over every overlapping pair.
     *
     * Sort-and-sweep join, O((n + m) log(n + m) + k) for k overlapping pairs.
     */
    Position intersect_count(const IntervalSet& other) const;

    /**
     * @brief Pairwise intersections with @p other as a new set.
     *
     * Only the overlapping sub-ranges are kept. When both operands are
     * reduced the result is reduced as well.
     */
    IntervalSet intersect(const IntervalSet& other) const;

    /// True if @p interval lies entirely inside one interval of the reduced set.
    bool covers(const GenomicInterval& interval) const;

    /// Distinct chromosome names in set order.
    std::vector<std::string> chromosomes() const;

    size_t size() const { return intervals_.size(); }
    bool empty() const { return intervals_.empty(); }
    const GenomicInterval& operator[](size_t i) const { return intervals_[i]; }
    const_iterator begin() const { return intervals_.begin(); }
    const_iterator end() const { return intervals_.end(); }
    const std::vector<GenomicInterval>& intervals() const { return intervals_; }

    bool operator==(const IntervalSet& other) const { return intervals_ == other.intervals_; }
    bool operator!=(const IntervalSet& other) const { return !(*this == other); }

private:
    std::vector<GenomicInterval> intervals_;
};

}  // namespace AnnoEnrich

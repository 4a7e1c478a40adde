#pragma once

#include <cstdint>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

#include "Types.hpp"

namespace AnnoEnrich {

/**
 * @brief A genomic range on one chromosome.
 *
 * Coordinates are always 1-based and inclusive; conversion from other
 * conventions happens once during row normalisation.
 *
 * A plain value. Intervals held by an IntervalSet are owned by the set and
 * only exposed through const references, so they never change once the set
 * is built.
 */
struct GenomicInterval {
    std::string chrom;  ///< Chromosome name (e.g. "chr1")
    Position start;     ///< 1-based start (inclusive)
    Position end;       ///< 1-based end (inclusive), start <= end

    GenomicInterval() : start(0), end(-1) {}
    GenomicInterval(std::string chrom_name, Position s, Position e)
        : chrom(std::move(chrom_name)), start(s), end(e) {}

    /// Number of bases covered.
    Position width() const { return end - start + 1; }

    bool operator==(const GenomicInterval& other) const {
        return chrom == other.chrom && start == other.start && end == other.end;
    }
    bool operator!=(const GenomicInterval& other) const { return !(*this == other); }

    /// Ordering by (chrom, start, end).
    bool operator<(const GenomicInterval& other) const {
        return std::tie(chrom, start, end) < std::tie(other.chrom, other.start, other.end);
    }

    /// "chr:start-end" in 1-based coordinates.
    std::string to_string() const {
        return chrom + ":" + std::to_string(start) + "-" + std::to_string(end);
    }
};

/**
 * @brief One unparsed line of an input table (tab-separated fields).
 */
struct RawRow {
    std::vector<std::string> fields;
    int64_t line_no = 0;  ///< 1-based source line, 0 if not from a file
};

/**
 * @brief Book-keeping of rows dropped while normalising a table.
 */
struct ParseStats {
    int64_t rows_total = 0;
    int64_t rows_kept = 0;
    int64_t rows_dropped = 0;
    int64_t rows_short = 0;  ///< Dropped because of missing columns
};

/**
 * @brief One row of the final enrichment table.
 */
struct EnrichmentRecord {
    std::string name;   ///< Annotation category
    int64_t n_anno;     ///< Bases covered by the category
    int64_t n_overlap;  ///< Bases of data overlapping the category
    int64_t n_data;     ///< Bases covered by the data
    int64_t n_bg;       ///< Bases covered by the background
    double n_expect;    ///< Mean null overlap
    double fc;          ///< Fold change n_overlap / n_expect
    double zscore;      ///< (n_overlap - n_expect) / sd
    double pvalue;      ///< Empirical upper-tail p-value
    double adjp;        ///< Multiple-testing adjusted p-value

    EnrichmentRecord()
        : n_anno(0), n_overlap(0), n_data(0), n_bg(0), n_expect(0.0), fc(1.0), zscore(0.0), pvalue(1.0), adjp(1.0) {}
};

}  // namespace AnnoEnrich

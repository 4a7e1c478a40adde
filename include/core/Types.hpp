#pragma once

#include <cstdint>
#include <limits>
#include <string>

namespace AnnoEnrich {

/**
 * @brief Encoding of an input interval table.
 *
 * Every format is normalised to 1-based inclusive coordinates right after
 * parsing (see IntervalSet::from_rows).
 */
enum class InputFormat {
    DATA_FRAME,  ///< chrom, start[, end]; 1-based
    BED,         ///< chrom, start, end; 0-based start
    CHR_RANGE,   ///< "chr:start-end" in the first column
    GRANGES      ///< pre-built 1-based chrom, start, end
};

/**
 * @brief Multiple-testing correction procedure.
 */
enum class PAdjustMethod {
    BH,          ///< Benjamini-Hochberg (FDR)
    BY,          ///< Benjamini-Yekutieli (FDR under dependency)
    BONFERRONI,  ///< Bonferroni (FWER)
    HOLM,        ///< Holm step-down (FWER)
    HOCHBERG,    ///< Hochberg step-up (FWER)
    HOMMEL       ///< Hommel (FWER)
};

/**
 * @brief Log level for controlling output verbosity.
 */
enum class LogLevel {
    LOG_ERROR = 0,  ///< Only errors
    LOG_WARN = 1,   ///< Errors and warnings
    LOG_INFO = 2,   ///< Normal operational messages
    LOG_DEBUG = 3   ///< Detailed debug output including dropped rows
};

/// Genomic coordinate (1-based, inclusive).
using Position = int64_t;

/// Sentinel for an unbounded gap_max.
constexpr Position kUnboundedGap = std::numeric_limits<Position>::max();

std::string format_to_string(InputFormat format);

/**
 * @brief Parse a format name ("data.frame", "bed", "chr:start-end", "GRanges").
 * @throws ConfigurationError on unknown names.
 */
InputFormat string_to_format(const std::string& str);

std::string p_adjust_to_string(PAdjustMethod method);

/**
 * @brief Parse a method name, case-insensitive ("BH", "fdr", "holm", ...).
 * @throws ConfigurationError on unknown names.
 */
PAdjustMethod string_to_p_adjust(const std::string& str);

}  // namespace AnnoEnrich

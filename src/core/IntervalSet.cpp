#include "core/IntervalSet.hpp"

#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <optional>

#include "core/Errors.hpp"
#include "utils/Logger.hpp"

namespace AnnoEnrich {

// ============================================================================
// Row normalisation helpers
// ============================================================================

/// Number of offending rows echoed at DEBUG level per table.
static constexpr int64_t kMaxReportedRows = 5;

static std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

/**
 * @brief Numeric coercion of a coordinate field.
 *
 * Accepts any finite decimal that holds an integral value ("100", "1e5",
 * "2.0"); everything else is rejected.
 */
static std::optional<Position> parse_coordinate(const std::string& field) {
    std::string s = trim(field);
    if (s.empty()) return std::nullopt;

    errno = 0;
    char* end_ptr = nullptr;
    double value = std::strtod(s.c_str(), &end_ptr);
    if (end_ptr != s.c_str() + s.size() || errno == ERANGE) return std::nullopt;
    if (!std::isfinite(value) || std::floor(value) != value) return std::nullopt;
    if (std::fabs(value) > 9.0e15) return std::nullopt;

    return static_cast<Position>(value);
}

static Position require_coordinate(const std::string& field, const char* what) {
    auto pos = parse_coordinate(field);
    if (!pos) {
        throw MalformedInputError(std::string("non-numeric ") + what + " '" + field + "'");
    }
    return *pos;
}

/// Columns a row must provide for @p format.
static size_t required_columns(InputFormat format) {
    switch (format) {
        case InputFormat::DATA_FRAME: return 2;
        case InputFormat::BED: return 3;
        case InputFormat::CHR_RANGE: return 1;
        case InputFormat::GRANGES: return 3;
        default: return 3;
    }
}

// ============================================================================
// Construction
// ============================================================================

IntervalSet::IntervalSet(std::vector<GenomicInterval> intervals) : intervals_(std::move(intervals)) {
    for (const auto& iv : intervals_) {
        if (iv.start < 1 || iv.end < iv.start) {
            throw MalformedInputError("Invalid interval " + iv.to_string());
        }
    }
    std::sort(intervals_.begin(), intervals_.end());
}

GenomicInterval IntervalSet::normalize_row(const RawRow& row, InputFormat format) {
    const auto& f = row.fields;
    if (f.size() < required_columns(format)) {
        throw MalformedInputError("expected at least " + std::to_string(required_columns(format)) +
                                  " columns, found " + std::to_string(f.size()));
    }

    std::string chrom;
    Position start = 0;
    Position end = 0;
    bool zero_based = false;

    switch (format) {
        case InputFormat::DATA_FRAME: {
            chrom = trim(f[0]);
            start = require_coordinate(f[1], "start");
            end = f.size() >= 3 ? require_coordinate(f[2], "end") : start;
            break;
        }
        case InputFormat::BED: {
            chrom = trim(f[0]);
            start = require_coordinate(f[1], "start");
            end = require_coordinate(f[2], "end");
            zero_based = true;
            break;
        }
        case InputFormat::CHR_RANGE: {
            // "chr:start-end" or "chr:pos"
            const std::string token = trim(f[0]);
            size_t colon = token.find(':');
            if (colon == std::string::npos || colon == 0) {
                throw MalformedInputError("'" + token + "' is not chr:start-end");
            }
            chrom = token.substr(0, colon);
            std::string range = token.substr(colon + 1);
            size_t dash = range.find('-');
            if (dash == std::string::npos) {
                start = require_coordinate(range, "position");
                end = start;
            } else {
                start = require_coordinate(range.substr(0, dash), "start");
                end = require_coordinate(range.substr(dash + 1), "end");
                zero_based = true;
            }
            break;
        }
        case InputFormat::GRANGES: {
            chrom = trim(f[0]);
            start = require_coordinate(f[1], "start");
            end = require_coordinate(f[2], "end");
            break;
        }
    }

    if (chrom.empty()) {
        throw MalformedInputError("empty chromosome name");
    }

    // The single place where coordinate conventions are reconciled.
    if (zero_based) {
        start += 1;
    }

    if (start < 1 || end < start) {
        throw MalformedInputError("invalid range " + chrom + ":" + std::to_string(start) + "-" + std::to_string(end));
    }

    return GenomicInterval(chrom, start, end);
}

IntervalSet IntervalSet::from_rows(const std::vector<RawRow>& rows, InputFormat format, ParseStats* stats) {
    ParseStats local;
    std::vector<GenomicInterval> intervals;
    intervals.reserve(rows.size());

    for (const auto& row : rows) {
        local.rows_total++;
        if (row.fields.size() < required_columns(format)) {
            local.rows_short++;
        }
        try {
            intervals.push_back(normalize_row(row, format));
            local.rows_kept++;
        } catch (const MalformedInputError& e) {
            local.rows_dropped++;
            if (local.rows_dropped <= kMaxReportedRows) {
                LOG_DEBUG("Dropped row " + std::to_string(row.line_no) + ": " + e.what());
            }
        }
    }

    if (local.rows_total > 0 && local.rows_short == local.rows_total) {
        throw MalformedInputError("Input is not formatted as '" + format_to_string(format) + "': every row has fewer than " +
                                  std::to_string(required_columns(format)) + " columns");
    }

    if (stats) {
        *stats = local;
    }
    return IntervalSet(std::move(intervals));
}

IntervalSet IntervalSet::union_of(const std::vector<const IntervalSet*>& sets) {
    std::vector<GenomicInterval> all;
    size_t total = 0;
    for (const auto* s : sets) total += s->size();
    all.reserve(total);
    for (const auto* s : sets) {
        all.insert(all.end(), s->begin(), s->end());
    }
    return IntervalSet(std::move(all)).reduce();
}

// ============================================================================
// Algebra
// ============================================================================

IntervalSet IntervalSet::reduce() const {
    IntervalSet out;
    if (intervals_.empty()) return out;

    auto& res = out.intervals_;
    res.reserve(intervals_.size());
    res.push_back(intervals_.front());

    for (size_t i = 1; i < intervals_.size(); ++i) {
        const auto& cur = intervals_[i];
        auto& last = res.back();
        // merge overlapping and touching ranges (gap = 0)
        if (cur.chrom == last.chrom && cur.start <= last.end + 1) {
            last.end = std::max(last.end, cur.end);
        } else {
            res.push_back(cur);
        }
    }
    return out;
}

bool IntervalSet::is_reduced() const {
    for (size_t i = 1; i < intervals_.size(); ++i) {
        const auto& prev = intervals_[i - 1];
        const auto& cur = intervals_[i];
        if (prev.chrom == cur.chrom && cur.start <= prev.end + 1) {
            return false;
        }
    }
    return true;
}

Position IntervalSet::total_bases() const {
    Position total = 0;
    for (const auto& iv : intervals_) {
        total += iv.width();
    }
    return total;
}

/**
 * @brief Visits every overlapping pair of two sorted interval vectors.
 *
 * Intervals of both sides are consumed in start order; each side keeps the
 * still-open intervals of the other side, so every pair is reported once,
 * by the member that starts later (ties: the right-hand side).
 */
template <typename Fn>
static void sweep_overlaps(const std::vector<GenomicInterval>& a, const std::vector<GenomicInterval>& b,
                           Fn&& on_overlap) {
    size_t i = 0;
    size_t j = 0;
    std::vector<const GenomicInterval*> open_a;
    std::vector<const GenomicInterval*> open_b;

    while (i < a.size() && j < b.size()) {
        // align both cursors on the same chromosome
        if (a[i].chrom != b[j].chrom) {
            if (a[i].chrom < b[j].chrom) {
                const std::string& chrom = a[i].chrom;
                while (i < a.size() && a[i].chrom == chrom) ++i;
            } else {
                const std::string& chrom = b[j].chrom;
                while (j < b.size() && b[j].chrom == chrom) ++j;
            }
            continue;
        }

        const std::string chrom = a[i].chrom;
        size_t a_end = i;
        while (a_end < a.size() && a[a_end].chrom == chrom) ++a_end;
        size_t b_end = j;
        while (b_end < b.size() && b[b_end].chrom == chrom) ++b_end;

        open_a.clear();
        open_b.clear();
        while (i < a_end || j < b_end) {
            bool take_a = (j >= b_end) || (i < a_end && a[i].start <= b[j].start);
            const GenomicInterval& x = take_a ? a[i++] : b[j++];
            auto& others = take_a ? open_b : open_a;
            auto& mine = take_a ? open_a : open_b;

            others.erase(std::remove_if(others.begin(), others.end(),
                                        [&x](const GenomicInterval* p) { return p->end < x.start; }),
                         others.end());
            for (const GenomicInterval* p : others) {
                on_overlap(x.chrom, x.start, std::min(x.end, p->end));
            }
            mine.push_back(&x);
        }
    }
}

Position IntervalSet::intersect_count(const IntervalSet& other) const {
    Position total = 0;
    sweep_overlaps(intervals_, other.intervals_,
                   [&total](const std::string&, Position s, Position e) { total += e - s + 1; });
    return total;
}

IntervalSet IntervalSet::intersect(const IntervalSet& other) const {
    std::vector<GenomicInterval> pieces;
    sweep_overlaps(intervals_, other.intervals_, [&pieces](const std::string& chrom, Position s, Position e) {
        pieces.emplace_back(chrom, s, e);
    });
    return IntervalSet(std::move(pieces));
}

bool IntervalSet::covers(const GenomicInterval& interval) const {
    // first interval that is not before (chrom, start)
    auto it = std::upper_bound(intervals_.begin(), intervals_.end(), interval.start,
                               [&interval](Position pos, const GenomicInterval& iv) {
                                   if (interval.chrom != iv.chrom) return interval.chrom < iv.chrom;
                                   return pos < iv.start;
                               });
    if (it == intervals_.begin()) return false;
    --it;
    if (it->chrom != interval.chrom) return false;
    if (it->start <= interval.start && interval.end <= it->end) return true;
    if (is_reduced()) return false;

    // unreduced sets: an earlier interval on the chromosome may still contain it
    while (it != intervals_.begin()) {
        --it;
        if (it->chrom != interval.chrom) return false;
        if (it->start <= interval.start && interval.end <= it->end) return true;
    }
    return false;
}

std::vector<std::string> IntervalSet::chromosomes() const {
    std::vector<std::string> names;
    for (const auto& iv : intervals_) {
        if (names.empty() || names.back() != iv.chrom) {
            names.push_back(iv.chrom);
        }
    }
    return names;
}

}  // namespace AnnoEnrich

/**
 * @file test_interval_set.cpp
 * @brief Unit tests for IntervalSet and row normalisation
 *
 * Tests cover:
 * 1. Reduction (overlapping and adjacent merges, idempotence)
 * 2. Overlap counting and intersection (symmetry, multiple chromosomes)
 * 3. Row normalisation for every input format
 * 4. Dropping malformed rows and table-level failures
 * 5. Sets never expose mutable intervals
 */

#include <gtest/gtest.h>

#include <random>
#include <type_traits>
#include <utility>
#include <vector>

#include "core/DataStructs.hpp"
#include "core/Errors.hpp"
#include "core/IntervalSet.hpp"

using namespace AnnoEnrich;

using IV = std::vector<GenomicInterval>;

static RawRow make_row(std::vector<std::string> fields) {
    RawRow row;
    row.fields = std::move(fields);
    return row;
}

// ============================================================================
// Reduction
// ============================================================================

TEST(IntervalSetTest, ReduceMergesOverlappingAndAdjacent) {
    IntervalSet set(IV{{"chr1", 100, 200}, {"chr1", 150, 250}, {"chr1", 251, 300}, {"chr1", 302, 310}});
    IntervalSet reduced = set.reduce();

    ASSERT_EQ(reduced.size(), 2u);
    EXPECT_EQ(reduced[0], GenomicInterval("chr1", 100, 300));
    EXPECT_EQ(reduced[1], GenomicInterval("chr1", 302, 310));
    EXPECT_EQ(reduced.total_bases(), 201 + 9);
    EXPECT_TRUE(reduced.is_reduced());
    EXPECT_FALSE(set.is_reduced());
}

TEST(IntervalSetTest, ReduceKeepsChromosomesApart) {
    IntervalSet set(IV{{"chr2", 1, 10}, {"chr1", 5, 20}, {"chr1", 1, 10}});
    IntervalSet reduced = set.reduce();

    ASSERT_EQ(reduced.size(), 2u);
    EXPECT_EQ(reduced[0], GenomicInterval("chr1", 1, 20));
    EXPECT_EQ(reduced[1], GenomicInterval("chr2", 1, 10));
    EXPECT_EQ(reduced.chromosomes(), (std::vector<std::string>{"chr1", "chr2"}));
}

TEST(IntervalSetTest, ReduceIsIdempotentOnRandomSets) {
    std::mt19937 rng(17);
    std::uniform_int_distribution<int> pos(1, 5000);
    std::uniform_int_distribution<int> len(0, 300);
    std::uniform_int_distribution<int> chr(1, 3);

    for (int round = 0; round < 20; ++round) {
        std::vector<GenomicInterval> ivs;
        for (int k = 0; k < 200; ++k) {
            Position s = pos(rng);
            ivs.emplace_back("chr" + std::to_string(chr(rng)), s, s + len(rng));
        }
        IntervalSet x(ivs);
        IntervalSet once = x.reduce();
        EXPECT_EQ(once.reduce(), once);
        EXPECT_LE(once.total_bases(), x.total_bases());
        EXPECT_TRUE(once.is_reduced());
    }
}

TEST(IntervalSetTest, IntervalsAreReadOnly) {
    static_assert(std::is_same<decltype(std::declval<IntervalSet&>()[0]), const GenomicInterval&>::value,
                  "element access must be const");
    static_assert(std::is_same<decltype(*std::declval<IntervalSet&>().begin()), const GenomicInterval&>::value,
                  "iteration must be const");

    IntervalSet set(IV{{"chr1", 1, 10}, {"chr1", 5, 20}, {"chr1", 21, 30}});
    IntervalSet copy = set;
    IntervalSet reduced = set.reduce();

    EXPECT_EQ(set, copy);
    EXPECT_EQ(set.size(), 3u);
    ASSERT_EQ(reduced.size(), 1u);
    EXPECT_EQ(reduced[0], GenomicInterval("chr1", 1, 30));
}

TEST(IntervalSetTest, DisjointSetKeepsTotalBases) {
    IntervalSet set(IV{{"chr1", 1, 10}, {"chr1", 20, 30}});
    EXPECT_EQ(set.reduce().total_bases(), set.total_bases());
}

TEST(IntervalSetTest, RejectsInvalidIntervals) {
    EXPECT_THROW(IntervalSet(IV{{"chr1", 10, 5}}), MalformedInputError);
    EXPECT_THROW(IntervalSet(IV{{"chr1", 0, 5}}), MalformedInputError);
}

// ============================================================================
// Overlap
// ============================================================================

TEST(IntervalSetTest, IntersectCountSumsIntersectedWidths) {
    IntervalSet a(IV{{"chr1", 100, 200}});
    IntervalSet b(IV{{"chr1", 150, 160}, {"chr1", 190, 250}, {"chr2", 100, 200}});

    EXPECT_EQ(a.intersect_count(b), 11 + 11);
    EXPECT_EQ(b.intersect_count(a), 11 + 11);
}

TEST(IntervalSetTest, IntersectCountCountsEveryPair) {
    // unreduced query: overlapping sample intervals count twice
    IntervalSet sample(IV{{"chr1", 100, 120}, {"chr1", 110, 130}});
    IntervalSet anno(IV{{"chr1", 115, 125}});
    EXPECT_EQ(sample.intersect_count(anno), 6 + 11);
}

TEST(IntervalSetTest, IntersectCountIsSymmetricOnRandomSets) {
    std::mt19937 rng(5);
    std::uniform_int_distribution<int> pos(1, 10000);
    std::uniform_int_distribution<int> len(0, 500);

    for (int round = 0; round < 20; ++round) {
        std::vector<GenomicInterval> va, vb;
        for (int k = 0; k < 100; ++k) {
            Position s = pos(rng);
            va.emplace_back(k % 2 ? "chr1" : "chrX", s, s + len(rng));
            s = pos(rng);
            vb.emplace_back(k % 3 ? "chr1" : "chr2", s, s + len(rng));
        }
        IntervalSet a(va), b(vb);

        // brute force reference
        Position expected = 0;
        for (const auto& x : va) {
            for (const auto& y : vb) {
                if (x.chrom != y.chrom) continue;
                Position s = std::max(x.start, y.start);
                Position e = std::min(x.end, y.end);
                if (s <= e) expected += e - s + 1;
            }
        }
        EXPECT_EQ(a.intersect_count(b), expected);
        EXPECT_EQ(b.intersect_count(a), expected);
    }
}

TEST(IntervalSetTest, IntersectKeepsOnlyOverlappingPieces) {
    IntervalSet a(IV{{"chr1", 1, 100}, {"chr1", 200, 300}});
    IntervalSet b(IV{{"chr1", 50, 250}});
    IntervalSet c = a.intersect(b);

    ASSERT_EQ(c.size(), 2u);
    EXPECT_EQ(c[0], GenomicInterval("chr1", 50, 100));
    EXPECT_EQ(c[1], GenomicInterval("chr1", 200, 250));
    EXPECT_TRUE(c.is_reduced());
}

TEST(IntervalSetTest, EmptyOperands) {
    IntervalSet empty;
    IntervalSet a(IV{{"chr1", 1, 100}});
    EXPECT_EQ(a.intersect_count(empty), 0);
    EXPECT_EQ(empty.intersect_count(a), 0);
    EXPECT_TRUE(a.intersect(empty).empty());
    EXPECT_TRUE(empty.reduce().empty());
}

TEST(IntervalSetTest, CoversAndUnion) {
    IntervalSet a(IV{{"chr1", 1, 100}});
    IntervalSet b(IV{{"chr1", 90, 150}, {"chr3", 10, 20}});
    IntervalSet u = IntervalSet::union_of({&a, &b});

    ASSERT_EQ(u.size(), 2u);
    EXPECT_EQ(u[0], GenomicInterval("chr1", 1, 150));
    EXPECT_TRUE(u.covers(GenomicInterval("chr1", 50, 120)));
    EXPECT_FALSE(u.covers(GenomicInterval("chr1", 140, 151)));
    EXPECT_FALSE(u.covers(GenomicInterval("chr2", 1, 5)));
    EXPECT_TRUE(u.covers(GenomicInterval("chr3", 10, 20)));
}

// ============================================================================
// Row normalisation
// ============================================================================

TEST(IntervalSetTest, NormalizeDataFrame) {
    EXPECT_EQ(IntervalSet::normalize_row(make_row({"chr1", "100", "200"}), InputFormat::DATA_FRAME),
              GenomicInterval("chr1", 100, 200));
    // two columns: single base
    EXPECT_EQ(IntervalSet::normalize_row(make_row({"chr1", "100"}), InputFormat::DATA_FRAME),
              GenomicInterval("chr1", 100, 100));
    // scientific notation is coerced
    EXPECT_EQ(IntervalSet::normalize_row(make_row({"chr1", "1e3", "2e3"}), InputFormat::DATA_FRAME),
              GenomicInterval("chr1", 1000, 2000));
}

TEST(IntervalSetTest, NormalizeBedAddsOneToStart) {
    EXPECT_EQ(IntervalSet::normalize_row(make_row({"chr1", "99", "200", "name"}), InputFormat::BED),
              GenomicInterval("chr1", 100, 200));
    EXPECT_EQ(IntervalSet::normalize_row(make_row({"chr1", "0", "1"}), InputFormat::BED),
              GenomicInterval("chr1", 1, 1));
}

TEST(IntervalSetTest, NormalizeChrRange) {
    EXPECT_EQ(IntervalSet::normalize_row(make_row({"chr1:99-200"}), InputFormat::CHR_RANGE),
              GenomicInterval("chr1", 100, 200));
    EXPECT_EQ(IntervalSet::normalize_row(make_row({"chr2:500"}), InputFormat::CHR_RANGE),
              GenomicInterval("chr2", 500, 500));
    EXPECT_THROW(IntervalSet::normalize_row(make_row({"chr1"}), InputFormat::CHR_RANGE), MalformedInputError);
}

TEST(IntervalSetTest, NormalizeGRangesNeedsThreeColumns) {
    EXPECT_EQ(IntervalSet::normalize_row(make_row({"chrX", "5", "10"}), InputFormat::GRANGES),
              GenomicInterval("chrX", 5, 10));
    EXPECT_THROW(IntervalSet::normalize_row(make_row({"chrX", "5"}), InputFormat::GRANGES), MalformedInputError);
}

TEST(IntervalSetTest, NormalizeRejectsBadCoordinates) {
    EXPECT_THROW(IntervalSet::normalize_row(make_row({"chr1", "abc", "200"}), InputFormat::DATA_FRAME),
                 MalformedInputError);
    EXPECT_THROW(IntervalSet::normalize_row(make_row({"chr1", "1.5", "200"}), InputFormat::DATA_FRAME),
                 MalformedInputError);
    EXPECT_THROW(IntervalSet::normalize_row(make_row({"chr1", "inf", "200"}), InputFormat::DATA_FRAME),
                 MalformedInputError);
    EXPECT_THROW(IntervalSet::normalize_row(make_row({"chr1", "300", "200"}), InputFormat::DATA_FRAME),
                 MalformedInputError);
    EXPECT_THROW(IntervalSet::normalize_row(make_row({"", "1", "2"}), InputFormat::DATA_FRAME),
                 MalformedInputError);
}

TEST(IntervalSetTest, FromRowsDropsMalformedRows) {
    std::vector<RawRow> rows = {
        make_row({"chrom", "start", "end"}),  // header
        make_row({"chr1", "100", "200"}),
        make_row({"chr1"}),                   // short
        make_row({"chr1", "x", "5"}),         // non-numeric
        make_row({"chr2", "10", "20"}),
    };
    ParseStats stats;
    IntervalSet set = IntervalSet::from_rows(rows, InputFormat::DATA_FRAME, &stats);

    EXPECT_EQ(set.size(), 2u);
    EXPECT_EQ(stats.rows_total, 5);
    EXPECT_EQ(stats.rows_kept, 2);
    EXPECT_EQ(stats.rows_dropped, 3);
    EXPECT_EQ(stats.rows_short, 1);
}

TEST(IntervalSetTest, FromRowsFailsWhenNoRowHasTheColumns) {
    std::vector<RawRow> rows = {make_row({"chr1", "100"}), make_row({"chr1", "300"})};
    EXPECT_THROW(IntervalSet::from_rows(rows, InputFormat::BED), MalformedInputError);
    EXPECT_NO_THROW(IntervalSet::from_rows(rows, InputFormat::DATA_FRAME));
    EXPECT_TRUE(IntervalSet::from_rows({}, InputFormat::BED).empty());
}

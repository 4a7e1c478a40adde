#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "IntervalSet.hpp"
#include "Types.hpp"

namespace AnnoEnrich {

/**
 * @brief Parameters of the null-distribution sampler.
 */
struct SamplerConfig {
    int num_samples = 1000;                ///< Number of synthetic interval sets
    Position gap_max = 50000;              ///< Max gap to eligible islands (kUnboundedGap = no limit)
    std::optional<Position> max_distance;  ///< Max start displacement (nullopt = unconstrained)
    std::optional<uint64_t> seed;          ///< Random seed (nullopt = drawn from std::random_device)
};

/**
 * @brief Outcome of one synthetic sample.
 */
struct SampleStats {
    int64_t placed = 0;   ///< Data intervals placed in the background
    int64_t dropped = 0;  ///< Data intervals without any eligible placement
};

/**
 * @brief Island-constrained random placement of data intervals.
 *
 * Islands are the reduced background intervals. For a data interval
 * [s, e] of length L, an island is eligible if it is at most gap_max bases
 * away from [s, e] (gap_max = 0: only islands overlapping or touching it).
 * A placement [p, p + L - 1] may lie anywhere within one eligible island,
 * restricted to |p - s| <= max_distance when max_distance is set. Every
 * eligible placement is equally likely, so islands are weighted by the
 * number of starts they offer.
 *
 * Eligible placements are precomputed once per data interval (binary search
 * over the sorted islands of its chromosome) so that a draw costs
 * O(log k) for k candidate islands.
 *
 * Sample @c i is drawn from its own engine seeded with (seed, i): the result
 * does not depend on which thread draws it or in which order.
 */
class IslandSampler {
public:
    /**
     * @param data Reduced data intervals (the intervals to relocate).
     * @param background Background; reduced internally if necessary.
     * @param config Sampling parameters.
     * @throws ConfigurationError on num_samples < 1 or negative distances.
     */
    IslandSampler(const IntervalSet& data, const IntervalSet& background, const SamplerConfig& config);

    /**
     * @brief Draws synthetic sample @p sample_index.
     *
     * Intervals without eligible placement are dropped from the sample; the
     * result may hold fewer intervals than the data. Intervals of one sample
     * are not merged with each other.
     */
    IntervalSet draw(int sample_index, SampleStats* stats = nullptr) const;

    /// Draws samples 0 .. num_samples-1 sequentially.
    std::vector<IntervalSet> draw_all() const;

    uint64_t seed() const { return seed_; }
    int num_samples() const { return config_.num_samples; }
    size_t num_islands() const { return num_islands_; }

    /// Data intervals that can never be placed (dropped from every sample).
    int64_t num_unplaceable() const { return num_unplaceable_; }

private:
    struct Island {
        Position start;
        Position end;
    };

    /**
     * @brief Eligible placements of one interval length within the reachable islands.
     *
     * Candidate k offers starts first_start[k] .. first_start[k] + weight_k - 1,
     * where weight_k = cumulative[k] - cumulative[k - 1].
     */
    struct PlacementPlan {
        std::vector<Position> first_start;
        std::vector<uint64_t> cumulative;

        uint64_t total() const { return cumulative.empty() ? 0 : cumulative.back(); }
    };

    static constexpr int kNoPlan = -1;

    SamplerConfig config_;
    uint64_t seed_;
    size_t num_islands_ = 0;
    int64_t num_unplaceable_ = 0;

    std::vector<std::string> chroms_;                    ///< Background chromosomes
    std::vector<std::vector<Island>> islands_;           ///< Per chromosome, sorted
    std::vector<GenomicInterval> data_;                  ///< Intervals to relocate
    std::vector<int> plan_of_;                           ///< data index -> plan index
    std::vector<PlacementPlan> plans_;

    PlacementPlan build_plan(const std::vector<Island>& islands, Position length, Position reach_lo,
                             Position reach_hi, Position lo, Position hi) const;
};

}  // namespace AnnoEnrich

#include "core/IslandSampler.hpp"

#include <algorithm>
#include <limits>
#include <map>
#include <random>
#include <sstream>
#include <tuple>

#include "core/Errors.hpp"
#include "utils/Logger.hpp"

namespace AnnoEnrich {

// ============================================================================
// Saturating coordinate arithmetic (gap_max may be unbounded)
// ============================================================================

static constexpr Position kPosMax = std::numeric_limits<Position>::max();
static constexpr Position kPosMin = std::numeric_limits<Position>::min();

static Position sat_add(Position a, Position b) {
    if (b > 0 && a > kPosMax - b) return kPosMax;
    if (b < 0 && a < kPosMin - b) return kPosMin;
    return a + b;
}

static Position sat_sub(Position a, Position b) {
    if (b > 0 && a < kPosMin + b) return kPosMin;
    if (b < 0 && a > kPosMax + b) return kPosMax;
    return a - b;
}

// ============================================================================
// Construction
// ============================================================================

IslandSampler::IslandSampler(const IntervalSet& data, const IntervalSet& background, const SamplerConfig& config)
    : config_(config), seed_(0) {
    if (config_.num_samples < 1) {
        throw ConfigurationError("num_samples must be a positive integer");
    }
    if (config_.gap_max < 0) {
        throw ConfigurationError("gap_max must be non-negative");
    }
    if (config_.max_distance && *config_.max_distance < 0) {
        throw ConfigurationError("max_distance must be non-negative");
    }

    if (config_.seed) {
        seed_ = *config_.seed;
    } else {
        std::random_device rd;
        seed_ = (static_cast<uint64_t>(rd()) << 32) ^ static_cast<uint64_t>(rd());
    }

    // islands: reduced background grouped by chromosome
    const IntervalSet bg = background.is_reduced() ? background : background.reduce();
    std::unordered_map<std::string, size_t> chrom_index;
    for (const auto& iv : bg) {
        auto it = chrom_index.find(iv.chrom);
        if (it == chrom_index.end()) {
            it = chrom_index.emplace(iv.chrom, chroms_.size()).first;
            chroms_.push_back(iv.chrom);
            islands_.emplace_back();
        }
        islands_[it->second].push_back(Island{iv.start, iv.end});
    }
    num_islands_ = bg.size();

    // one placement plan per distinct (chromosome, length, island reach, start window)
    data_ = data.intervals();
    plan_of_.assign(data_.size(), kNoPlan);
    std::map<std::tuple<size_t, Position, Position, Position, Position, Position>, int> plan_cache;

    for (size_t j = 0; j < data_.size(); ++j) {
        const auto& d = data_[j];
        auto cit = chrom_index.find(d.chrom);
        if (cit == chrom_index.end()) {
            num_unplaceable_++;
            LOG_DEBUG(SamplingExhaustionError("No background on " + d.chrom + " for " + d.to_string()).what());
            continue;
        }

        const Position length = d.width();
        // islands at most gap_max bases away from [s, e]
        const Position reach_lo = sat_sub(sat_sub(d.start, 1), config_.gap_max);
        const Position reach_hi = sat_add(sat_add(d.end, 1), config_.gap_max);
        // starts allowed by max_distance (whole island otherwise)
        Position lo = kPosMin;
        Position hi = kPosMax;
        if (config_.max_distance) {
            lo = sat_sub(d.start, *config_.max_distance);
            hi = sat_add(d.start, *config_.max_distance);
        }

        auto key = std::make_tuple(cit->second, length, reach_lo, reach_hi, lo, hi);
        auto pit = plan_cache.find(key);
        if (pit == plan_cache.end()) {
            plans_.push_back(build_plan(islands_[cit->second], length, reach_lo, reach_hi, lo, hi));
            pit = plan_cache.emplace(key, static_cast<int>(plans_.size()) - 1).first;
        }

        if (plans_[pit->second].total() == 0) {
            num_unplaceable_++;
            LOG_DEBUG(SamplingExhaustionError("No eligible placement for " + d.to_string()).what());
            continue;
        }
        plan_of_[j] = pit->second;
    }

    std::ostringstream ss;
    ss << "IslandSampler initialized: " << data_.size() << " data intervals, " << num_islands_ << " islands on "
       << chroms_.size() << " chromosomes, " << plans_.size() << " placement plans, gap_max="
       << (config_.gap_max == kUnboundedGap ? std::string("inf") : std::to_string(config_.gap_max))
       << ", max_distance="
       << (config_.max_distance ? std::to_string(*config_.max_distance) : std::string("unconstrained"))
       << ", seed=" << seed_;
    LOG_INFO(ss.str());

    if (num_unplaceable_ > 0) {
        LOG_WARNING(std::to_string(num_unplaceable_) +
                    " data intervals have no eligible background placement and are dropped from every sample");
    }
}

IslandSampler::PlacementPlan IslandSampler::build_plan(const std::vector<Island>& islands, Position length,
                                                       Position reach_lo, Position reach_hi, Position lo,
                                                       Position hi) const {
    PlacementPlan plan;
    if (lo > hi) return plan;

    // islands are disjoint and sorted, so both starts and ends increase
    auto first = std::lower_bound(islands.begin(), islands.end(), reach_lo,
                                  [](const Island& isl, Position v) { return isl.end < v; });
    auto last = std::upper_bound(islands.begin(), islands.end(), reach_hi,
                                 [](Position v, const Island& isl) { return v < isl.start; });

    uint64_t running = 0;
    for (auto it = first; it < last; ++it) {
        const Position a = std::max(it->start, lo);
        const Position b = std::min(it->end - length + 1, hi);
        if (b < a) continue;
        running += static_cast<uint64_t>(b - a) + 1;
        plan.first_start.push_back(a);
        plan.cumulative.push_back(running);
    }
    return plan;
}

// ============================================================================
// Drawing
// ============================================================================

IntervalSet IslandSampler::draw(int sample_index, SampleStats* stats) const {
    std::seed_seq seq{static_cast<uint32_t>(seed_ & 0xffffffffu), static_cast<uint32_t>(seed_ >> 32),
                      static_cast<uint32_t>(sample_index)};
    std::mt19937_64 rng(seq);

    SampleStats local;
    std::vector<GenomicInterval> placed;
    placed.reserve(data_.size());

    for (size_t j = 0; j < data_.size(); ++j) {
        if (plan_of_[j] == kNoPlan) {
            local.dropped++;
            continue;
        }
        const PlacementPlan& plan = plans_[plan_of_[j]];
        std::uniform_int_distribution<uint64_t> pick(0, plan.total() - 1);
        const uint64_t r = pick(rng);

        const size_t k = std::upper_bound(plan.cumulative.begin(), plan.cumulative.end(), r) - plan.cumulative.begin();
        const uint64_t offset = r - (k == 0 ? 0 : plan.cumulative[k - 1]);
        const Position start = plan.first_start[k] + static_cast<Position>(offset);

        placed.emplace_back(data_[j].chrom, start, start + data_[j].width() - 1);
        local.placed++;
    }

    if (stats) {
        *stats = local;
    }
    return IntervalSet(std::move(placed));
}

std::vector<IntervalSet> IslandSampler::draw_all() const {
    std::vector<IntervalSet> samples;
    samples.reserve(config_.num_samples);
    for (int i = 0; i < config_.num_samples; ++i) {
        samples.push_back(draw(i));
    }
    return samples;
}

}  // namespace AnnoEnrich

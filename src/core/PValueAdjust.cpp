#include "core/PValueAdjust.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>

namespace AnnoEnrich {

namespace {

/// Indices of @p p sorted by value, stable for ties.
std::vector<size_t> order(const std::vector<double>& p, bool decreasing) {
    std::vector<size_t> o(p.size());
    std::iota(o.begin(), o.end(), 0);
    if (decreasing) {
        std::stable_sort(o.begin(), o.end(), [&p](size_t a, size_t b) { return p[a] > p[b]; });
    } else {
        std::stable_sort(o.begin(), o.end(), [&p](size_t a, size_t b) { return p[a] < p[b]; });
    }
    return o;
}

std::vector<double> bonferroni(const std::vector<double>& p) {
    const double n = static_cast<double>(p.size());
    std::vector<double> out(p.size());
    for (size_t k = 0; k < p.size(); ++k) {
        out[k] = std::min(1.0, n * p[k]);
    }
    return out;
}

std::vector<double> holm(const std::vector<double>& p) {
    const size_t n = p.size();
    const auto o = order(p, false);
    std::vector<double> out(n);
    double running = -std::numeric_limits<double>::infinity();
    for (size_t k = 0; k < n; ++k) {
        running = std::max(running, static_cast<double>(n - k) * p[o[k]]);
        out[o[k]] = std::min(1.0, running);
    }
    return out;
}

/// Step-up pass shared by HOCHBERG, BH and BY; @p factor(i) for rank i (1-based, ascending).
template <typename Factor>
std::vector<double> step_up(const std::vector<double>& p, Factor factor) {
    const size_t n = p.size();
    const auto o = order(p, true);
    std::vector<double> out(n);
    double running = std::numeric_limits<double>::infinity();
    for (size_t k = 0; k < n; ++k) {
        const size_t rank = n - k;
        running = std::min(running, factor(rank) * p[o[k]]);
        out[o[k]] = std::min(1.0, running);
    }
    return out;
}

std::vector<double> hommel(const std::vector<double>& p_in) {
    const size_t n = p_in.size();
    const auto o = order(p_in, false);
    std::vector<double> p(n);
    for (size_t k = 0; k < n; ++k) p[k] = p_in[o[k]];

    // p is ascending from here on; indices below are 0-based ranks
    double init = std::numeric_limits<double>::infinity();
    for (size_t k = 0; k < n; ++k) {
        init = std::min(init, static_cast<double>(n) * p[k] / static_cast<double>(k + 1));
    }
    std::vector<double> q(n, init);
    std::vector<double> pa(n, init);

    for (size_t m = n - 1; m >= 2; --m) {
        const size_t n1 = n - m + 1;  // size of the first block
        double q1 = std::numeric_limits<double>::infinity();
        for (size_t j = n1; j < n; ++j) {
            q1 = std::min(q1, static_cast<double>(m) * p[j] / static_cast<double>(j - n1 + 2));
        }
        for (size_t j = 0; j < n1; ++j) {
            q[j] = std::min(static_cast<double>(m) * p[j], q1);
        }
        for (size_t j = n1; j < n; ++j) {
            q[j] = q[n1 - 1];
        }
        for (size_t j = 0; j < n; ++j) {
            pa[j] = std::max(pa[j], q[j]);
        }
    }

    std::vector<double> out(n);
    for (size_t k = 0; k < n; ++k) {
        out[o[k]] = std::max(pa[k], p[k]);
    }
    return out;
}

}  // namespace

std::vector<double> adjust_pvalues(const std::vector<double>& pvalues, PAdjustMethod method) {
    std::vector<size_t> finite_idx;
    std::vector<double> p;
    for (size_t k = 0; k < pvalues.size(); ++k) {
        if (!std::isnan(pvalues[k])) {
            finite_idx.push_back(k);
            p.push_back(pvalues[k]);
        }
    }

    const size_t n = p.size();
    if (n <= 1) {
        return pvalues;
    }
    if (n == 2 && method == PAdjustMethod::HOMMEL) {
        method = PAdjustMethod::HOCHBERG;
    }

    const double nd = static_cast<double>(n);
    std::vector<double> adjusted;
    switch (method) {
        case PAdjustMethod::BONFERRONI:
            adjusted = bonferroni(p);
            break;
        case PAdjustMethod::HOLM:
            adjusted = holm(p);
            break;
        case PAdjustMethod::HOCHBERG:
            adjusted = step_up(p, [nd](size_t rank) { return nd + 1.0 - static_cast<double>(rank); });
            break;
        case PAdjustMethod::HOMMEL:
            adjusted = hommel(p);
            break;
        case PAdjustMethod::BH:
            adjusted = step_up(p, [nd](size_t rank) { return nd / static_cast<double>(rank); });
            break;
        case PAdjustMethod::BY: {
            double harmonic = 0.0;
            for (size_t k = 1; k <= n; ++k) harmonic += 1.0 / static_cast<double>(k);
            adjusted = step_up(p, [nd, harmonic](size_t rank) { return harmonic * nd / static_cast<double>(rank); });
            break;
        }
    }

    std::vector<double> out = pvalues;
    for (size_t k = 0; k < n; ++k) {
        out[finite_idx[k]] = adjusted[k];
    }
    return out;
}

}  // namespace AnnoEnrich

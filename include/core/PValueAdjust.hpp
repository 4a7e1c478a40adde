#pragma once

#include <vector>

#include "Types.hpp"

namespace AnnoEnrich {

/**
 * @brief Multiple-testing correction of a p-value vector.
 *
 * Reproduces the canonical closed-form procedures:
 * - BONFERRONI: min(1, n p)
 * - HOLM:       step-down, cumulative max of (n - i + 1) p_(i), ascending
 * - HOCHBERG:   step-up, cumulative min of (n - i + 1) p_(i), descending
 * - HOMMEL:     closed testing via Simes' tests (HOCHBERG when n == 2)
 * - BH:         step-up, cumulative min of n / i p_(i), descending
 * - BY:         BH multiplied by sum_{k=1..n} 1/k
 *
 * NaN entries are passed through and do not count towards n. With fewer
 * than two finite p-values the input is returned unchanged.
 *
 * @return Adjusted p-values in the input order.
 */
std::vector<double> adjust_pvalues(const std::vector<double>& pvalues, PAdjustMethod method);

}  // namespace AnnoEnrich

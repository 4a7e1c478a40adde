#pragma once

#include <string>
#include <vector>

#include <Eigen/Dense>

#include "DataStructs.hpp"
#include "OverlapCounter.hpp"
#include "Types.hpp"

namespace AnnoEnrich {

/**
 * @brief Column statistics of a null matrix.
 */
struct NullMoments {
    Eigen::VectorXd mean;  ///< Column means
    Eigen::VectorXd sd;    ///< Column standard deviations (n - 1 denominator, 0 if n < 2)
};

/**
 * @brief Turns observed and null overlaps into the enrichment table.
 *
 * For every category c with observation o and null column b (S samples):
 * - n_expect = mean(b), sd = sample standard deviation of b
 * - fc       = o / n_expect, or 1 when n_expect == 0
 * - zscore   = (o - n_expect) / sd, or 0 when sd == 0; any other
 *              non-finite value takes the largest finite z-score
 * - pvalue   = #{s : o <= b_s} / S, or 1 when n_expect == 0
 * - adjp     = adjust_pvalues(pvalue, method) over all categories
 */
class EnrichmentEstimator {
public:
    explicit EnrichmentEstimator(PAdjustMethod method = PAdjustMethod::BH) : method_(method) {}

    /**
     * @param names Category names, one per column of @p null_matrix.
     * @param observed Observed base counts (same category order).
     * @param null_matrix num_samples x #categories overlap widths.
     * @throws ConfigurationError if the dimensions disagree or there are no samples.
     */
    std::vector<EnrichmentRecord> estimate(const std::vector<std::string>& names, const ObservedSummary& observed,
                                           const Eigen::MatrixXd& null_matrix) const;

    static NullMoments moments(const Eigen::MatrixXd& null_matrix);

    PAdjustMethod method() const { return method_; }

private:
    PAdjustMethod method_;
};

}  // namespace AnnoEnrich

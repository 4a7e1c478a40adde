#include "core/EnrichmentEstimator.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

#include "core/Errors.hpp"
#include "core/PValueAdjust.hpp"
#include "utils/Logger.hpp"

namespace AnnoEnrich {

NullMoments EnrichmentEstimator::moments(const Eigen::MatrixXd& null_matrix) {
    NullMoments m;
    const Eigen::Index rows = null_matrix.rows();
    m.mean = Eigen::VectorXd::Zero(null_matrix.cols());
    m.sd = Eigen::VectorXd::Zero(null_matrix.cols());
    if (rows == 0) return m;

    m.mean = null_matrix.colwise().mean().transpose();
    if (rows > 1) {
        Eigen::MatrixXd centered = null_matrix.rowwise() - m.mean.transpose();
        m.sd = (centered.colwise().squaredNorm() / static_cast<double>(rows - 1)).cwiseSqrt().transpose();
    }
    return m;
}

std::vector<EnrichmentRecord> EnrichmentEstimator::estimate(const std::vector<std::string>& names,
                                                            const ObservedSummary& observed,
                                                            const Eigen::MatrixXd& null_matrix) const {
    const size_t k = names.size();
    if (observed.overlap_bases.size() != k || observed.annotation_bases.size() != k ||
        static_cast<size_t>(null_matrix.cols()) != k) {
        throw ConfigurationError("Estimator input mismatch: " + std::to_string(k) + " categories, " +
                                 std::to_string(observed.overlap_bases.size()) + " observations, " +
                                 std::to_string(null_matrix.cols()) + " null columns");
    }
    if (null_matrix.rows() == 0) {
        throw ConfigurationError("Null matrix has no samples");
    }

    const NullMoments m = moments(null_matrix);
    const Eigen::VectorXd obs_vec = observed.overlap_vector();
    const double num_samples = static_cast<double>(null_matrix.rows());

    std::vector<EnrichmentRecord> records(k);
    std::vector<double> zscores(k, 0.0);
    double max_finite_z = -std::numeric_limits<double>::infinity();

    for (size_t c = 0; c < k; ++c) {
        const Eigen::Index col = static_cast<Eigen::Index>(c);
        const double obs = obs_vec(col);
        EnrichmentRecord& rec = records[c];
        rec.name = names[c];
        rec.n_anno = observed.annotation_bases[c];
        rec.n_overlap = observed.overlap_bases[c];
        rec.n_data = observed.data_bases;
        rec.n_bg = observed.background_bases;
        rec.n_expect = m.mean(col);

        if (rec.n_expect == 0.0) {
            rec.fc = 1.0;
            rec.pvalue = 1.0;
        } else {
            rec.fc = obs / rec.n_expect;
            const Eigen::Index hits = (null_matrix.col(col).array() >= obs).count();
            rec.pvalue = static_cast<double>(hits) / num_samples;
        }

        if (m.sd(col) == 0.0) {
            zscores[c] = 0.0;
        } else {
            zscores[c] = (obs - rec.n_expect) / m.sd(col);
        }
        if (std::isfinite(zscores[c])) {
            max_finite_z = std::max(max_finite_z, zscores[c]);
        }
    }

    if (!std::isfinite(max_finite_z)) {
        max_finite_z = 0.0;
    }
    std::vector<double> pvalues(k);
    for (size_t c = 0; c < k; ++c) {
        records[c].zscore = std::isfinite(zscores[c]) ? zscores[c] : max_finite_z;
        pvalues[c] = records[c].pvalue;
    }

    const std::vector<double> adjusted = adjust_pvalues(pvalues, method_);
    for (size_t c = 0; c < k; ++c) {
        records[c].adjp = adjusted[c];
    }

    LOG_DEBUG("Estimated " + std::to_string(k) + " categories from " + std::to_string(null_matrix.rows()) +
              " samples (p.adjust=" + p_adjust_to_string(method_) + ")");
    return records;
}

}  // namespace AnnoEnrich

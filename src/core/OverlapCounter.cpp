#include "core/OverlapCounter.hpp"

#include "utils/Logger.hpp"

namespace AnnoEnrich {

Eigen::VectorXd ObservedSummary::overlap_vector() const {
    Eigen::VectorXd v(static_cast<Eigen::Index>(overlap_bases.size()));
    for (size_t k = 0; k < overlap_bases.size(); ++k) {
        v(static_cast<Eigen::Index>(k)) = static_cast<double>(overlap_bases[k]);
    }
    return v;
}

ObservedSummary OverlapCounter::observe(const IntervalSet& data, const IntervalSet& background) const {
    ObservedSummary summary;
    summary.annotation_bases = catalog_.category_bases();
    summary.overlap_bases = catalog_.overlap_counts(data);
    summary.data_bases = data.total_bases();
    summary.background_bases = background.total_bases();

    LOG_INFO("Observed: " + std::to_string(summary.data_bases) + " data bases, " +
             std::to_string(summary.background_bases) + " background bases, " + std::to_string(catalog_.size()) +
             " annotation categories");
    return summary;
}

}  // namespace AnnoEnrich

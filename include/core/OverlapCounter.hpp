#pragma once

#include <vector>

#include <Eigen/Dense>

#include "AnnotationCatalog.hpp"
#include "IntervalSet.hpp"

namespace AnnoEnrich {

/**
 * @brief Base counts of the observed data against the catalog.
 */
struct ObservedSummary {
    std::vector<Position> annotation_bases;  ///< Covered bases per category
    std::vector<Position> overlap_bases;     ///< Data/category overlap per category
    Position data_bases = 0;                 ///< Covered bases of the data
    Position background_bases = 0;           ///< Covered bases of the background

    /// overlap_bases as a column vector for the estimator.
    Eigen::VectorXd overlap_vector() const;
};

/**
 * @brief Per-category overlap widths of interval sets against a catalog.
 *
 * Holds a reference to the catalog; the catalog must outlive the counter.
 * count() is const and reentrant, so many threads may share one counter.
 */
class OverlapCounter {
public:
    explicit OverlapCounter(const AnnotationCatalog& catalog) : catalog_(catalog) {}

    /**
     * @brief Observed statistics; @p data and @p background must be reduced.
     */
    ObservedSummary observe(const IntervalSet& data, const IntervalSet& background) const;

    /**
     * @brief Overlap widths of one (possibly unreduced) sample, in catalog order.
     *
     * Intervals of a sample are not merged beforehand: bases covered by
     * two sampled intervals count twice.
     */
    std::vector<Position> count(const IntervalSet& sample) const { return catalog_.overlap_counts(sample); }

    int num_categories() const { return static_cast<int>(catalog_.size()); }

private:
    const AnnotationCatalog& catalog_;
};

}  // namespace AnnoEnrich

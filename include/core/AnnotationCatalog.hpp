#pragma once

#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "DataStructs.hpp"
#include "IntervalSet.hpp"

namespace AnnoEnrich {

/**
 * @brief Ordered mapping from annotation category to its reduced intervals.
 *
 * Category order is the output order of the enrichment table. Names are
 * unique; every stored IntervalSet is reduced.
 */
class AnnotationCatalog {
public:
    AnnotationCatalog() = default;

    /**
     * @brief Splits a flat table into one category per distinct label.
     *
     * The label column is the 4th column (data.frame, bed, GRanges) or the
     * 2nd column (chr:start-end). Categories are ordered by label. Rows whose
     * interval part is malformed are dropped; rows without a label count as
     * short rows.
     *
     * @throws MalformedInputError if no row carries the label column.
     */
    static AnnotationCatalog from_flat_table(const std::vector<RawRow>& rows, InputFormat format,
                                             ParseStats* stats = nullptr);

    /**
     * @brief Adds (or replaces) a category; the set is reduced on insertion.
     *
     * New names are appended, so a pre-split catalog keeps insertion order.
     */
    void add(const std::string& name, const IntervalSet& intervals);

    /**
     * @brief Clips every category to @p background.
     *
     * Each category becomes the overlapping sub-ranges of its intervals with
     * the background, not just an overlap count.
     */
    AnnotationCatalog restrict_to(const IntervalSet& background) const;

    /**
     * @brief Overlapping bases between @p query and each category, in order.
     *
     * Categories without intervals or without overlap report 0.
     */
    std::vector<Position> overlap_counts(const IntervalSet& query) const;

    /// Covered bases of each category, in order.
    std::vector<Position> category_bases() const;

    /// Reduced union of all categories.
    IntervalSet union_all() const;

    size_t size() const { return categories_.size(); }
    bool empty() const { return categories_.empty(); }
    bool contains(const std::string& name) const { return index_.count(name) > 0; }

    const std::string& name(size_t i) const { return categories_[i].first; }
    const IntervalSet& intervals(size_t i) const { return categories_[i].second; }

    /// @throws std::out_of_range for unknown names.
    const IntervalSet& at(const std::string& name) const;

    std::vector<std::string> names() const;

private:
    std::vector<std::pair<std::string, IntervalSet>> categories_;
    std::unordered_map<std::string, size_t> index_;
};

}  // namespace AnnoEnrich

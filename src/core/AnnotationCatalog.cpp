#include "core/AnnotationCatalog.hpp"

#include <map>
#include <stdexcept>

#include "core/Errors.hpp"
#include "utils/Logger.hpp"

namespace AnnoEnrich {

/// 0-based column holding the category label.
static size_t label_column(InputFormat format) {
    return format == InputFormat::CHR_RANGE ? 1 : 3;
}

AnnotationCatalog AnnotationCatalog::from_flat_table(const std::vector<RawRow>& rows, InputFormat format,
                                                     ParseStats* stats) {
    const size_t label_col = label_column(format);

    // std::map orders the labels
    std::map<std::string, std::vector<RawRow>> by_label;
    ParseStats total;
    int64_t unlabeled = 0;

    for (const auto& row : rows) {
        if (row.fields.size() <= label_col || row.fields[label_col].empty()) {
            unlabeled++;
            continue;
        }
        by_label[row.fields[label_col]].push_back(row);
    }

    if (!rows.empty() && unlabeled == static_cast<int64_t>(rows.size())) {
        throw MalformedInputError("Annotation input has no category label in column " + std::to_string(label_col + 1) +
                                  " (format '" + format_to_string(format) + "')");
    }

    AnnotationCatalog catalog;
    for (const auto& [label, label_rows] : by_label) {
        ParseStats part;
        IntervalSet set = IntervalSet::from_rows(label_rows, format, &part);
        total.rows_total += part.rows_total;
        total.rows_kept += part.rows_kept;
        total.rows_dropped += part.rows_dropped;
        total.rows_short += part.rows_short;
        catalog.add(label, set);
    }

    total.rows_total += unlabeled;
    total.rows_dropped += unlabeled;
    total.rows_short += unlabeled;

    LOG_DEBUG("Split annotation table into " + std::to_string(catalog.size()) + " categories (" +
              std::to_string(unlabeled) + " unlabeled rows)");

    if (stats) {
        *stats = total;
    }
    return catalog;
}

void AnnotationCatalog::add(const std::string& name, const IntervalSet& intervals) {
    IntervalSet reduced = intervals.reduce();
    auto it = index_.find(name);
    if (it != index_.end()) {
        categories_[it->second].second = std::move(reduced);
        return;
    }
    index_.emplace(name, categories_.size());
    categories_.emplace_back(name, std::move(reduced));
}

AnnotationCatalog AnnotationCatalog::restrict_to(const IntervalSet& background) const {
    const IntervalSet bg = background.is_reduced() ? background : background.reduce();

    AnnotationCatalog restricted;
    for (const auto& [name, set] : categories_) {
        restricted.add(name, set.intersect(bg));
    }
    return restricted;
}

std::vector<Position> AnnotationCatalog::overlap_counts(const IntervalSet& query) const {
    std::vector<Position> counts;
    counts.reserve(categories_.size());
    for (const auto& entry : categories_) {
        counts.push_back(entry.second.empty() ? 0 : query.intersect_count(entry.second));
    }
    return counts;
}

std::vector<Position> AnnotationCatalog::category_bases() const {
    std::vector<Position> bases;
    bases.reserve(categories_.size());
    for (const auto& entry : categories_) {
        bases.push_back(entry.second.total_bases());
    }
    return bases;
}

IntervalSet AnnotationCatalog::union_all() const {
    std::vector<const IntervalSet*> sets;
    sets.reserve(categories_.size());
    for (const auto& entry : categories_) {
        sets.push_back(&entry.second);
    }
    return IntervalSet::union_of(sets);
}

const IntervalSet& AnnotationCatalog::at(const std::string& name) const {
    auto it = index_.find(name);
    if (it == index_.end()) {
        throw std::out_of_range("Unknown annotation category: " + name);
    }
    return categories_[it->second].second;
}

std::vector<std::string> AnnotationCatalog::names() const {
    std::vector<std::string> out;
    out.reserve(categories_.size());
    for (const auto& entry : categories_) {
        out.push_back(entry.first);
    }
    return out;
}

}  // namespace AnnoEnrich

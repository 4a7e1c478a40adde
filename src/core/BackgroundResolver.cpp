#include "core/BackgroundResolver.hpp"

#include "core/Errors.hpp"
#include "utils/Logger.hpp"

namespace AnnoEnrich {

ResolvedInputs BackgroundResolver::resolve(const IntervalSet& data, const AnnotationCatalog& catalog,
                                           const std::optional<IntervalSet>& background) const {
    if (catalog.empty()) {
        throw ConfigurationError("Annotation catalog has no categories");
    }
    if (catalog.size() == 1 && !background && annotatable_only_) {
        throw ConfigurationError("Annotation catalog has a single category ('" + catalog.name(0) +
                                 "') and no background was supplied: the background would equal the annotation");
    }

    ResolvedInputs out;
    out.background_supplied = background.has_value();

    if (!background) {
        LOG_INFO("All annotatable regions (by default) are used as the background");
        out.catalog = catalog;
        out.background = catalog.union_all();
        if (catalog.size() == 1) {
            LOG_WARNING("Single annotation category without an explicit background; statistics are degenerate");
        }
    } else {
        out.background = background->reduce();
        out.catalog = catalog.restrict_to(out.background);

        if (annotatable_only_) {
            LOG_INFO("The given background restricted to the annotatable regions is used as the background");
            out.background = out.catalog.union_all();
        } else {
            LOG_INFO("The given background regions are used as the background");
        }
    }

    const IntervalSet data_reduced = data.reduce();
    out.data = data_reduced.intersect(out.background).reduce();

    const Position lost = data_reduced.total_bases() - out.data.total_bases();
    if (lost > 0) {
        LOG_WARNING(std::to_string(lost) + " data bases lie outside the background and are excluded");
    }
    if (out.data.empty()) {
        LOG_WARNING("No data interval overlaps the background");
    }

    return out;
}

}  // namespace AnnoEnrich

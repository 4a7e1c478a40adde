#pragma once

#include <optional>

#include "AnnotationCatalog.hpp"
#include "IntervalSet.hpp"

namespace AnnoEnrich {

/**
 * @brief Data, background and annotations after background resolution.
 *
 * All three are reduced; every data interval lies inside the background.
 */
struct ResolvedInputs {
    IntervalSet data;
    IntervalSet background;
    AnnotationCatalog catalog;
    bool background_supplied = false;
};

/**
 * @brief Fixes the test background and clips data and annotations to it.
 *
 * - No background given: background = union of all annotation categories.
 * - Background given: background = reduce(background), each category is
 *   clipped to it; with @c annotatable_only the background shrinks further to
 *   the union of the clipped categories.
 * - Data outside the background is excluded from the analysis.
 */
class BackgroundResolver {
public:
    explicit BackgroundResolver(bool annotatable_only = false) : annotatable_only_(annotatable_only) {}

    /**
     * @throws ConfigurationError if the catalog is empty, or if it holds a
     *         single category while no background is given and
     *         annotatable-only restriction is requested.
     */
    ResolvedInputs resolve(const IntervalSet& data, const AnnotationCatalog& catalog,
                           const std::optional<IntervalSet>& background) const;

    bool annotatable_only() const { return annotatable_only_; }

private:
    bool annotatable_only_;
};

}  // namespace AnnoEnrich

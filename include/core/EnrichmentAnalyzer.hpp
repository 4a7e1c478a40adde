#pragma once

#include <optional>
#include <string>
#include <vector>

#include <Eigen/Dense>

#include "core/AnnotationCatalog.hpp"
#include "core/Config.hpp"
#include "core/DataStructs.hpp"
#include "core/IntervalSet.hpp"
#include "core/OverlapCounter.hpp"
#include "core/ParallelDispatcher.hpp"

namespace AnnoEnrich {

/**
 * @brief Everything one enrichment run produces.
 */
struct EnrichmentResult {
    std::vector<EnrichmentRecord> records;  ///< One row per category, catalog order
    std::vector<std::string> names;         ///< Category names (columns of null_matrix)
    ObservedSummary observed;               ///< Observed base counts
    Eigen::MatrixXd null_matrix;            ///< num_samples x #categories overlap widths
    uint64_t seed = 0;                      ///< Seed actually used by the sampler
    int64_t unplaceable = 0;                ///< Data intervals dropped from every sample
    double elapsed_ms = 0.0;
};

/**
 * @brief Runs the complete region enrichment pipeline.
 *
 * Stages:
 * 1. BackgroundResolver fixes the background and clips data and catalog
 * 2. OverlapCounter measures the observed overlap per category
 * 3. IslandSampler draws num_samples synthetic data sets, counted in
 *    parallel by the ParallelDispatcher into the null matrix
 * 4. EnrichmentEstimator derives fc, zscore, pvalue and adjp
 *
 * Thread-safety: the sampler and the counter are shared read-only by the
 * workers; every sample writes its own row of the null matrix.
 */
class EnrichmentAnalyzer {
public:
    /**
     * @param config Run parameters (copied).
     * @param token Optional cancellation token; must outlive the analyzer.
     */
    explicit EnrichmentAnalyzer(const Config& config, const CancellationToken* token = nullptr);

    /**
     * @brief Runs the pipeline on in-memory inputs.
     *
     * @param data Data regions (need not be reduced).
     * @param catalog Annotation categories.
     * @param background Optional background; nullopt = all annotatable regions.
     * @throws ConfigurationError, WorkerFailure, CancelledError
     */
    EnrichmentResult run(const IntervalSet& data, const AnnotationCatalog& catalog,
                         const std::optional<IntervalSet>& background) const;

    /**
     * @brief Loads the tables named in the configuration and runs the pipeline.
     * @throws MalformedInputError if a table cannot be read or has no usable row layout.
     */
    EnrichmentResult run_files() const;

    /**
     * @brief Writes the table (and the null matrix if requested) to the configured outputs.
     */
    void write(const EnrichmentResult& result) const;

    /**
     * @brief Logs a short report: categories, significant hits, runtime.
     */
    void print_summary(const EnrichmentResult& result) const;

    const Config& config() const { return config_; }

private:
    Config config_;
    const CancellationToken* token_;

    IntervalSet load_regions(const std::string& path, const std::string& label) const;
};

}  // namespace AnnoEnrich

#include "core/EnrichmentAnalyzer.hpp"

#include <algorithm>
#include <chrono>
#include <iomanip>
#include <sstream>

#include "core/BackgroundResolver.hpp"
#include "core/EnrichmentEstimator.hpp"
#include "core/Errors.hpp"
#include "core/IslandSampler.hpp"
#include "io/EnrichmentWriter.hpp"
#include "io/IntervalReader.hpp"
#include "utils/Logger.hpp"

namespace AnnoEnrich {

/// Logs a WARN summary when rows of @p label were dropped.
static void report_dropped(const ParseStats& stats, const std::string& label) {
    if (stats.rows_dropped == 0) {
        LOG_DEBUG("Loaded " + std::to_string(stats.rows_kept) + " " + label + " rows");
        return;
    }
    std::ostringstream ss;
    ss << label << ": dropped " << stats.rows_dropped << " of " << stats.rows_total << " rows ("
       << stats.rows_short << " with missing columns, " << (stats.rows_dropped - stats.rows_short)
       << " with bad coordinates)";
    LOG_WARNING(ss.str());
}

EnrichmentAnalyzer::EnrichmentAnalyzer(const Config& config, const CancellationToken* token)
    : config_(config), token_(token) {
    LOG_DEBUG("EnrichmentAnalyzer initialized with " + std::to_string(config_.effective_threads()) +
              " workers, " + std::to_string(config_.num_samples) + " samples");
}

IntervalSet EnrichmentAnalyzer::load_regions(const std::string& path, const std::string& label) const {
    ParseStats stats;
    IntervalSet set = IntervalSet::from_rows(IntervalReader::read_file(path), config_.format, &stats);
    report_dropped(stats, label);
    LOG_INFO("Loaded " + std::to_string(set.size()) + " " + label + " regions from " + path);
    return set;
}

EnrichmentResult EnrichmentAnalyzer::run_files() const {
    IntervalSet data;
    AnnotationCatalog catalog;
    std::optional<IntervalSet> background;
    {
        Utils::ScopedLogger scope("Import");
        data = load_regions(config_.data_path, "data");

        ParseStats anno_stats;
        catalog = AnnotationCatalog::from_flat_table(IntervalReader::read_file(config_.annotation_path),
                                                     config_.format, &anno_stats);
        report_dropped(anno_stats, "annotation");
        LOG_INFO("Loaded " + std::to_string(catalog.size()) + " annotation categories from " +
                 config_.annotation_path);

        if (!config_.background_path.empty()) {
            background = load_regions(config_.background_path, "background");
        }
    }
    return run(data, catalog, background);
}

EnrichmentResult EnrichmentAnalyzer::run(const IntervalSet& data, const AnnotationCatalog& catalog,
                                         const std::optional<IntervalSet>& background) const {
    auto t_start = std::chrono::steady_clock::now();
    LOG_INFO("Enrichment analysis started (" + std::to_string(config_.num_samples) + " samples, p.adjust=" +
             p_adjust_to_string(config_.p_adjust_method) + ")");

    ResolvedInputs inputs;
    {
        Utils::ScopedLogger scope("Background");
        BackgroundResolver resolver(config_.background_annotatable_only);
        inputs = resolver.resolve(data, catalog, background);
    }

    EnrichmentResult result;
    result.names = inputs.catalog.names();

    OverlapCounter counter(inputs.catalog);
    result.observed = counter.observe(inputs.data, inputs.background);

    {
        Utils::ScopedLogger scope("Sampling");
        IslandSampler sampler(inputs.data, inputs.background, config_.sampler_config());
        result.seed = sampler.seed();
        result.unplaceable = sampler.num_unplaceable();

        ParallelDispatcher dispatcher(config_.effective_threads(), token_);
        LOG_INFO("Counting null overlaps with " + std::to_string(dispatcher.num_workers()) + " workers");
        result.null_matrix = dispatcher.run(
            sampler.num_samples(), counter.num_categories(),
            [&sampler, &counter](int i) { return counter.count(sampler.draw(i)); }, "Sample");
    }

    {
        Utils::ScopedLogger scope("Estimation");
        EnrichmentEstimator estimator(config_.p_adjust_method);
        result.records = estimator.estimate(result.names, result.observed, result.null_matrix);
    }

    auto t_end = std::chrono::steady_clock::now();
    result.elapsed_ms = std::chrono::duration<double, std::milli>(t_end - t_start).count();
    LOG_INFO("Enrichment analysis finished in " + std::to_string(result.elapsed_ms / 1000.0) + " s (seed " +
             std::to_string(result.seed) + ")");
    return result;
}

void EnrichmentAnalyzer::write(const EnrichmentResult& result) const {
    EnrichmentWriter writer(config_.output_path);
    writer.write_table(result.records);
    if (!config_.null_output_path.empty()) {
        EnrichmentWriter::write_null_matrix(config_.null_output_path, result.names, result.null_matrix);
    }
}

void EnrichmentAnalyzer::print_summary(const EnrichmentResult& result) const {
    int significant = 0;
    int enriched = 0;
    for (const auto& rec : result.records) {
        if (rec.adjp < 0.05) significant++;
        if (rec.fc > 1.0) enriched++;
    }

    std::ostringstream ss;
    ss << "\n=== Enrichment Summary ===\n"
       << "Categories: " << result.records.size() << "\n"
       << "Enriched (fc > 1): " << enriched << "\n"
       << "Significant (adjp < 0.05): " << significant << "\n"
       << "Data bases: " << result.observed.data_bases << "\n"
       << "Background bases: " << result.observed.background_bases << "\n"
       << "Samples: " << result.null_matrix.rows() << "\n"
       << "Seed: " << result.seed << "\n";
    if (result.unplaceable > 0) {
        ss << "Unplaceable data regions: " << result.unplaceable << "\n";
    }
    ss << "Runtime: " << std::fixed << std::setprecision(2) << result.elapsed_ms / 1000.0 << " s\n"
       << "==========================";
    LOG_INFO(ss.str());
}

}  // namespace AnnoEnrich

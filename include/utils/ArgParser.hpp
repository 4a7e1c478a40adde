#pragma once

#include <CLI/CLI.hpp>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <string>

#include "core/Config.hpp"
#include "core/Errors.hpp"
#include "utils/Logger.hpp"

namespace AnnoEnrich {
namespace Utils {

/**
 * @brief Command-line argument parser wrapper around CLI11.
 */
class ArgParser {
public:
    /**
     * @brief Parses command line arguments and populates the Config object.
     *
     * Uses CLI11 to handle argument parsing, type conversion, and basic validation
     * (e.g., file existence, numeric ranges, allowed names).
     *
     * @param argc Argument count.
     * @param argv Argument values.
     * @param config Reference to Config object to populate.
     * @return true if parsing was successful and execution should continue.
     * @return false if parsing failed or help was requested (execution should stop).
     */
    static bool parse(int argc, char** argv, Config& config) {
        CLI::App app{"AnnoEnrich - Region-based genomic annotation enrichment via sampling"};

        // Input/Output
        app.add_option("-d,--data", config.data_path, "Data regions (Required)")
            ->required()
            ->check(CLI::ExistingFile);

        app.add_option("-a,--annotation", config.annotation_path,
                       "Annotation regions with category label (Required)")
            ->required()
            ->check(CLI::ExistingFile);

        app.add_option("-b,--background", config.background_path,
                       "Background regions (Default: all annotatable regions)")
            ->check(CLI::ExistingFile);

        std::string format_str = "data.frame";
        app.add_option("-f,--format", format_str,
                       "Input format: data.frame, bed, chr:start-end, GRanges (Default: data.frame)")
            ->check(CLI::IsMember({"data.frame", "bed", "chr:start-end", "GRanges"}, CLI::ignore_case));

        app.add_option("-o,--output", config.output_path, "Enrichment table, '-' for stdout (Default: -)");

        app.add_option("--null-output", config.null_output_path, "Write the null overlap matrix to this file");

        // Background
        app.add_flag("--background-annotatable-only", config.background_annotatable_only,
                     "Restrict the background to annotation-covered bases");

        // Sampling
        app.add_option("-n,--num-samples", config.num_samples, "Number of null samples (Default: 1000)")
            ->check(CLI::PositiveNumber);

        std::string gap_str = "50000";
        app.add_option("--gap-max", gap_str, "Max gap between data and eligible islands, or 'inf' (Default: 50000)");

        int64_t max_distance = 0;
        auto* max_distance_opt = app.add_option("--max-distance", max_distance,
                                                "Max displacement of sampled regions (Default: unconstrained)")
                                     ->check(CLI::NonNegativeNumber);

        uint64_t seed = 0;
        auto* seed_opt = app.add_option("-s,--seed", seed, "Random seed (Default: random, logged)");

        // Testing
        std::string p_adjust_str = "BH";
        app.add_option("-p,--p-adjust", p_adjust_str,
                       "P-value adjustment: BH, BY, bonferroni, holm, hochberg, hommel (Default: BH)")
            ->check(CLI::IsMember({"BH", "BY", "bonferroni", "holm", "hochberg", "hommel", "fdr"}, CLI::ignore_case));

        // Execution
        app.add_flag("--parallel,!--no-parallel", config.parallel, "Use the worker pool (Default: enabled)");

        app.add_option("-j,--multicores", config.threads, "Number of workers, 0 = half of the cores (Default: 0)")
            ->check(CLI::NonNegativeNumber);

        app.add_option("--timeout", config.timeout_seconds, "Abort after this many seconds, 0 = never (Default: 0)")
            ->check(CLI::NonNegativeNumber);

        // Logging
        std::string log_level_str = "info";
        app.add_option("--log-level", log_level_str, "Logging level: error, warn, info, debug (Default: info)")
            ->check(CLI::IsMember({"error", "warn", "info", "debug"}, CLI::ignore_case));

        app.add_option("--log-file", config.log_file, "Mirror log messages to this file");

        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            // If help is requested (ret=0) or error occurs (ret>0), we print message and return false.
            app.exit(e);
            return false;
        }

        if (!parse_gap_max(gap_str, config.gap_max)) {
            std::cerr << "--gap-max: expected a non-negative integer or 'inf', got '" << gap_str << "'" << std::endl;
            return false;
        }

        if (max_distance_opt->count() > 0) {
            config.max_distance = max_distance;
        }
        if (seed_opt->count() > 0) {
            config.seed = seed;
        }

        try {
            config.format = string_to_format(format_str);
            config.p_adjust_method = string_to_p_adjust(p_adjust_str);
        } catch (const ConfigurationError& e) {
            std::cerr << e.what() << std::endl;
            return false;
        }

        config.log_level = Logger::parse_level(log_level_str);

        return true;
    }

    /**
     * @brief Parses a gap size: a non-negative integer, or "inf" (any case).
     * @return false if @p str is neither.
     */
    static bool parse_gap_max(const std::string& str, Position& gap_max) {
        std::string lower = str;
        std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);
        if (lower == "inf" || lower == "infinity") {
            gap_max = kUnboundedGap;
            return true;
        }
        if (lower.empty()) return false;

        char* end = nullptr;
        long long value = std::strtoll(lower.c_str(), &end, 10);
        if (*end != '\0' || value < 0) return false;
        gap_max = static_cast<Position>(value);
        return true;
    }
};

}  // namespace Utils
}  // namespace AnnoEnrich

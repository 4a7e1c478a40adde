#pragma once

#include <cstdint>
#include <iostream>
#include <optional>
#include <string>

#include "IslandSampler.hpp"
#include "Types.hpp"

namespace AnnoEnrich {

/**
 * @brief Configuration structure holding all runtime parameters.
 *
 * Stores paths to input/output files and the sampling and testing options.
 * Validated by both CLI11 (basic checks) and internal validate() method (file access, ranges).
 */
struct Config {
    // Input/Output
    std::string data_path;                           ///< Data regions (Required)
    std::string annotation_path;                     ///< Annotation table with category label (Required)
    std::string background_path;                     ///< Background regions (Optional)
    InputFormat format = InputFormat::DATA_FRAME;    ///< Encoding shared by all three tables
    std::string output_path = "-";                   ///< Enrichment table ("-" = stdout)
    std::string null_output_path;                    ///< Null matrix dump (Optional)

    // Background
    bool background_annotatable_only = false;  ///< Restrict background to annotation-covered bases

    // Sampling
    int num_samples = 1000;                ///< Null-distribution sample count
    Position gap_max = 50000;              ///< Max distance to eligible islands (kUnboundedGap = inf)
    std::optional<Position> max_distance;  ///< Cap on sample displacement (nullopt = unconstrained)
    std::optional<uint64_t> seed;          ///< Random seed (nullopt = random, logged)

    // Testing
    PAdjustMethod p_adjust_method = PAdjustMethod::BH;  ///< Multiple-testing correction

    // Execution
    bool parallel = true;          ///< Use the worker pool
    int threads = 0;               ///< Worker count (0 = half of detected cores)
    double timeout_seconds = 0.0;  ///< Abort the run after this many seconds (0 = never)

    // Logging
    LogLevel log_level = LogLevel::LOG_INFO;  ///< Logging verbosity level
    std::string log_file;                     ///< Mirror log to this file (Optional)

    /**
     * @brief Validates configuration logic and input files.
     *
     * Performs checks that CLI11 cannot handle, such as:
     * - Opening every input table through htslib (plain or compressed)
     * - Numeric ranges of sampling and execution options
     *
     * @return true if configuration is valid, false otherwise.
     */
    bool validate() const;

    /**
     * @brief Prints the current configuration (to stderr when the table goes to stdout).
     */
    void print(std::ostream& os = std::cout) const;

    /**
     * @brief Worker count actually used: 1 without parallelism, else
     * @c threads, or half of the detected cores when @c threads is 0.
     */
    int effective_threads() const;

    /**
     * @brief Sampling parameters for IslandSampler.
     */
    SamplerConfig sampler_config() const;

    /**
     * @brief Check if debug mode is enabled.
     */
    bool is_debug() const {
        return log_level >= LogLevel::LOG_DEBUG;
    }
};

}  // namespace AnnoEnrich

#include "core/Config.hpp"

#include <htslib/hts.h>

#include <iostream>

#include "core/ParallelDispatcher.hpp"

namespace AnnoEnrich {

/// Opens @p path through htslib; reports and returns false on failure.
static bool check_table(const std::string& path, const std::string& label) {
    htsFile* fp = hts_open(path.c_str(), "r");
    if (fp == NULL) {
        std::cerr << "Error: Cannot open " << label << " file: " << path << std::endl;
        return false;
    }
    hts_close(fp);
    return true;
}

bool Config::validate() const {
    bool valid = true;

    if (data_path.empty()) {
        std::cerr << "Error: Data region path is required." << std::endl;
        valid = false;
    } else if (!check_table(data_path, "data")) {
        valid = false;
    }

    if (annotation_path.empty()) {
        std::cerr << "Error: Annotation path is required." << std::endl;
        valid = false;
    } else if (!check_table(annotation_path, "annotation")) {
        valid = false;
    }

    if (!background_path.empty() && !check_table(background_path, "background")) {
        valid = false;
    }

    if (num_samples < 1) {
        std::cerr << "Error: num_samples must be a positive integer." << std::endl;
        valid = false;
    }

    if (gap_max < 0) {
        std::cerr << "Error: gap_max must be non-negative." << std::endl;
        valid = false;
    }

    if (max_distance && *max_distance < 0) {
        std::cerr << "Error: max_distance must be non-negative." << std::endl;
        valid = false;
    }

    if (threads < 0) {
        std::cerr << "Error: threads must be non-negative (0 = half of the cores)." << std::endl;
        valid = false;
    }

    if (timeout_seconds < 0.0) {
        std::cerr << "Error: timeout must be non-negative." << std::endl;
        valid = false;
    }

    if (!null_output_path.empty() && null_output_path == output_path) {
        std::cerr << "Error: null matrix output must differ from the enrichment output." << std::endl;
        valid = false;
    }

    return valid;
}

int Config::effective_threads() const {
    if (!parallel) return 1;
    if (threads > 0) return threads;
    return ParallelDispatcher::default_workers();
}

SamplerConfig Config::sampler_config() const {
    SamplerConfig sc;
    sc.num_samples = num_samples;
    sc.gap_max = gap_max;
    sc.max_distance = max_distance;
    sc.seed = seed;
    return sc;
}

void Config::print(std::ostream& os) const {
    os << "--- Configuration ---" << std::endl;
    os << "Data: " << data_path << std::endl;
    os << "Annotation: " << annotation_path << std::endl;
    os << "Background: " << (background_path.empty() ? "None (annotatable regions)" : background_path)
       << std::endl;
    os << "Format: " << format_to_string(format) << std::endl;
    os << "Output: " << (output_path == "-" ? "stdout" : output_path) << std::endl;
    os << "Background Annotatable Only: " << (background_annotatable_only ? "yes" : "no") << std::endl;
    os << "Samples: " << num_samples << std::endl;
    os << "Gap Max: " << (gap_max == kUnboundedGap ? std::string("inf") : std::to_string(gap_max)) << std::endl;
    os << "Max Distance: " << (max_distance ? std::to_string(*max_distance) : std::string("unconstrained"))
       << std::endl;
    os << "P-value Adjustment: " << p_adjust_to_string(p_adjust_method) << std::endl;
    os << "Threads: " << effective_threads() << (parallel ? "" : " (parallel disabled)") << std::endl;
    os << "Seed: " << (seed ? std::to_string(*seed) : std::string("random")) << std::endl;
    if (timeout_seconds > 0.0) {
        os << "Timeout: " << timeout_seconds << " s" << std::endl;
    }
    os << "---------------------" << std::endl;
}

}  // namespace AnnoEnrich

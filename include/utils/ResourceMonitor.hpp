#pragma once

#include <chrono>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <string>

#ifdef USE_JEMALLOC
#include <jemalloc/jemalloc.h>
#endif

namespace AnnoEnrich {
namespace Utils {

/**
 * @brief Wall time since construction and, with jemalloc, allocated bytes.
 */
class ResourceMonitor {
public:
    ResourceMonitor() {
        reset();
    }

    void reset() {
        start_time_ = std::chrono::steady_clock::now();
    }

    double get_elapsed_seconds() const {
        std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - start_time_;
        return elapsed.count();
    }

    /// Allocated memory in bytes (0 without jemalloc or if the query fails).
    size_t get_memory_usage() const {
        size_t allocated = 0;
#ifdef USE_JEMALLOC
        size_t sz = sizeof(size_t);
        // epoch needs to be advanced to get up-to-date stats
        uint64_t epoch = 1;
        size_t epoch_sz = sizeof(epoch);
        mallctl("epoch", &epoch, &epoch_sz, &epoch, sizeof(epoch));

        if (mallctl("stats.allocated", &allocated, &sz, NULL, 0) != 0) {
            allocated = 0;
        }
#endif
        return allocated;
    }

    /// Stats go to stderr by default so that a table on stdout stays clean.
    void print_stats(const std::string& label = "Execution", std::ostream& os = std::cerr) const {
        double time = get_elapsed_seconds();

        os << "[" << label << "] ";
        os << "Time: " << std::fixed << std::setprecision(4) << time << " s";

#ifdef USE_JEMALLOC
        os << ", Memory: " << std::fixed << std::setprecision(2) << (get_memory_usage() / 1024.0 / 1024.0) << " MB";
#else
        os << " (jemalloc not enabled)";
#endif
        os << std::endl;
    }

private:
    std::chrono::steady_clock::time_point start_time_;
};

}  // namespace Utils
}  // namespace AnnoEnrich

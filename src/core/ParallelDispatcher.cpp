#include "core/ParallelDispatcher.hpp"

#include <algorithm>
#include <stdexcept>
#include <sstream>
#include <thread>

#ifdef _OPENMP
#include <omp.h>
#endif

#include "core/Errors.hpp"
#include "utils/Logger.hpp"

namespace AnnoEnrich {

// ============================================================================
// CancellationToken
// ============================================================================

void CancellationToken::set_timeout(double seconds) {
    if (seconds <= 0.0) {
        deadline_.reset();
        return;
    }
    deadline_ = std::chrono::steady_clock::now() +
                std::chrono::duration_cast<std::chrono::steady_clock::duration>(std::chrono::duration<double>(seconds));
}

bool CancellationToken::is_cancelled() const {
    if (cancelled_.load(std::memory_order_relaxed)) return true;
    return deadline_ && std::chrono::steady_clock::now() >= *deadline_;
}

std::string CancellationToken::reason() const {
    if (cancelled_.load(std::memory_order_relaxed)) return "cancelled";
    if (deadline_ && std::chrono::steady_clock::now() >= *deadline_) return "timeout";
    return "";
}

// ============================================================================
// ParallelDispatcher
// ============================================================================

ParallelDispatcher::ParallelDispatcher(int num_workers, const CancellationToken* token)
    : num_workers_(std::max(1, num_workers)), token_(token) {
}

int ParallelDispatcher::default_workers() {
#ifdef _OPENMP
    int cores = omp_get_num_procs();
#else
    int cores = static_cast<int>(std::thread::hardware_concurrency());
#endif
    return std::max(1, cores / 2);
}

Eigen::MatrixXd ParallelDispatcher::run(int num_tasks, int num_columns, const RowTask& task,
                                        const std::string& progress_label) const {
    Eigen::MatrixXd result = Eigen::MatrixXd::Zero(std::max(0, num_tasks), std::max(0, num_columns));
    if (num_tasks <= 0) {
        return result;
    }

    std::atomic<bool> stop{false};
    std::atomic<int> completed{0};
    int failed_index = -1;
    std::string failure_message;
    const int step = std::max(1, (num_tasks + 9) / 10);

#pragma omp parallel for schedule(dynamic) num_threads(num_workers_) if (num_workers_ > 1)
    for (int i = 0; i < num_tasks; ++i) {
        if (stop.load(std::memory_order_relaxed)) continue;
        if (token_ && token_->is_cancelled()) {
            stop.store(true, std::memory_order_relaxed);
            continue;
        }

        try {
            std::vector<Position> row = task(i);
            if (static_cast<int>(row.size()) != num_columns) {
                throw std::length_error("task returned " + std::to_string(row.size()) + " columns, expected " +
                                        std::to_string(num_columns));
            }
            // distinct rows per task: no synchronisation needed
            for (int c = 0; c < num_columns; ++c) {
                result(i, c) = static_cast<double>(row[c]);
            }
        } catch (const std::exception& e) {
#pragma omp critical(dispatcher_error)
            {
                if (failed_index < 0) {
                    failed_index = i;
                    failure_message = e.what();
                }
            }
            stop.store(true, std::memory_order_relaxed);
            continue;
        } catch (...) {
#pragma omp critical(dispatcher_error)
            {
                if (failed_index < 0) {
                    failed_index = i;
                    failure_message = "unknown exception";
                }
            }
            stop.store(true, std::memory_order_relaxed);
            continue;
        }

        int done = ++completed;
        if (!progress_label.empty() && (done == 1 || done % step == 0 || done == num_tasks)) {
            std::ostringstream ss;
            ss << progress_label << " " << done << " out of " << num_tasks;
            LOG_INFO(ss.str());
        }
    }

    if (failed_index >= 0) {
        LOG_ERROR("Task " + std::to_string(failed_index) + " failed: " + failure_message);
        throw WorkerFailure(failed_index, failure_message);
    }
    if (stop.load()) {
        std::string why = token_ ? token_->reason() : std::string("cancelled");
        throw CancelledError("Run " + (why.empty() ? std::string("cancelled") : why) + " after " +
                             std::to_string(completed.load()) + " of " + std::to_string(num_tasks) + " tasks");
    }

    return result;
}

}  // namespace AnnoEnrich

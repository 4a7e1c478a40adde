#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include <Eigen/Dense>

#include "Types.hpp"

namespace AnnoEnrich {

/**
 * @brief Cooperative cancellation flag with an optional deadline.
 *
 * request_cancel() only stores an atomic flag and may be called from a
 * signal handler.
 */
class CancellationToken {
public:
    void request_cancel() noexcept { cancelled_.store(true, std::memory_order_relaxed); }

    /// Cancels automatically once @p seconds have elapsed (<= 0 disables).
    void set_timeout(double seconds);

    bool is_cancelled() const;

    /// "cancelled", "timeout" or "" if still running.
    std::string reason() const;

private:
    std::atomic<bool> cancelled_{false};
    std::optional<std::chrono::steady_clock::time_point> deadline_;
};

/**
 * @brief Fans independent row tasks out over an OpenMP worker pool.
 *
 * Task @c i fills row @c i of the result, so the matrix is ordered by task
 * index whatever the completion order, and a single worker produces the
 * same matrix as many workers.
 *
 * Fail-fast: the first exception thrown by a task stops the remaining tasks
 * and is re-thrown as WorkerFailure; no partial matrix is returned.
 */
class ParallelDispatcher {
public:
    using RowTask = std::function<std::vector<Position>(int)>;

    /**
     * @param num_workers Number of worker threads (values < 1 mean 1).
     * @param token Optional cancellation token polled between tasks.
     */
    explicit ParallelDispatcher(int num_workers = 1, const CancellationToken* token = nullptr);

    /**
     * @brief Runs @p task for 0 .. num_tasks-1 and stacks the rows.
     *
     * @param num_columns Expected length of every row.
     * @param progress_label Prefix of the progress log lines (empty = silent).
     * @throws WorkerFailure if a task throws or returns a row of wrong length.
     * @throws CancelledError if the token fires before all tasks finish.
     */
    Eigen::MatrixXd run(int num_tasks, int num_columns, const RowTask& task,
                        const std::string& progress_label = "") const;

    int num_workers() const { return num_workers_; }

    /// Half of the available cores, at least one.
    static int default_workers();

private:
    int num_workers_;
    const CancellationToken* token_;
};

}  // namespace AnnoEnrich

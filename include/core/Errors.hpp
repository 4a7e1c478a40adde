#pragma once

#include <stdexcept>
#include <string>

namespace AnnoEnrich {

/**
 * @brief Base class of every error raised by the enrichment engine.
 */
class EnrichError : public std::runtime_error {
public:
    explicit EnrichError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @brief A row (or a whole table) does not have the expected layout.
 *
 * Row-level occurrences are absorbed by the IntervalSet builder: the row is
 * dropped and counted. Table-level occurrences reach the caller.
 */
class MalformedInputError : public EnrichError {
public:
    explicit MalformedInputError(const std::string& what) : EnrichError(what) {}
};

/**
 * @brief Contradictory or missing configuration; aborts before sampling.
 */
class ConfigurationError : public EnrichError {
public:
    explicit ConfigurationError(const std::string& what) : EnrichError(what) {}
};

/**
 * @brief A data interval has no eligible placement in the background.
 *
 * Soft condition: the sampler drops the interval from that sample and
 * reports the count in SampleStats instead of throwing this across its API.
 */
class SamplingExhaustionError : public EnrichError {
public:
    explicit SamplingExhaustionError(const std::string& what) : EnrichError(what) {}
};

/**
 * @brief A parallel overlap-counting task failed; the whole run is aborted.
 */
class WorkerFailure : public EnrichError {
public:
    WorkerFailure(int task_index, const std::string& cause)
        : EnrichError("Worker failed on sample " + std::to_string(task_index) + ": " + cause),
          task_index_(task_index),
          cause_(cause) {}

    int task_index() const { return task_index_; }
    const std::string& cause() const { return cause_; }

private:
    int task_index_;
    std::string cause_;
};

/**
 * @brief The run was cancelled (signal or timeout) before completion.
 */
class CancelledError : public EnrichError {
public:
    explicit CancelledError(const std::string& what) : EnrichError(what) {}
};

}  // namespace AnnoEnrich

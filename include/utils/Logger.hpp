#pragma once

#include <chrono>
#include <fstream>
#include <mutex>
#include <string>

#include "core/Types.hpp"

namespace AnnoEnrich {
namespace Utils {

/**
 * @brief Singleton Logger shared by the pipeline and the worker threads.
 *
 * Messages go to stderr (stdout may carry the enrichment table) and,
 * optionally, to a log file without colour codes.
 */
class Logger {
public:
    static Logger& instance();

    void set_log_level(LogLevel level);
    LogLevel log_level() const { return current_level_; }
    void set_log_file(const std::string& filename);
    void set_color(bool enabled);

    // Core logging function
    void log(LogLevel level, const std::string& message, const char* file = nullptr, int line = -1);

    // Static helpers for cleaner syntax
    static void debug(const std::string& msg, const char* file = nullptr, int line = -1);
    static void info(const std::string& msg, const char* file = nullptr, int line = -1);
    static void warning(const std::string& msg, const char* file = nullptr, int line = -1);
    static void error(const std::string& msg, const char* file = nullptr, int line = -1);

    /**
     * @brief Converts "error", "warn", "info", "debug" (any case) to a level.
     * @return LOG_INFO for unknown names.
     */
    static LogLevel parse_level(const std::string& name);

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    LogLevel current_level_ = LogLevel::LOG_INFO;
    bool color_ = true;
    std::ofstream log_file_;
    std::mutex mutex_;

    static const char* level_tag(LogLevel level);
    static const char* color_code(LogLevel level);
};

/**
 * @brief RAII helper that logs the start and the duration of a pipeline stage.
 */
class ScopedLogger {
public:
    ScopedLogger(const std::string& action_name, LogLevel level = LogLevel::LOG_INFO);
    ~ScopedLogger();

private:
    std::string action_name_;
    LogLevel level_;
    std::chrono::steady_clock::time_point start_time_;
};

}  // namespace Utils
}  // namespace AnnoEnrich

// Macros to automatically capture file and line number
#define LOG_DEBUG(msg) AnnoEnrich::Utils::Logger::debug(msg, __FILE__, __LINE__)
#define LOG_INFO(msg) AnnoEnrich::Utils::Logger::info(msg, __FILE__, __LINE__)
#define LOG_WARNING(msg) AnnoEnrich::Utils::Logger::warning(msg, __FILE__, __LINE__)
#define LOG_ERROR(msg) AnnoEnrich::Utils::Logger::error(msg, __FILE__, __LINE__)

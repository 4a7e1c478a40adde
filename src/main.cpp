#include <csignal>
#include <iostream>

#include "core/Config.hpp"
#include "core/EnrichmentAnalyzer.hpp"
#include "core/Errors.hpp"
#include "core/ParallelDispatcher.hpp"
#include "utils/ArgParser.hpp"
#include "utils/Logger.hpp"
#include "utils/ResourceMonitor.hpp"

namespace {

AnnoEnrich::CancellationToken g_cancel_token;

extern "C" void handle_sigint(int) {
    g_cancel_token.request_cancel();
}

}  // namespace

int main(int argc, char** argv) {
    AnnoEnrich::Utils::ResourceMonitor monitor;

    AnnoEnrich::Config config;

    if (!AnnoEnrich::Utils::ArgParser::parse(argc, argv, config)) {
        return 1;  // Parse failed or help printed
    }

    // Configure Logger
    auto& logger = AnnoEnrich::Utils::Logger::instance();
    logger.set_log_level(config.log_level);
    if (!config.log_file.empty()) {
        logger.set_log_file(config.log_file);
    }

    if (!config.validate()) {
        LOG_ERROR("Configuration validation failed.");
        return 1;
    }

    config.print(std::cerr);

    if (config.is_debug()) {
        LOG_INFO("\n=== DEBUG MODE ENABLED ===");
        LOG_INFO("Dropped input rows (first 5 per table) and unplaceable data regions are logged");
        if (!config.null_output_path.empty()) {
            LOG_INFO("Null overlap matrix will be written to: " + config.null_output_path);
        }
        LOG_INFO("==========================\n");
    }

    std::signal(SIGINT, handle_sigint);
    g_cancel_token.set_timeout(config.timeout_seconds);

    LOG_INFO("Configuration valid. Starting analysis...");

    try {
        AnnoEnrich::EnrichmentAnalyzer analyzer(config, &g_cancel_token);

        AnnoEnrich::Utils::ScopedLogger main_scope("Main Execution");

        auto result = analyzer.run_files();
        analyzer.write(result);
        analyzer.print_summary(result);

    } catch (const AnnoEnrich::CancelledError& e) {
        LOG_ERROR("Aborted: " + std::string(e.what()));
        return 130;
    } catch (const AnnoEnrich::EnrichError& e) {
        LOG_ERROR("Enrichment failed: " + std::string(e.what()));
        return 1;
    } catch (const std::exception& e) {
        LOG_ERROR("Fatal error: " + std::string(e.what()));
        return 1;
    }

    monitor.print_stats("Total Execution");

    return 0;
}

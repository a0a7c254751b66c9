#ifndef SYSTEM_STATE_HPP
#define SYSTEM_STATE_HPP

#include <atomic>
#include <memory>
#include "configs/system_config.hpp"
#include "logging/logger/async_logger.hpp"

/**
 * @brief Central system state container
 *
 * Holds the loaded configuration, the shutdown flag and the shared logging context.
 */
struct SystemState {
    // =========================================================================
    // SYSTEM CONTROL FLAGS
    // =========================================================================
    std::atomic<bool> shutdown_requested{false};  // Set by SIGINT/SIGTERM; polled by the scanner

    // =========================================================================
    // CONFIGURATION AND LOGGING
    // =========================================================================
    ChartAnalyzer::Config::SystemConfig config;                              // Complete system configuration
    std::shared_ptr<ChartAnalyzer::Logging::LoggingContext> logging_context;  // Logging context

    explicit SystemState(const ChartAnalyzer::Config::SystemConfig& initial)
        : config(initial) {}
};

#endif // SYSTEM_STATE_HPP

#ifndef SYSTEM_MANAGER_HPP
#define SYSTEM_MANAGER_HPP

#include <memory>
#include <string>
#include "system/system_state.hpp"
#include "system/system_threads.hpp"
#include "logging/logger/async_logger.hpp"

namespace ChartAnalyzer {
namespace System {

struct SystemInitializationResult {
    std::unique_ptr<SystemState> system_state;
    std::shared_ptr<ChartAnalyzer::Logging::AsyncLogger> logger;

    SystemInitializationResult() = default;
    SystemInitializationResult(SystemInitializationResult&&) = default;
    SystemInitializationResult& operator=(SystemInitializationResult&&) = default;

    SystemInitializationResult(const SystemInitializationResult&) = delete;
    SystemInitializationResult& operator=(const SystemInitializationResult&) = delete;
};

// Binds the early logging context, loads and validates config, creates the run folder and logger
SystemInitializationResult initialize(const std::string& config_directory);

// Starts the logging thread; the handles must outlive it and be passed to shutdown
void startup(SystemState& system_state, SystemThreads& thread_handles, std::shared_ptr<ChartAnalyzer::Logging::AsyncLogger> logger);

// Stops the logger, joins the logging thread and falls back to direct stderr logging
void shutdown(SystemState& system_state, SystemThreads& thread_handles, std::shared_ptr<ChartAnalyzer::Logging::AsyncLogger> logger);

} // namespace System
} // namespace ChartAnalyzer

#endif // SYSTEM_MANAGER_HPP

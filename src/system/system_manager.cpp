#include "system_manager.hpp"
#include <memory>
#include <stdexcept>
#include <thread>
#include "configs/system_config.hpp"
#include "analyzer/config_loader/config_loader.hpp"
#include "threads/system_threads/logging_thread.hpp"
#include "logging/logs/system_logs.hpp"
#include "logging/logger/async_logger.hpp"

using namespace ChartAnalyzer::Logging;
using namespace ChartAnalyzer::Threads;

namespace ChartAnalyzer {
namespace System {

SystemInitializationResult initialize(const std::string& config_directory) {
    SystemInitializationResult initialization_result;

    // Initialize minimal logging context early - required before any logging calls
    auto early_logging_context = std::make_shared<LoggingContext>();
    set_logging_context(*early_logging_context);

    try {
        ChartAnalyzer::Config::SystemConfig initial_config;
        int config_load_result = ChartAnalyzer::Config::load_system_config(initial_config, config_directory);
        if (config_load_result != 0) {
            SystemLogs::log_fatal_error(std::string("Config load failed with result: ") + std::to_string(config_load_result));
            throw std::runtime_error("System initialization failed: configuration loading failed (" + config_directory + ")");
        }

        initialization_result.system_state = std::make_unique<SystemState>(initial_config);
        initialization_result.system_state->logging_context = early_logging_context;

        initialization_result.logger = initialize_application_foundation(initialization_result.system_state->config);
        SystemLogs::log_configuration_validated(true);
    } catch (const std::exception& exception_error) {
        SystemLogs::log_fatal_error(std::string("System initialization exception: ") + exception_error.what());
        throw;
    }

    return initialization_result;
}

void startup(SystemState& system_state, SystemThreads& thread_handles, std::shared_ptr<AsyncLogger> logger) {
    if (!logger) {
        throw std::runtime_error("System startup failed: Logger is required but not provided");
    }
    if (!system_state.logging_context) {
        throw std::runtime_error("Logging context not initialized - system must fail without context");
    }

    // Running must be set before the thread exists so its loop does not exit immediately
    logger->start();
    try {
        thread_handles.logger_thread = std::thread(LoggingThread(logger, *system_state.logging_context,
                                                                 thread_handles.logger_flushes, system_state.config.logging));
    } catch (const std::exception& exception_error) {
        logger->stop();
        SystemLogs::log_thread_startup_error(exception_error.what());
        throw;
    }
}

void shutdown(SystemState& system_state, SystemThreads& thread_handles, std::shared_ptr<AsyncLogger> logger) {
    SystemLogs::log_shutdown_complete();

    if (logger) {
        logger->stop();
    }
    if (thread_handles.logger_thread.joinable()) {
        thread_handles.logger_thread.join();
    }

    // Anything logged after this point goes straight to stderr
    if (system_state.logging_context) {
        system_state.logging_context->async_logger.reset();
    }
}

} // namespace System
} // namespace ChartAnalyzer

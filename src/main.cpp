// main.cpp
#include "system/system_manager.hpp"
#include "system/command_line.hpp"
#include "system/commands.hpp"
#include "logging/logs/system_logs.hpp"
#include <iostream>
#include <csignal>
#include <atomic>
#include <memory>
#include <string>
#include <vector>

using namespace ChartAnalyzer::System;
using ChartAnalyzer::Logging::SystemLogs;

// =============================================================================
// ENCAPSULATED SHUTDOWN HANDLER - NO GLOBAL VARIABLES
// =============================================================================
class ShutdownHandler {
private:
    std::atomic<int> received_signal_number{0};
    SystemState* system_state_pointer = nullptr;

public:
    static ShutdownHandler& get_instance() {
        static ShutdownHandler instance;
        return instance;
    }

    void set_system_state(SystemState* state) {
        system_state_pointer = state;
    }

    int get_received_signal() const {
        return received_signal_number.load();
    }

    // Only lock-free atomic stores here; the scanner polls the flag between symbols
    void signal_handler(int signal_number) {
        if (signal_number == SIGINT || signal_number == SIGTERM) {
            received_signal_number.store(signal_number);
            if (system_state_pointer) {
                system_state_pointer->shutdown_requested.store(true);
            }
        }
    }

private:
    ShutdownHandler() = default;
    ShutdownHandler(const ShutdownHandler&) = delete;
    ShutdownHandler& operator=(const ShutdownHandler&) = delete;
};

// =============================================================================
// STATIC SIGNAL HANDLER FUNCTION
// =============================================================================
static void signal_handler(int signal_number) {
    ShutdownHandler::get_instance().signal_handler(signal_number);
}

// =============================================================================
// MAIN APPLICATION ENTRY POINT
// =============================================================================

int main(int argc, char* argv[]) {
    try {
        CommandLineOptions options;
        try {
            options = parse_command_line(std::vector<std::string>(argv + 1, argv + argc));
        } catch (const CommandLineError& usage_error) {
            std::cerr << "Error: " << usage_error.what() << "\n\n" << usage_text();
            return EXIT_CODE_FAILURE;
        }

        // Register signal handlers for graceful shutdown
        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        // Initialize system - config loading, validation, run folder and logger
        SystemInitializationResult initialization_result = initialize(options.config_directory);
        SystemState& system_state = *initialization_result.system_state;

        // Set system state for signal handler access (no global variables)
        ShutdownHandler::get_instance().set_system_state(&system_state);

        SystemThreads thread_handles;
        startup(system_state, thread_handles, initialization_result.logger);
        SystemLogs::log_startup(command_name(options.command));

        int exit_code = EXIT_CODE_FAILURE;
        try {
            exit_code = run_command(options, system_state.config, system_state.shutdown_requested, std::cout, std::cerr);
        } catch (const std::exception& command_exception_error) {
            SystemLogs::log_fatal_error(command_exception_error.what());
            ShutdownHandler::get_instance().set_system_state(nullptr);
            shutdown(system_state, thread_handles, initialization_result.logger);
            throw;
        }

        int received_signal = ShutdownHandler::get_instance().get_received_signal();
        if (received_signal != 0) {
            SystemLogs::log_shutdown_requested(received_signal);
        }

        // Clean shutdown
        ShutdownHandler::get_instance().set_system_state(nullptr);
        shutdown(system_state, thread_handles, initialization_result.logger);

        return exit_code;
    } catch (const std::exception& exception_error) {
        std::cerr << "Fatal error: " << exception_error.what() << std::endl;
        return EXIT_CODE_FAILURE;
    }
}

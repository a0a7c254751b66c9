#include "system_logs.hpp"
#include "logging/logger/async_logger.hpp"

namespace ChartAnalyzer {
namespace Logging {

void SystemLogs::log_startup(const std::string& command) {
    log_message("SYSTEM_STARTUP: chart_analyzer starting | Command: " + command, "");
}

void SystemLogs::log_fatal_error(const std::string& error_message) {
    log_message(std::string("FATAL: ") + error_message, "");
}

void SystemLogs::log_shutdown_requested(int signal_number) {
    log_message("SHUTDOWN: Signal " + std::to_string(signal_number) + " received - finishing current work", "");
}

void SystemLogs::log_shutdown_complete() {
    log_message("SHUTDOWN: System shutdown complete", "");
}

void SystemLogs::log_configuration_loaded(const std::string& config_directory) {
    log_message("CONFIG: Configuration loaded from " + config_directory, "");
}

void SystemLogs::log_configuration_validated(bool valid) {
    if (valid) {
        log_message("CONFIG_VALIDATION: Configuration validated successfully", "");
    } else {
        log_message("CONFIG_VALIDATION: Configuration validation FAILED", "");
    }
}

void SystemLogs::log_unknown_config_key(const std::string& key, const std::string& file_path) {
    log_message("WARNING: Unknown config key '" + key + "' ignored | File: " + file_path, "");
}

void SystemLogs::log_config_line_error(const std::string& line, const std::string& file_path, const std::string& error_message) {
    log_message("CRITICAL: Invalid config line '" + line + "' | File: " + file_path + " | " + error_message, "");
}

void SystemLogs::log_config_file_missing(const std::string& file_path) {
    log_message("ERROR: Config file not found: " + file_path, "");
}

void SystemLogs::log_thread_startup_error(const std::string& error_message) {
    log_message(std::string("ERROR: Error starting threads: ") + error_message, "");
}

} // namespace Logging
} // namespace ChartAnalyzer

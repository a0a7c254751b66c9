#ifndef SYSTEM_LOGS_HPP
#define SYSTEM_LOGS_HPP

#include <string>

namespace ChartAnalyzer {
namespace Logging {

/**
 * Specialized logging for system management operations.
 * Handles all system-level logging in a consistent format.
 */
class SystemLogs {
public:
    // System startup and shutdown
    static void log_startup(const std::string& command);
    static void log_fatal_error(const std::string& error_message);
    static void log_shutdown_requested(int signal_number);
    static void log_shutdown_complete();

    // Configuration
    static void log_configuration_loaded(const std::string& config_directory);
    static void log_configuration_validated(bool valid);
    static void log_unknown_config_key(const std::string& key, const std::string& file_path);
    static void log_config_line_error(const std::string& line, const std::string& file_path, const std::string& error_message);
    static void log_config_file_missing(const std::string& file_path);

    // Logging thread state
    static void log_thread_startup_error(const std::string& error_message);
};

} // namespace Logging
} // namespace ChartAnalyzer

#endif // SYSTEM_LOGS_HPP

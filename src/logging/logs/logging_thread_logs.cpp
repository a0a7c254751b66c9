#include "logging_thread_logs.hpp"
#include "logging/logger/async_logger.hpp"
#include <iostream>

namespace ChartAnalyzer {
namespace Logging {

void LoggingThreadLogs::log_thread_exception(const std::string& error_message) {
    std::cerr << "CRITICAL: Logging thread stopped: " << error_message << std::endl;
}

void LoggingThreadLogs::log_loop_iteration_exception(const std::string& error_message) {
    std::cerr << "ERROR: Log batch dropped: " << error_message << std::endl;
}

void LoggingThreadLogs::log_log_file_open_failure(const std::string& file_path) {
    std::cerr << "ERROR: Run log file unavailable, console only: " << file_path << std::endl;
}

// Still queued, so it lands in the final drain
void LoggingThreadLogs::log_thread_exited() {
    log_message("LOGGING: Logging thread exiting", "");
}

} // namespace Logging
} // namespace ChartAnalyzer

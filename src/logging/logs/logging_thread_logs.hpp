#ifndef LOGGING_THREAD_LOGS_HPP
#define LOGGING_THREAD_LOGS_HPP

#include <string>

namespace ChartAnalyzer {
namespace Logging {

/**
 * Messages about the logging thread itself.
 * Failures bypass the queue and go to stderr, since the queue may no longer be drained.
 */
class LoggingThreadLogs {
public:
    static void log_thread_exception(const std::string& error_message);
    static void log_loop_iteration_exception(const std::string& error_message);
    static void log_log_file_open_failure(const std::string& file_path);
    static void log_thread_exited();
};

} // namespace Logging
} // namespace ChartAnalyzer

#endif // LOGGING_THREAD_LOGS_HPP

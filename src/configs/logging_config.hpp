// LoggingConfig.hpp
#ifndef LOGGING_CONFIG_HPP
#define LOGGING_CONFIG_HPP

#include <string>

namespace ChartAnalyzer {
namespace Config {

struct LoggingConfig {
    std::string log_file;                            // Base log file name inside the run folder
    std::string runtime_logs_directory;              // Parent directory of per-run folders
    bool console_output_enabled;                     // Mirror log lines to stderr
    int flush_interval_milliseconds;                 // Logging thread poll and flush interval

    LoggingConfig()
        : log_file("chart_analyzer.log"), runtime_logs_directory("runtime_logs"),
          console_output_enabled(true), flush_interval_milliseconds(200) {}
};

} // namespace Config
} // namespace ChartAnalyzer

#endif // LOGGING_CONFIG_HPP

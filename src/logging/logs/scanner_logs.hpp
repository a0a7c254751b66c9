#ifndef SCANNER_LOGS_HPP
#define SCANNER_LOGS_HPP

#include <string>

namespace ChartAnalyzer {
namespace Logging {

class ScannerLogs {
public:
    static void log_scan_start(size_t universe_size, int worker_count);
    static void log_scan_summary(size_t analysed_count, size_t matched_count, size_t returned_count, long long elapsed_milliseconds);
    static void log_symbol_failure(const std::string& symbol, const std::string& error_message);
    static void log_filter_rejection(const std::string& symbol, const std::string& reason);
    static void log_scan_interrupted(size_t processed_count, size_t universe_size);
};

} // namespace Logging
} // namespace ChartAnalyzer

#endif // SCANNER_LOGS_HPP

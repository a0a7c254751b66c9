#include "scanner_logs.hpp"
#include "logging/logging_macros.hpp"

namespace ChartAnalyzer {
namespace Logging {

void ScannerLogs::log_scan_start(size_t universe_size, int worker_count) {
    LOG_SCAN_HEADER(universe_size);
    LOG_THREAD_CONTENT("Workers: " + std::to_string(worker_count));
}

void ScannerLogs::log_scan_summary(size_t analysed_count, size_t matched_count, size_t returned_count, long long elapsed_milliseconds) {
    TABLE_HEADER_48("Scan", "Summary");
    TABLE_ROW_48("Analysed", std::to_string(analysed_count));
    TABLE_ROW_48("Matched", std::to_string(matched_count));
    TABLE_ROW_48("Returned", std::to_string(returned_count));
    TABLE_ROW_48("Elapsed", std::to_string(elapsed_milliseconds) + " ms");
    TABLE_FOOTER_48();
}

void ScannerLogs::log_symbol_failure(const std::string& symbol, const std::string& error_message) {
    log_message("ERROR: Scan skipped symbol | Symbol: " + symbol + " | " + error_message, "");
}

void ScannerLogs::log_filter_rejection(const std::string& symbol, const std::string& reason) {
    LOG_THREAD_SUBCONTENT("FILTERED: " + symbol + " - " + reason);
}

void ScannerLogs::log_scan_interrupted(size_t processed_count, size_t universe_size) {
    log_message("WARNING: Scan interrupted by shutdown after " + std::to_string(processed_count) +
                " of " + std::to_string(universe_size) + " symbols", "");
}

} // namespace Logging
} // namespace ChartAnalyzer

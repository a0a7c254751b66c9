#ifndef ANALYSIS_LOGS_HPP
#define ANALYSIS_LOGS_HPP

#include <string>
#include "analyzer/data_structures/data_structures.hpp"

namespace ChartAnalyzer {
namespace Logging {

/**
 * Logging for per-symbol analysis runs.
 */
class AnalysisLogs {
public:
    static void log_analysis_start(const std::string& symbol, size_t bar_count, bool has_benchmark, bool has_fundamentals);
    static void log_insufficient_data(const std::string& symbol, size_t bar_count, int required_bars);
    static void log_analysis_results_table(const ChartAnalyzer::Core::AnalysisResult& result);
    static void log_trade_plan(const std::string& symbol, const ChartAnalyzer::Core::TradeSuggestion& plan);
};

} // namespace Logging
} // namespace ChartAnalyzer

#endif // ANALYSIS_LOGS_HPP

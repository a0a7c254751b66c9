#include "analysis_logs.hpp"
#include "logging/logging_macros.hpp"
#include "utils/format_utils.hpp"

namespace ChartAnalyzer {
namespace Logging {

using namespace ChartAnalyzer::Core;
using FormatUtils::format_fixed;

void AnalysisLogs::log_analysis_start(const std::string& symbol, size_t bar_count, bool has_benchmark, bool has_fundamentals) {
    LOG_ANALYSIS_HEADER(symbol);
    LOG_THREAD_CONTENT("Bars: " + std::to_string(bar_count) +
                       " | Benchmark: " + std::string(has_benchmark ? "YES" : "NO") +
                       " | Fundamentals: " + std::string(has_fundamentals ? "YES" : "NO"));
}

void AnalysisLogs::log_insufficient_data(const std::string& symbol, size_t bar_count, int required_bars) {
    log_message("WARNING: Insufficient data for analysis | Symbol: " + symbol + " | Bars: " +
                std::to_string(bar_count) + " | Required: " + std::to_string(required_bars), "");
}

void AnalysisLogs::log_analysis_results_table(const AnalysisResult& result) {
    const StrategyScores& scores = result.scores;

    TABLE_HEADER_48("Analysis", result.symbol + " @ " + result.timestamp);
    TABLE_ROW_48("Price", format_fixed(result.current_price, 2));
    TABLE_ROW_48("Trend", to_string(result.primary_trend) + " (" + format_fixed(result.trend_strength, 1) + ")");
    TABLE_ROW_48("Stage", std::to_string(to_int(result.weinstein_stage)) + " - " + result.stage_description);
    TABLE_SEPARATOR_48();
    TABLE_ROW_48("Minervini", format_fixed(scores.minervini_score, 1));
    TABLE_ROW_48("Weinstein", format_fixed(scores.weinstein_score, 1));
    TABLE_ROW_48("Lynch", format_fixed(scores.lynch_score, 1));
    TABLE_ROW_48("Technical", format_fixed(scores.technical_score, 1));
    if (scores.fundamental_score) {
        TABLE_ROW_48("Fundamental", format_fixed(*scores.fundamental_score, 1) + " (" + scores.fundamental_grade.value_or("-") + ")");
    }
    TABLE_ROW_48("Composite", format_fixed(scores.composite_score, 1));
    TABLE_SEPARATOR_48();
    TABLE_ROW_48("Signal", to_string(result.signal) + " / " + to_string(result.conviction));
    TABLE_ROW_48("Patterns", std::to_string(result.detected_patterns.size()));
    TABLE_ROW_48("Levels", std::to_string(result.support_levels.size()) + " support, " +
                           std::to_string(result.resistance_levels.size()) + " resistance");
    TABLE_FOOTER_48();
}

void AnalysisLogs::log_trade_plan(const std::string& symbol, const TradeSuggestion& plan) {
    LOG_THREAD_CONTENT("TRADE PLAN: " + symbol + " " + to_string(plan.action) +
                       " | Entry: " + format_fixed(plan.entry_price, 2) +
                       " | Stop: " + format_fixed(plan.stop_loss, 2) +
                       " | Targets: " + format_fixed(plan.target_1.price, 2) + " / " +
                       format_fixed(plan.target_2.price, 2) + " / " + format_fixed(plan.target_3.price, 2));
}

} // namespace Logging
} // namespace ChartAnalyzer

#include "analysis_service.hpp"
#include <algorithm>
#include "logging/logs/analysis_logs.hpp"
#include "utils/format_utils.hpp"

using ChartAnalyzer::Logging::AnalysisLogs;

namespace ChartAnalyzer {
namespace Core {

namespace {
    const size_t MAX_BULLISH_FACTORS = 5;
    const size_t MAX_BEARISH_FACTORS = 5;
    const size_t MAX_WARNINGS = 3;

    std::vector<std::string> head(const std::vector<std::string>& items, size_t count) {
        return std::vector<std::string>(items.begin(), items.begin() + std::min(count, items.size()));
    }
}

AnalysisService::AnalysisService(const ChartAnalyzer::Config::SystemConfig& system_config)
    : config(system_config),
      indicator_engine(config.indicators),
      pattern_detector(config.patterns),
      level_detector(config.support_resistance),
      trend_analyzer(config.trend),
      volume_analyzer(config.volume),
      composite_strategy(config.composite, config.trend),
      trade_planner(config.trade_plan) {}

std::optional<AnalysisReport> AnalysisService::analyze(const std::string& symbol, const BarSeries& bars,
                                                       const std::optional<BarSeries>& benchmark_bars,
                                                       const std::optional<FundamentalData>& fundamentals) const {
    if (static_cast<int>(bars.size()) < config.scanner.service_minimum_bars) {
        AnalysisLogs::log_insufficient_data(symbol, bars.size(), config.scanner.service_minimum_bars);
        return std::nullopt;
    }

    AnalysisLogs::log_analysis_start(symbol, bars.size(), benchmark_bars.has_value(), fundamentals.has_value());

    IndicatorSet indicators = benchmark_bars
        ? indicator_engine.calculate_all(bars, *benchmark_bars)
        : indicator_engine.calculate_all(bars);

    AnalysisReport report;
    report.composite = composite_strategy.analyze(bars, indicators, fundamentals);
    report.analysis = build_analysis_result(symbol, bars, indicators, report.composite);
    report.trade_suggestion = trade_planner.generate(report.analysis, report.composite);

    AnalysisLogs::log_analysis_results_table(report.analysis);
    if (report.trade_suggestion) {
        AnalysisLogs::log_trade_plan(report.analysis.symbol, *report.trade_suggestion);
    }
    return report;
}

std::optional<IndicatorSet> AnalysisService::compute_indicators(const BarSeries& bars) const {
    if (static_cast<int>(bars.size()) < config.indicators.minimum_bars) {
        return std::nullopt;
    }
    return indicator_engine.calculate_all(bars);
}

AnalysisResult AnalysisService::build_analysis_result(const std::string& symbol, const BarSeries& bars,
                                                      const IndicatorSet& indicators, const CompositeResult& composite) const {
    AnalysisResult result;
    result.symbol = FormatUtils::to_upper(symbol);
    result.timestamp = bars.back().timestamp;
    result.current_price = bars.back().close_price;

    TrendAssessment trend = trend_analyzer.analyze_trend(bars);
    result.primary_trend = trend.trend;
    result.trend_strength = trend.strength;
    result.trend_notes = trend.notes;

    StageAssessment stage = trend_analyzer.determine_weinstein_stage(bars);
    result.weinstein_stage = stage.stage;
    result.stage_description = stage.description;

    result.detected_patterns = pattern_detector.detect_patterns(bars);
    LevelSet levels = level_detector.detect_levels(bars);
    result.support_levels = levels.support;
    result.resistance_levels = levels.resistance;
    result.volume = volume_analyzer.analyze_volume(bars);

    result.scores = composite.scores;
    result.signal = composite.signal;
    result.conviction = composite.conviction;
    result.indicators = indicators;

    result.bullish_factors = head(composite.bullish_factors, MAX_BULLISH_FACTORS);
    result.bearish_factors = head(composite.bearish_factors, MAX_BEARISH_FACTORS);
    result.warnings = head(composite.warnings, MAX_WARNINGS);
    if (result.volume.accumulation_detected) {
        result.bullish_factors.push_back("Volume shows accumulation");
    }
    if (result.volume.on_breakout) {
        result.bullish_factors.push_back("Breakout volume detected");
    }
    return result;
}

} // namespace Core
} // namespace ChartAnalyzer

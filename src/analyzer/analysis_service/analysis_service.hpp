#ifndef ANALYSIS_SERVICE_HPP
#define ANALYSIS_SERVICE_HPP

#include <optional>
#include <string>
#include "configs/system_config.hpp"
#include "analyzer/data_structures/data_structures.hpp"
#include "analyzer/technical_analysis/indicators.hpp"
#include "analyzer/technical_analysis/pattern_detector.hpp"
#include "analyzer/technical_analysis/support_resistance.hpp"
#include "analyzer/technical_analysis/trend_analyzer.hpp"
#include "analyzer/technical_analysis/volume_analyzer.hpp"
#include "analyzer/strategy_analysis/composite_strategy.hpp"
#include "analyzer/strategy_analysis/trade_planner.hpp"

namespace ChartAnalyzer {
namespace Core {

/**
 * Runs the full pipeline for one symbol: indicators, trend and stage, patterns,
 * levels, volume, the composite strategy and the trade plan.
 * Bars are expected to be validated already. Each call is independent, so one
 * service may be shared by scan workers.
 */
class AnalysisService {
public:
    explicit AnalysisService(const ChartAnalyzer::Config::SystemConfig& system_config);

    // nullopt when fewer than scanner.service_minimum_bars bars are supplied
    std::optional<AnalysisReport> analyze(const std::string& symbol, const BarSeries& bars,
                                          const std::optional<BarSeries>& benchmark_bars,
                                          const std::optional<FundamentalData>& fundamentals) const;

    // nullopt when fewer than indicators.minimum_bars bars are supplied
    std::optional<IndicatorSet> compute_indicators(const BarSeries& bars) const;

    int minimum_bars() const { return config.scanner.service_minimum_bars; }

private:
    const ChartAnalyzer::Config::SystemConfig config;
    IndicatorEngine indicator_engine;
    PatternDetector pattern_detector;
    SupportResistanceDetector level_detector;
    TrendAnalyzer trend_analyzer;
    VolumeAnalyzer volume_analyzer;
    CompositeStrategy composite_strategy;
    TradePlanner trade_planner;

    AnalysisResult build_analysis_result(const std::string& symbol, const BarSeries& bars,
                                         const IndicatorSet& indicators, const CompositeResult& composite) const;
};

} // namespace Core
} // namespace ChartAnalyzer

#endif // ANALYSIS_SERVICE_HPP

#ifndef TREND_ANALYZER_HPP
#define TREND_ANALYZER_HPP

#include "configs/analysis_config.hpp"
#include "analyzer/data_structures/data_structures.hpp"

namespace ChartAnalyzer {
namespace Core {

/**
 * Trend and Weinstein stage classifier.
 * analyze_trend scores price against its moving averages and recent swing structure.
 * determine_weinstein_stage uses the weekly-equivalent moving average and its slope;
 * the decision table is evaluated in order and the first matching row wins.
 */
class TrendAnalyzer {
public:
    explicit TrendAnalyzer(const ChartAnalyzer::Config::TrendConfig& trend_config);

    TrendAssessment analyze_trend(const BarSeries& bars) const;
    StageAssessment determine_weinstein_stage(const BarSeries& bars) const;

    bool is_uptrend(const BarSeries& bars) const;
    bool is_downtrend(const BarSeries& bars) const;

private:
    const ChartAnalyzer::Config::TrendConfig config;

    bool has_higher_highs_and_lows(const BarSeries& bars) const;
    bool has_lower_lows_and_highs(const BarSeries& bars) const;
};

// Bar-to-bar increases (or decreases) across the whole series
int count_higher_values(const std::vector<double>& values);
int count_lower_values(const std::vector<double>& values);

} // namespace Core
} // namespace ChartAnalyzer

#endif // TREND_ANALYZER_HPP

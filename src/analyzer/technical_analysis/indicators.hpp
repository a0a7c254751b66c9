#ifndef INDICATORS_HPP
#define INDICATORS_HPP

#include <optional>
#include "configs/analysis_config.hpp"
#include "analyzer/data_structures/data_structures.hpp"
#include "analyzer/data_structures/indicator_set.hpp"

namespace ChartAnalyzer {
namespace Core {

/**
 * Indicator engine.
 * Computes the latest value of every configured indicator from an OHLCV sequence.
 * Below the configured minimum bar count the returned set is empty; individual
 * indicators are absent whenever their own window is not yet full.
 */
class IndicatorEngine {
public:
    explicit IndicatorEngine(const ChartAnalyzer::Config::IndicatorConfig& indicator_config);

    IndicatorSet calculate_all(const BarSeries& bars) const;
    IndicatorSet calculate_all(const BarSeries& bars, const BarSeries& benchmark_bars) const;

private:
    const ChartAnalyzer::Config::IndicatorConfig config;

    void add_moving_averages(IndicatorSet& indicators, const BarSeries& bars) const;
    void add_macd(IndicatorSet& indicators, const BarSeries& bars) const;
    void add_rsi(IndicatorSet& indicators, const BarSeries& bars) const;
    void add_stochastic(IndicatorSet& indicators, const BarSeries& bars) const;
    void add_bollinger_bands(IndicatorSet& indicators, const BarSeries& bars) const;
    void add_atr(IndicatorSet& indicators, const BarSeries& bars) const;
    void add_adx(IndicatorSet& indicators, const BarSeries& bars) const;
    void add_volume_indicators(IndicatorSet& indicators, const BarSeries& bars) const;
};

// Ratio of cumulative returns over the timestamps both series share
std::optional<double> compute_relative_strength(const BarSeries& bars, const BarSeries& benchmark_bars);

// True range with the first bar's range standing in for the missing previous close
std::vector<double> compute_true_range(const BarSeries& bars);

} // namespace Core
} // namespace ChartAnalyzer

#endif // INDICATORS_HPP

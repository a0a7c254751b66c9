// AnalysisConfig.hpp
#ifndef ANALYSIS_CONFIG_HPP
#define ANALYSIS_CONFIG_HPP

#include <vector>

namespace ChartAnalyzer {
namespace Config {

struct IndicatorConfig {
    // ========================================================================
    // MOVING AVERAGES
    // ========================================================================

    std::vector<int> sma_periods;                    // Simple moving average periods
    std::vector<int> ema_periods;                    // Exponential moving average periods

    // ========================================================================
    // OSCILLATORS
    // ========================================================================

    int rsi_period;                                  // RSI lookback (Wilder-style rolling means)
    int macd_fast;                                   // MACD fast EMA span
    int macd_slow;                                   // MACD slow EMA span
    int macd_signal;                                 // MACD signal EMA span
    int stoch_k;                                     // Stochastic %K lookback
    int stoch_d;                                     // Stochastic %D smoothing
    int stoch_smooth;                                // Stochastic raw %K smoothing

    // ========================================================================
    // VOLATILITY AND TREND STRENGTH
    // ========================================================================

    int bb_period;                                   // Bollinger Band period
    double bb_std;                                   // Bollinger Band width in standard deviations
    int atr_period;                                  // Average true range period
    int adx_period;                                  // ADX and DI period

    // ========================================================================
    // VOLUME
    // ========================================================================

    std::vector<int> volume_sma_periods;             // Volume moving average periods
    int obv_sma_period;                              // On-balance volume smoothing period

    int minimum_bars;                                // Bars required before any indicator is computed

    IndicatorConfig()
        : sma_periods{10, 20, 50, 150, 200}, ema_periods{8, 21},
          rsi_period(14), macd_fast(12), macd_slow(26), macd_signal(9),
          stoch_k(14), stoch_d(3), stoch_smooth(3),
          bb_period(20), bb_std(2.0), atr_period(14), adx_period(14),
          volume_sma_periods{20, 50}, obv_sma_period(20), minimum_bars(50) {}
};

struct PatternConfig {
    int minimum_bars;                                // Bars required before any detector runs
    int pivot_window;                                // Symmetric swing-point window
    double double_top_tolerance;                     // Max relative difference between twin peaks
    double cup_depth_min;                            // Cup depth lower bound (exclusive)
    double cup_depth_max;                            // Cup depth upper bound (exclusive)

    PatternConfig()
        : minimum_bars(20), pivot_window(5), double_top_tolerance(0.03),
          cup_depth_min(0.10), cup_depth_max(0.35) {}
};

struct SupportResistanceConfig {
    int lookback_period;                             // Trailing bars used for pivot and volume levels
    double tolerance_pct;                            // Cluster radius as percent of current price
    int pivot_lookback;                              // Bars on each side of a pivot level
    double volume_threshold;                         // Volume spike multiple of average volume
    int max_levels;                                  // Levels kept on each side after ranking
    std::vector<int> ma_periods;                     // Moving averages offered as dynamic levels
    std::vector<int> psychological_increments;       // Round-number increments

    SupportResistanceConfig()
        : lookback_period(100), tolerance_pct(1.0), pivot_lookback(5), volume_threshold(1.5),
          max_levels(10), ma_periods{20, 50, 100, 200}, psychological_increments{50, 100, 500, 1000} {}
};

struct TrendConfig {
    int minimum_bars;                                // Bars required by analyze_trend
    int stage_minimum_bars;                          // Bars required by the stage classifier
    int stage_ma_period;                             // Weekly-equivalent moving average period
    double stage_slope_deadband;                     // Slope band treated as flat
    int structure_window;                            // Window for higher-high / lower-low runs
    double structure_ratio;                          // Fraction of deltas that must agree

    TrendConfig()
        : minimum_bars(50), stage_minimum_bars(200), stage_ma_period(150),
          stage_slope_deadband(0.01), structure_window(20), structure_ratio(0.6) {}
};

struct VolumeConfig {
    std::vector<int> sma_periods;                    // Short and long volume averages
    double spike_threshold;                          // Breakout volume multiple of the short average
    double accumulation_threshold;                   // Up/down day mean volume ratio
    double climax_multiplier;                        // Climax volume multiple of the short average

    VolumeConfig()
        : sma_periods{20, 50}, spike_threshold(1.5), accumulation_threshold(2.0), climax_multiplier(3.0) {}
};

} // namespace Config
} // namespace ChartAnalyzer

#endif // ANALYSIS_CONFIG_HPP

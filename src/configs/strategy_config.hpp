// StrategyConfig.hpp
#ifndef STRATEGY_CONFIG_HPP
#define STRATEGY_CONFIG_HPP

#include <vector>

namespace ChartAnalyzer {
namespace Config {

struct CompositeConfig {
    // ========================================================================
    // STRATEGY WEIGHTS
    // ========================================================================

    double minervini_weight;                         // Weight of the Minervini SEPA score
    double weinstein_weight;                         // Weight of the Weinstein stage score
    double lynch_weight;                             // Weight of the Lynch GARP score
    double technical_weight;                         // Weight of the pure-indicator technical score

    // ========================================================================
    // CONSENSUS
    // ========================================================================

    double agreement_std_threshold;                  // Population std below which strategies agree
    double lynch_neutral_score;                      // Stand-in for a zero Lynch score in the agreement test

    CompositeConfig()
        : minervini_weight(0.35), weinstein_weight(0.35), lynch_weight(0.15), technical_weight(0.15),
          agreement_std_threshold(15.0), lynch_neutral_score(50.0) {}
};

struct TradePlanConfig {
    // ========================================================================
    // ENTRY AND STOP PLACEMENT (multiples of ATR)
    // ========================================================================

    double entry_zone_atr_multiple;                  // Half-width of the entry zone
    double support_stop_atr_buffer;                  // Buffer below the highest nearby support
    double max_stop_atr_multiple;                    // Stop is never closer than this to entry
    double no_support_stop_atr_multiple;             // Stop distance when no support is known
    double fallback_atr_pct;                         // ATR stand-in as a fraction of price

    // ========================================================================
    // TARGETS AND SIZING
    // ========================================================================

    std::vector<double> target_risk_multiples;       // Conservative, moderate and aggressive targets
    double resistance_cap_factor;                    // Second target cap relative to nearest resistance
    double high_conviction_position_pct;             // Suggested position for HIGH conviction
    double medium_conviction_position_pct;           // Suggested position for MEDIUM conviction
    double low_conviction_position_pct;              // Suggested position for LOW conviction
    double max_position_factor;                      // Max position as a multiple of the suggestion

    TradePlanConfig()
        : entry_zone_atr_multiple(0.5), support_stop_atr_buffer(0.5), max_stop_atr_multiple(1.5),
          no_support_stop_atr_multiple(2.0), fallback_atr_pct(0.02),
          target_risk_multiples{1.5, 2.5, 4.0}, resistance_cap_factor(0.98),
          high_conviction_position_pct(5.0), medium_conviction_position_pct(3.0),
          low_conviction_position_pct(1.5), max_position_factor(1.5) {}
};

} // namespace Config
} // namespace ChartAnalyzer

#endif // STRATEGY_CONFIG_HPP

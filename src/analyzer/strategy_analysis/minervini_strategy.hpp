#ifndef MINERVINI_STRATEGY_HPP
#define MINERVINI_STRATEGY_HPP

#include "strategy_common.hpp"

namespace ChartAnalyzer {
namespace Core {

/**
 * Minervini SEPA scorer.
 * Setup (25) + VCP formation (25) + volume (20) + relative strength (15) + market alignment (15).
 * Requires 200 bars.
 */
class MinerviniStrategy {
public:
    static constexpr int MINIMUM_BARS = 200;
    static constexpr const char* LABEL = "Minervini";

    StrategyResult analyze(const StrategyContext& context) const;

private:
    double score_setup(const StrategyContext& context, StrategyResult& result) const;
    double score_vcp(const StrategyContext& context, StrategyResult& result) const;
    double score_volume(const StrategyContext& context, StrategyResult& result) const;
    double score_relative_strength(const StrategyContext& context, StrategyResult& result) const;
    double score_market_alignment(const StrategyContext& context, StrategyResult& result) const;
};

// Swing-range contractions in percent, pairing pivots (0,1), (2,3), ... in index order
std::vector<double> measure_vcp_contractions(const BarSeries& bars, int window);

} // namespace Core
} // namespace ChartAnalyzer

#endif // MINERVINI_STRATEGY_HPP

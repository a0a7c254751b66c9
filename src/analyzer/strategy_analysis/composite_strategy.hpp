#ifndef COMPOSITE_STRATEGY_HPP
#define COMPOSITE_STRATEGY_HPP

#include <string>
#include <utility>
#include <variant>
#include <vector>
#include "configs/analysis_config.hpp"
#include "configs/strategy_config.hpp"
#include "strategy_common.hpp"
#include "minervini_strategy.hpp"
#include "weinstein_strategy.hpp"
#include "lynch_strategy.hpp"
#include "fundamental_scorer.hpp"

namespace ChartAnalyzer {
namespace Core {

// Closed set of scorers run by the composite
using StrategyVariant = std::variant<MinerviniStrategy, WeinsteinStrategy, LynchStrategy>;

/**
 * Composite strategy.
 * Runs every scorer on the same inputs, combines them with the configured weights and
 * a pure-indicator technical score, and derives signal and conviction from the
 * composite score plus the agreement between the three scorers.
 */
class CompositeStrategy {
public:
    CompositeStrategy(const ChartAnalyzer::Config::CompositeConfig& composite_config,
                      const ChartAnalyzer::Config::TrendConfig& trend_config);

    CompositeResult analyze(const BarSeries& bars, const IndicatorSet& indicators,
                            const std::optional<FundamentalData>& fundamentals) const;

    double compute_composite_score(double minervini_score, double weinstein_score,
                                   double lynch_score, double technical_score) const;

    std::pair<SignalType, ConvictionLevel> determine_signal(double composite_score, const StrategyScores& scores) const;

private:
    const ChartAnalyzer::Config::CompositeConfig config;
    std::vector<StrategyVariant> strategies;
    FundamentalScorer fundamental_scorer;
};

// Base 50 adjusted by MA alignment, RSI zone, MACD, stochastic, ADX/DI and Bollinger position
double compute_technical_score(const BarSeries& bars, const IndicatorSet& indicators);

// Multi-line plain text report of a composite result
std::string strategy_summary(const CompositeResult& result);

} // namespace Core
} // namespace ChartAnalyzer

#endif // COMPOSITE_STRATEGY_HPP

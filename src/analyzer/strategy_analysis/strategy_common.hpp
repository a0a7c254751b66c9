#ifndef STRATEGY_COMMON_HPP
#define STRATEGY_COMMON_HPP

#include <optional>
#include <string>
#include <utility>
#include "analyzer/data_structures/data_structures.hpp"
#include "analyzer/technical_analysis/volume_analyzer.hpp"

namespace ChartAnalyzer {
namespace Core {

// Inputs shared by every strategy scorer
struct StrategyContext {
    const BarSeries& bars;
    const IndicatorSet& indicators;
    const std::optional<FundamentalData>& fundamentals;

    StrategyContext(const BarSeries& bar_series, const IndicatorSet& indicator_set,
                    const std::optional<FundamentalData>& fundamental_data)
        : bars(bar_series), indicators(indicator_set), fundamentals(fundamental_data) {}
};

// Shared score table: >=80 BUY/HIGH, >=65 BUY/MEDIUM, >=50 HOLD/LOW, >=35 AVOID/MEDIUM, else SELL/HIGH
std::pair<SignalType, ConvictionLevel> signal_from_score(double score);

// Score 0, AVOID/LOW, "Insufficient data" plus the given warning
StrategyResult insufficient_result(const std::string& warning);

// Sets signal and conviction from the score
void finalize_result(StrategyResult& result);

double clamp_score(double score, double minimum, double maximum);

} // namespace Core
} // namespace ChartAnalyzer

#endif // STRATEGY_COMMON_HPP

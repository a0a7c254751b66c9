#ifndef TRADE_PLANNER_HPP
#define TRADE_PLANNER_HPP

#include <optional>
#include "configs/strategy_config.hpp"
#include "analyzer/data_structures/data_structures.hpp"

namespace ChartAnalyzer {
namespace Core {

/**
 * Trade plan synthesis.
 * BUY produces an ATR-scaled entry zone, a support-derived stop and risk-multiple targets.
 * AVOID produces the fixed do-not-enter plan. HOLD and SELL produce no plan.
 */
class TradePlanner {
public:
    explicit TradePlanner(const ChartAnalyzer::Config::TradePlanConfig& trade_plan_config);

    std::optional<TradeSuggestion> generate(const AnalysisResult& analysis, const CompositeResult& composite) const;

private:
    const ChartAnalyzer::Config::TradePlanConfig config;

    TradeSuggestion build_avoid_plan(const AnalysisResult& analysis, const CompositeResult& composite) const;
    TradeSuggestion build_buy_plan(const AnalysisResult& analysis, const CompositeResult& composite) const;
    double position_for(ConvictionLevel conviction) const;
    double target_multiple(size_t index, double fallback) const;
};

} // namespace Core
} // namespace ChartAnalyzer

#endif // TRADE_PLANNER_HPP

#ifndef LYNCH_STRATEGY_HPP
#define LYNCH_STRATEGY_HPP

#include "strategy_common.hpp"
#include "fundamental_scorer.hpp"

namespace ChartAnalyzer {
namespace Core {

/**
 * Lynch GARP scorer.
 * With scorable fundamentals the score is the FundamentalScorer result unchanged.
 * Without them a technical-only score from a neutral base of 40 is returned and flagged.
 */
class LynchStrategy {
public:
    static constexpr int MINIMUM_BARS = 50;
    static constexpr const char* LABEL = "Lynch";

    StrategyResult analyze(const StrategyContext& context) const;

private:
    FundamentalScorer fundamental_scorer;

    StrategyResult score_technical_fallback(const StrategyContext& context) const;
};

} // namespace Core
} // namespace ChartAnalyzer

#endif // LYNCH_STRATEGY_HPP

#ifndef WEINSTEIN_STRATEGY_HPP
#define WEINSTEIN_STRATEGY_HPP

#include "strategy_common.hpp"
#include "configs/analysis_config.hpp"
#include "analyzer/technical_analysis/trend_analyzer.hpp"

namespace ChartAnalyzer {
namespace Core {

/**
 * Weinstein stage scorer.
 * Stage (40) + 30-week MA relationship (25) + price action (20) + volume (15).
 * The stage comes from the shared TrendAnalyzer so it matches the reported stage.
 */
class WeinsteinStrategy {
public:
    static constexpr int MINIMUM_BARS = 150;
    static constexpr const char* LABEL = "Weinstein";

    explicit WeinsteinStrategy(const ChartAnalyzer::Config::TrendConfig& trend_config);

    StrategyResult analyze(const StrategyContext& context) const;

private:
    TrendAnalyzer trend_analyzer;

    double score_stage(const StageAssessment& stage, StrategyResult& result) const;
    double score_ma_relationship(const StrategyContext& context, StrategyResult& result) const;
    double score_price_action(const StrategyContext& context, StrategyResult& result) const;
    double score_volume(const StrategyContext& context, StrategyResult& result) const;
};

} // namespace Core
} // namespace ChartAnalyzer

#endif // WEINSTEIN_STRATEGY_HPP

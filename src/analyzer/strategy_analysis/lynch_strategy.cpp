#include "lynch_strategy.hpp"
#include "utils/format_utils.hpp"

namespace ChartAnalyzer {
namespace Core {

using FormatUtils::format_fixed;

StrategyResult LynchStrategy::analyze(const StrategyContext& context) const {
    if (static_cast<int>(context.bars.size()) < MINIMUM_BARS) {
        return insufficient_result("Need at least 50 bars for analysis");
    }

    if (context.fundamentals) {
        std::optional<FundamentalScore> garp = fundamental_scorer.score(*context.fundamentals);
        if (garp) {
            StrategyResult result;
            result.score = garp->score;
            result.bullish_factors = garp->bullish_factors;
            result.bearish_factors = garp->bearish_factors;
            result.warnings = garp->warnings;
            result.sub_scores = garp->detail_scores;
            finalize_result(result);
            return result;
        }
    }

    return score_technical_fallback(context);
}

StrategyResult LynchStrategy::score_technical_fallback(const StrategyContext& context) const {
    StrategyResult result;
    double score = 40.0;
    double current_price = context.bars.back().close_price;

    std::optional<double> sma_50 = context.indicators.get(IndicatorNames::SMA_50);
    std::optional<double> sma_200 = context.indicators.get(IndicatorNames::SMA_200);
    std::optional<double> rsi = context.indicators.get(IndicatorNames::RSI_14);

    if (sma_50) {
        if (current_price > *sma_50) {
            score += 10.0;
            result.bullish_factors.push_back("Trading above 50-day MA");
        } else {
            score -= 10.0;
            result.bearish_factors.push_back("Below 50-day MA");
        }
    }

    if (sma_200) {
        if (current_price > *sma_200) {
            score += 10.0;
            result.bullish_factors.push_back("Trading above 200-day MA");
        } else {
            score -= 10.0;
            result.bearish_factors.push_back("Below 200-day MA");
        }
    }

    if (sma_50 && sma_200 && *sma_50 > *sma_200) {
        score += 5.0;
    }

    if (rsi) {
        if (*rsi > 40.0 && *rsi < 70.0) {
            score += 10.0;
            result.bullish_factors.push_back("RSI in bullish zone (" + format_fixed(*rsi, 1) + ")");
        } else if (*rsi >= 70.0) {
            result.warnings.push_back("RSI overbought (" + format_fixed(*rsi, 1) + ")");
        } else if (*rsi <= 30.0) {
            score -= 5.0;
            result.bearish_factors.push_back("RSI oversold (" + format_fixed(*rsi, 1) + ")");
        } else {
            score += 3.0;
        }
    }

    if (sma_50 && current_price > *sma_50 * 1.15) {
        result.warnings.push_back("Extended far above 50-day MA");
    }

    result.score = clamp_score(score, 0.0, 100.0);
    result.sub_scores["technical"] = result.score;
    result.warnings.push_back("Fundamental data unavailable - technical-only score");
    finalize_result(result);
    return result;
}

} // namespace Core
} // namespace ChartAnalyzer

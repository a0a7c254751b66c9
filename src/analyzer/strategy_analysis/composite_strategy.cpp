#include "composite_strategy.hpp"
#include <cmath>
#include "analyzer/technical_analysis/series_math.hpp"
#include "utils/format_utils.hpp"

namespace ChartAnalyzer {
namespace Core {

using ChartAnalyzer::Config::CompositeConfig;
using ChartAnalyzer::Config::TrendConfig;
using FormatUtils::format_fixed;

namespace {
    const size_t TOP_BULLISH_PER_STRATEGY = 3;
    const size_t TOP_BEARISH_PER_STRATEGY = 2;
    const size_t TOP_WARNINGS_PER_STRATEGY = 2;

    void append_labelled(std::vector<std::string>& destination, const std::vector<std::string>& source,
                         size_t limit, const std::string& label) {
        for (size_t index = 0; index < source.size() && index < limit; ++index) {
            destination.push_back("[" + label + "] " + source[index]);
        }
    }

    void append_section(std::vector<std::string>& lines, const std::string& title,
                        const std::vector<std::string>& items, size_t limit, const std::string& marker) {
        if (items.empty()) {
            return;
        }
        lines.push_back("");
        lines.push_back(title);
        for (size_t index = 0; index < items.size() && index < limit; ++index) {
            lines.push_back("  " + marker + " " + items[index]);
        }
    }

    StrategyBreakdown breakdown_of(const StrategyResult& result) {
        StrategyBreakdown breakdown;
        breakdown.score = result.score;
        breakdown.signal = result.signal;
        breakdown.conviction = result.conviction;
        return breakdown;
    }
}

CompositeStrategy::CompositeStrategy(const CompositeConfig& composite_config, const TrendConfig& trend_config)
    : config(composite_config) {
    strategies.emplace_back(MinerviniStrategy());
    strategies.emplace_back(WeinsteinStrategy(trend_config));
    strategies.emplace_back(LynchStrategy());
}

CompositeResult CompositeStrategy::analyze(const BarSeries& bars, const IndicatorSet& indicators,
                                           const std::optional<FundamentalData>& fundamentals) const {
    StrategyContext context(bars, indicators, fundamentals);
    CompositeResult composite;
    std::vector<std::pair<std::string, StrategyResult>> labelled_results;

    for (const StrategyVariant& strategy : strategies) {
        std::visit([&](const auto& scorer) {
            labelled_results.emplace_back(scorer.LABEL, scorer.analyze(context));
        }, strategy);
    }

    // Factor lists stay grouped by strategy in scorer order
    for (const std::pair<std::string, StrategyResult>& entry : labelled_results) {
        append_labelled(composite.bullish_factors, entry.second.bullish_factors, TOP_BULLISH_PER_STRATEGY, entry.first);
    }
    for (const std::pair<std::string, StrategyResult>& entry : labelled_results) {
        append_labelled(composite.bearish_factors, entry.second.bearish_factors, TOP_BEARISH_PER_STRATEGY, entry.first);
    }
    for (const std::pair<std::string, StrategyResult>& entry : labelled_results) {
        append_labelled(composite.warnings, entry.second.warnings, TOP_WARNINGS_PER_STRATEGY, entry.first);
    }

    std::map<std::string, StrategyResult> results;
    for (const std::pair<std::string, StrategyResult>& entry : labelled_results) {
        results[FormatUtils::to_lower(entry.first)] = entry.second;
    }

    StrategyScores& scores = composite.scores;
    scores.minervini_score = results["minervini"].score;
    scores.weinstein_score = results["weinstein"].score;
    scores.lynch_score = results["lynch"].score;
    scores.technical_score = compute_technical_score(bars, indicators);
    scores.composite_score = compute_composite_score(scores.minervini_score, scores.weinstein_score,
                                                     scores.lynch_score, scores.technical_score);

    if (fundamentals) {
        std::optional<FundamentalScore> garp = fundamental_scorer.score(*fundamentals);
        if (garp) {
            scores.fundamental_score = garp->score;
            scores.fundamental_grade = garp->grade;
        }
    }

    std::pair<SignalType, ConvictionLevel> signal_and_conviction = determine_signal(scores.composite_score, scores);
    composite.signal = signal_and_conviction.first;
    composite.conviction = signal_and_conviction.second;

    for (const std::pair<const std::string, StrategyResult>& entry : results) {
        composite.strategy_details[entry.first] = breakdown_of(entry.second);
    }
    composite.strategy_details["technical"].score = scores.technical_score;
    return composite;
}

double CompositeStrategy::compute_composite_score(double minervini_score, double weinstein_score,
                                                  double lynch_score, double technical_score) const {
    return minervini_score * config.minervini_weight +
           weinstein_score * config.weinstein_weight +
           lynch_score * config.lynch_weight +
           technical_score * config.technical_weight;
}

std::pair<SignalType, ConvictionLevel> CompositeStrategy::determine_signal(double composite_score,
                                                                           const StrategyScores& scores) const {
    // A zero Lynch score means it did not run, so it is neutral for agreement
    double lynch_for_agreement = scores.lynch_score == 0.0 ? config.lynch_neutral_score : scores.lynch_score;
    SeriesMath::Series strategy_scores{scores.minervini_score, scores.weinstein_score, lynch_for_agreement};
    bool strategies_agree = SeriesMath::population_std(strategy_scores) < config.agreement_std_threshold;

    if (composite_score >= 70.0) {
        bool high = composite_score >= 85.0 && strategies_agree;
        return {SignalType::BUY, high ? ConvictionLevel::HIGH : ConvictionLevel::MEDIUM};
    }
    if (composite_score >= 50.0) {
        return {SignalType::HOLD, ConvictionLevel::LOW};
    }
    if (composite_score >= 35.0) {
        return {SignalType::HOLD, ConvictionLevel::LOW};
    }
    bool high = composite_score < 25.0 && strategies_agree;
    return {SignalType::AVOID, high ? ConvictionLevel::HIGH : ConvictionLevel::MEDIUM};
}

double compute_technical_score(const BarSeries& bars, const IndicatorSet& indicators) {
    if (bars.empty() || indicators.empty()) {
        return 0.0;
    }

    double score = 50.0;
    double current_price = bars.back().close_price;

    std::optional<double> sma_20 = indicators.get(IndicatorNames::SMA_20);
    std::optional<double> sma_50 = indicators.get(IndicatorNames::SMA_50);
    std::optional<double> sma_200 = indicators.get(IndicatorNames::SMA_200);

    if (sma_20 && current_price > *sma_20) score += 5.0;
    if (sma_50 && current_price > *sma_50) score += 5.0;
    if (sma_200 && current_price > *sma_200) score += 5.0;
    if (sma_20 && sma_50 && *sma_20 > *sma_50) score += 5.0;

    std::optional<double> rsi = indicators.get(IndicatorNames::RSI_14);
    if (rsi) {
        if (*rsi > 40.0 && *rsi < 70.0) {
            score += 5.0;
        } else if (*rsi > 70.0) {
            score -= 3.0;
        } else if (*rsi < 30.0) {
            score += 3.0;
        }
    }

    std::optional<double> macd = indicators.get(IndicatorNames::MACD);
    std::optional<double> macd_signal = indicators.get(IndicatorNames::MACD_SIGNAL);
    if (macd && macd_signal) {
        score += *macd > *macd_signal ? 5.0 : -5.0;
    }

    std::optional<double> stoch_k = indicators.get(IndicatorNames::STOCH_K);
    if (stoch_k && *stoch_k > 20.0 && *stoch_k < 80.0) {
        score += 5.0;
    }

    std::optional<double> adx = indicators.get(IndicatorNames::ADX_14);
    std::optional<double> plus_di = indicators.get(IndicatorNames::PLUS_DI);
    std::optional<double> minus_di = indicators.get(IndicatorNames::MINUS_DI);
    if (adx && *adx > 25.0 && plus_di && minus_di) {
        score += *plus_di > *minus_di ? 10.0 : -5.0;
    }

    std::optional<double> bb_upper = indicators.get(IndicatorNames::BB_UPPER);
    std::optional<double> bb_lower = indicators.get(IndicatorNames::BB_LOWER);
    if (bb_upper && bb_lower) {
        double bb_mid = (*bb_upper + *bb_lower) / 2.0;
        if (current_price > bb_mid) {
            score += 3.0;
        }
        if (current_price > *bb_upper) {
            score -= 3.0;
        } else if (current_price < *bb_lower) {
            score += 3.0;
        }
    }

    return clamp_score(score, 0.0, 100.0);
}

std::string strategy_summary(const CompositeResult& result) {
    const StrategyScores& scores = result.scores;
    std::vector<std::string> lines{
        "Composite Score: " + format_fixed(scores.composite_score, 1) + "/100",
        "Signal: " + to_string(result.signal) + " (" + to_string(result.conviction) + ")",
        "",
        "Individual Scores:",
        "  - Minervini SEPA: " + format_fixed(scores.minervini_score, 1),
        "  - Weinstein Stage: " + format_fixed(scores.weinstein_score, 1),
        "  - Lynch GARP: " + format_fixed(scores.lynch_score, 1),
        "  - Technical: " + format_fixed(scores.technical_score, 1),
    };

    append_section(lines, "Bullish Factors:", result.bullish_factors, 5, "+");
    append_section(lines, "Bearish Factors:", result.bearish_factors, 5, "-");
    append_section(lines, "Warnings:", result.warnings, 3, "!");
    return FormatUtils::join(lines, "\n");
}

} // namespace Core
} // namespace ChartAnalyzer

#include "minervini_strategy.hpp"
#include <algorithm>
#include "analyzer/technical_analysis/pivot_detection.hpp"
#include "analyzer/technical_analysis/series_math.hpp"
#include "utils/format_utils.hpp"

namespace ChartAnalyzer {
namespace Core {

using namespace SeriesMath;
using FormatUtils::format_fixed;

namespace {
    const int VCP_LOOKBACK = 100;
    const int VCP_PIVOT_WINDOW = 5;
    const size_t YEAR_BARS = 252;
    const size_t SLOPE_LOOKBACK = 20;

    double trailing_change(const Series& moving_average) {
        double previous = moving_average[moving_average.size() - SLOPE_LOOKBACK];
        return (moving_average.back() - previous) / previous;
    }
}

StrategyResult MinerviniStrategy::analyze(const StrategyContext& context) const {
    if (context.bars.empty() || static_cast<int>(context.bars.size()) < MINIMUM_BARS) {
        return insufficient_result("Need at least 200 bars of data");
    }

    StrategyResult result;
    double setup_score = score_setup(context, result);
    double vcp_score = score_vcp(context, result);
    double volume_score = score_volume(context, result);
    double rs_score = score_relative_strength(context, result);
    double market_score = score_market_alignment(context, result);

    result.sub_scores["setup"] = setup_score;
    result.sub_scores["vcp"] = vcp_score;
    result.sub_scores["volume"] = volume_score;
    result.sub_scores["relative_strength"] = rs_score;
    result.sub_scores["market_alignment"] = market_score;
    result.score = setup_score + vcp_score + volume_score + rs_score + market_score;
    finalize_result(result);
    return result;
}

double MinerviniStrategy::score_setup(const StrategyContext& context, StrategyResult& result) const {
    double score = 0.0;
    Series close_values = closes(context.bars);
    double current_price = close_values.back();

    std::optional<double> sma_50 = context.indicators.get(IndicatorNames::SMA_50);
    std::optional<double> sma_150 = context.indicators.get(IndicatorNames::SMA_150);
    std::optional<double> sma_200 = context.indicators.get(IndicatorNames::SMA_200);

    if (sma_50 && sma_150 && sma_200) {
        if (current_price > *sma_50 && *sma_50 > *sma_150 && *sma_150 > *sma_200) {
            score += 10.0;
            result.bullish_factors.push_back("Perfect MA alignment: Price > SMA50 > SMA150 > SMA200");
        } else if (current_price > *sma_50 && *sma_50 > *sma_150) {
            score += 7.0;
            result.bullish_factors.push_back("Good MA alignment: Price > SMA50 > SMA150");
        } else if (current_price > *sma_50) {
            score += 3.0;
            result.bullish_factors.push_back("Price above SMA50");
        } else {
            result.bearish_factors.push_back("Price below key moving averages");
            score -= 5.0;
        }

        if (trailing_change(rolling_mean(close_values, 150)) > 0.0) {
            score += 3.0;
            result.bullish_factors.push_back("SMA150 trending up");
        } else {
            result.bearish_factors.push_back("SMA150 not trending up");
        }

        if (trailing_change(rolling_mean(close_values, 200)) > 0.0) {
            score += 2.0;
            result.bullish_factors.push_back("SMA200 trending up");
        } else {
            result.bearish_factors.push_back("SMA200 not trending up");
        }
    }

    Series year_closes = tail(close_values, YEAR_BARS);
    double year_high = max_value(year_closes);
    double year_low = min_value(year_closes);
    double pct_from_low = (current_price - year_low) / year_low * 100.0;
    double pct_from_high = (year_high - current_price) / year_high * 100.0;

    if (pct_from_low >= 30.0) {
        score += 3.0;
        result.bullish_factors.push_back("At least 30% above 52-week low (" + format_fixed(pct_from_low, 1) + "%)");
    } else {
        result.warnings.push_back("Only " + format_fixed(pct_from_low, 1) + "% above 52-week low (need 30%)");
    }

    if (pct_from_high <= 25.0) {
        score += 4.0;
        result.bullish_factors.push_back("Within 25% of 52-week high (" + format_fixed(pct_from_high, 1) + "% below)");
    } else {
        result.warnings.push_back("Too far from 52-week high (" + format_fixed(pct_from_high, 1) + "% below)");
    }

    // Stage 2 proxy
    if (sma_50 && current_price > *sma_50) {
        score += 3.0;
    }

    return clamp_score(score, 0.0, 25.0);
}

std::vector<double> measure_vcp_contractions(const BarSeries& bars, int window) {
    std::vector<double> contractions;
    std::vector<SwingPoint> pivots = find_swing_points(bars, window);
    if (pivots.size() < 3) {
        return contractions;
    }

    // Pairs are taken by position, not by alternating kind
    for (size_t pivot_index = 0; pivot_index + 1 < pivots.size(); pivot_index += 2) {
        const SwingPoint& first = pivots[pivot_index];
        const SwingPoint& second = pivots[pivot_index + 1];
        double pivot_high = first.is_high ? first.value() : second.value();
        double pivot_low = !first.is_high ? first.value() : second.value();

        if (pivot_high > pivot_low) {
            contractions.push_back((pivot_high - pivot_low) / pivot_high * 100.0);
        }
    }
    return contractions;
}

double MinerviniStrategy::score_vcp(const StrategyContext& context, StrategyResult& result) const {
    if (static_cast<int>(context.bars.size()) < VCP_LOOKBACK) {
        return 0.0;
    }

    BarSeries window(context.bars.end() - VCP_LOOKBACK, context.bars.end());
    std::vector<double> contractions = measure_vcp_contractions(window, VCP_PIVOT_WINDOW);
    if (contractions.empty()) {
        return 0.0;
    }

    bool is_contracting = contractions.size() >= 2;
    for (size_t index = 0; is_contracting && index + 1 < contractions.size(); ++index) {
        is_contracting = contractions[index] > contractions[index + 1];
    }

    double score = 0.0;
    if (is_contracting) {
        score += 15.0;
        result.bullish_factors.push_back("VCP forming with " + std::to_string(contractions.size()) + " contracting waves");
        score += std::min(10.0, static_cast<double>(contractions.size()) * 3.0);
    } else if (mean(contractions) < 15.0) {
        score += 8.0;
        result.bullish_factors.push_back("Tight price action (potential VCP)");
    } else {
        score += 3.0;
    }

    return std::min(25.0, score);
}

double MinerviniStrategy::score_volume(const StrategyContext& context, StrategyResult& result) const {
    double score = 0.0;
    std::optional<double> volume_sma_20 = context.indicators.get(IndicatorNames::VOLUME_SMA_20);

    if (volume_sma_20 && *volume_sma_20 > 0.0) {
        double volume_ratio = context.bars.back().volume / *volume_sma_20;
        if (volume_ratio > 1.5) {
            score += 8.0;
            result.bullish_factors.push_back("High volume (" + format_fixed(volume_ratio, 1) + "x average)");
        } else if (volume_ratio > 1.0) {
            score += 5.0;
            result.bullish_factors.push_back("Above average volume");
        } else if (volume_ratio < 0.5) {
            score += 5.0;
            result.bullish_factors.push_back("Volume drying up (typical for VCP)");
        } else {
            score += 2.0;
        }
    }

    CandleVolumeSplit split = split_candle_volume(context.bars, 20);
    if (split.both_present()) {
        double up_volume = *split.average_up_volume;
        double down_volume = *split.average_down_volume;
        if (up_volume > down_volume * 1.3) {
            score += 7.0;
            result.bullish_factors.push_back("Higher volume on up days (accumulation)");
        } else if (down_volume > up_volume * 1.3) {
            score -= 5.0;
            result.bearish_factors.push_back("Higher volume on down days (distribution)");
        }
    }

    return clamp_score(score, 0.0, 20.0);
}

double MinerviniStrategy::score_relative_strength(const StrategyContext& context, StrategyResult& result) const {
    std::optional<double> relative_strength = context.indicators.get(IndicatorNames::RELATIVE_STRENGTH);

    // Without a benchmark, the 50-bar return stands in against a flat market
    if (!relative_strength && context.bars.size() >= 50) {
        double base_close = context.bars[context.bars.size() - 50].close_price;
        relative_strength = context.bars.back().close_price / base_close;
    }
    if (!relative_strength) {
        return 0.0;
    }

    double rs = *relative_strength;
    if (rs > 1.2) {
        result.bullish_factors.push_back("Strong relative strength (" + format_fixed(rs, 2) + "x)");
        return 15.0;
    }
    if (rs > 1.0) {
        result.bullish_factors.push_back("Positive relative strength (" + format_fixed(rs, 2) + "x)");
        return 10.0;
    }
    if (rs > 0.9) {
        return 5.0;
    }
    result.warnings.push_back("Weak relative strength (" + format_fixed(rs, 2) + "x)");
    return 0.0;
}

double MinerviniStrategy::score_market_alignment(const StrategyContext& context, StrategyResult& result) const {
    double score = 0.0;
    std::optional<double> adx = context.indicators.get(IndicatorNames::ADX_14);
    std::optional<double> plus_di = context.indicators.get(IndicatorNames::PLUS_DI);
    std::optional<double> minus_di = context.indicators.get(IndicatorNames::MINUS_DI);

    if (adx) {
        if (*adx > 25.0) {
            score += 5.0;
            if (plus_di && minus_di && *plus_di > *minus_di) {
                score += 5.0;
                result.bullish_factors.push_back("Strong trending market (ADX: " + format_fixed(*adx, 1) + ")");
            } else if (plus_di && minus_di && *plus_di < *minus_di) {
                score -= 3.0;
                result.warnings.push_back("Stock in downtrend");
            }
        } else {
            score += 2.0;
        }
    }

    std::optional<double> macd = context.indicators.get(IndicatorNames::MACD);
    std::optional<double> macd_signal = context.indicators.get(IndicatorNames::MACD_SIGNAL);
    if (macd && macd_signal) {
        if (*macd > *macd_signal && *macd > 0.0) {
            score += 5.0;
            result.bullish_factors.push_back("MACD bullish");
        } else if (*macd < *macd_signal && *macd < 0.0) {
            score -= 3.0;
            result.warnings.push_back("MACD bearish");
        }
    }

    return clamp_score(score, 0.0, 15.0);
}

} // namespace Core
} // namespace ChartAnalyzer

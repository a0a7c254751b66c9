#include "weinstein_strategy.hpp"
#include <algorithm>
#include <cmath>
#include "analyzer/technical_analysis/series_math.hpp"

namespace ChartAnalyzer {
namespace Core {

using namespace SeriesMath;
using ChartAnalyzer::Config::TrendConfig;

namespace {
    const size_t PRICE_ACTION_WINDOW = 30;
    const int WEEKLY_MA_PERIOD = 150;

    // Strict one-neighbour extremes
    std::vector<double> local_extremes(const Series& values, bool find_maxima) {
        std::vector<double> extremes;
        for (size_t index = 1; index + 1 < values.size(); ++index) {
            bool is_extreme = find_maxima
                ? values[index] > values[index - 1] && values[index] > values[index + 1]
                : values[index] < values[index - 1] && values[index] < values[index + 1];
            if (is_extreme) {
                extremes.push_back(values[index]);
            }
        }
        return extremes;
    }

    bool is_ascending(const std::vector<double>& values) {
        if (values.size() < 2) {
            return false;
        }
        for (size_t index = 1; index < values.size(); ++index) {
            if (values[index] <= values[index - 1]) {
                return false;
            }
        }
        return true;
    }

    bool is_descending(const std::vector<double>& values) {
        if (values.size() < 2) {
            return false;
        }
        for (size_t index = 1; index < values.size(); ++index) {
            if (values[index] >= values[index - 1]) {
                return false;
            }
        }
        return true;
    }
}

WeinsteinStrategy::WeinsteinStrategy(const TrendConfig& trend_config) : trend_analyzer(trend_config) {}

StrategyResult WeinsteinStrategy::analyze(const StrategyContext& context) const {
    if (static_cast<int>(context.bars.size()) < MINIMUM_BARS) {
        return insufficient_result("Need at least 150 bars for stage analysis");
    }

    StrategyResult result;
    StageAssessment stage = trend_analyzer.determine_weinstein_stage(context.bars);

    double stage_score = score_stage(stage, result);
    double ma_score = score_ma_relationship(context, result);
    double price_action_score = score_price_action(context, result);
    double volume_score = score_volume(context, result);

    result.sub_scores["stage"] = stage_score;
    result.sub_scores["ma_relationship"] = ma_score;
    result.sub_scores["price_action"] = price_action_score;
    result.sub_scores["volume"] = volume_score;
    result.score = stage_score + ma_score + price_action_score + volume_score;

    // An unclassified stage is already reported by score_stage
    if (stage.classified) {
        std::string stage_note = "Currently in " + stage.description;
        if (stage.stage == WeinsteinStage::STAGE_2) {
            result.bullish_factors.insert(result.bullish_factors.begin(), stage_note);
        } else if (stage.stage == WeinsteinStage::STAGE_4) {
            result.bearish_factors.insert(result.bearish_factors.begin(), stage_note);
        } else {
            result.warnings.push_back(stage_note);
        }
    }

    finalize_result(result);
    return result;
}

double WeinsteinStrategy::score_stage(const StageAssessment& stage, StrategyResult& result) const {
    if (!stage.classified) {
        result.warnings.push_back("Insufficient data for stage analysis - stage scored 0");
        return 0.0;
    }
    switch (stage.stage) {
        case WeinsteinStage::STAGE_2:
            result.bullish_factors.push_back("Stock in Stage 2 advancing phase");
            return 40.0;
        case WeinsteinStage::STAGE_1:
            result.warnings.push_back("Stock in Stage 1 basing - wait for breakout");
            return 25.0;
        case WeinsteinStage::STAGE_3:
            result.warnings.push_back("Stock in Stage 3 topping - caution advised");
            return 15.0;
        case WeinsteinStage::STAGE_4:
            result.bearish_factors.push_back("Stock in Stage 4 declining phase");
            return 0.0;
    }
    return 0.0;
}

double WeinsteinStrategy::score_ma_relationship(const StrategyContext& context, StrategyResult& result) const {
    double score = 0.0;
    Series close_values = closes(context.bars);
    double current_price = close_values.back();
    std::optional<double> sma_150 = context.indicators.get(IndicatorNames::SMA_150);

    if (sma_150) {
        if (current_price > *sma_150) {
            score += 10.0;
            result.bullish_factors.push_back("Price above 30-week MA");
        } else {
            result.bearish_factors.push_back("Price below 30-week MA");
        }
    }

    double ma_slope = percent_change_slope(rolling_mean(close_values, WEEKLY_MA_PERIOD), 20);
    if (ma_slope > 0.02) {
        score += 10.0;
        result.bullish_factors.push_back("30-week MA trending up strongly");
    } else if (ma_slope > 0.0) {
        score += 7.0;
        result.bullish_factors.push_back("30-week MA trending up");
    } else if (ma_slope < -0.02) {
        result.bearish_factors.push_back("30-week MA trending down strongly");
    } else {
        score += 3.0;
    }

    // Extended advances above the MA are late-stage
    if (sma_150 && current_price > *sma_150) {
        double distance_pct = (current_price - *sma_150) / *sma_150 * 100.0;
        if (distance_pct < 30.0) {
            score += 5.0;
        } else if (distance_pct > 50.0) {
            score -= 3.0;
        }
    }

    return clamp_score(score, 0.0, 25.0);
}

double WeinsteinStrategy::score_price_action(const StrategyContext& context, StrategyResult& result) const {
    double score = 0.0;
    Series high_values = highs(context.bars);
    Series low_values = lows(context.bars);

    std::vector<double> peaks = local_extremes(tail(high_values, PRICE_ACTION_WINDOW), true);
    std::vector<double> troughs = local_extremes(tail(low_values, PRICE_ACTION_WINDOW), false);

    if (is_ascending(peaks) && is_ascending(troughs)) {
        score += 10.0;
        result.bullish_factors.push_back("Making higher highs and higher lows");
    } else if (is_descending(troughs) && is_descending(peaks)) {
        result.bearish_factors.push_back("Making lower lows and lower highs");
    } else {
        score += 3.0;
    }

    double current_price = context.bars.back().close_price;
    if (current_price >= max_value(tail(high_values, 20)) * 0.98) {
        score += 5.0;
        result.bullish_factors.push_back("Near recent highs");
    }

    std::optional<double> sma_50 = context.indicators.get(IndicatorNames::SMA_50);
    if (sma_50) {
        double recent_low = min_value(tail(low_values, 10));
        if (std::abs(recent_low - *sma_50) / *sma_50 < 0.02) {
            score += 5.0;
            result.bullish_factors.push_back("Found support at 50-day MA");
        }
    }

    return std::min(20.0, score);
}

double WeinsteinStrategy::score_volume(const StrategyContext& context, StrategyResult& result) const {
    double score = 0.0;
    Series volume_values = volumes(context.bars);

    if (mean(tail(volume_values, 20)) > mean(tail(volume_values, 50))) {
        score += 7.0;
        result.bullish_factors.push_back("Volume trend increasing");
    } else {
        score += 2.0;
    }

    CandleVolumeSplit split = split_candle_volume(context.bars, 20);
    if (split.both_present()) {
        double up_volume = *split.average_up_volume;
        double down_volume = *split.average_down_volume;
        if (up_volume > down_volume * 1.2) {
            score += 8.0;
            result.bullish_factors.push_back("Higher volume on up days");
        } else if (down_volume > up_volume * 1.2) {
            result.bearish_factors.push_back("Higher volume on down days");
        } else {
            score += 4.0;
        }
    }

    return std::min(15.0, score);
}

} // namespace Core
} // namespace ChartAnalyzer

#include "trend_analyzer.hpp"
#include "series_math.hpp"
#include "utils/format_utils.hpp"
#include <algorithm>
#include <cmath>

namespace ChartAnalyzer {
namespace Core {

using namespace SeriesMath;
using ChartAnalyzer::Config::TrendConfig;

namespace {
    const int STAGE_STRUCTURE_LOOKBACK = 100;
    const int STAGE_STRUCTURE_MINIMUM = 20;

    StageAssessment make_stage(WeinsteinStage stage, const std::string& description) {
        StageAssessment assessment;
        assessment.stage = stage;
        assessment.description = description;
        return assessment;
    }
}

TrendAnalyzer::TrendAnalyzer(const TrendConfig& trend_config) : config(trend_config) {}

TrendAssessment TrendAnalyzer::analyze_trend(const BarSeries& bars) const {
    TrendAssessment assessment;
    if (bars.empty() || static_cast<int>(bars.size()) < config.minimum_bars) {
        assessment.notes = "Insufficient data";
        return assessment;
    }

    Series close_values = closes(bars);
    double current_price = close_values.back();
    Series sma_20 = rolling_mean(close_values, 20);
    Series sma_50 = rolling_mean(close_values, 50);

    double slope_20 = percent_change_slope(sma_20, 10);
    double slope_50 = percent_change_slope(sma_50, 20);
    double current_sma_20 = sma_20.back();
    double current_sma_50 = sma_50.back();

    double strength_score = 0.0;
    std::vector<std::string> notes;

    if (current_price > current_sma_20) {
        strength_score += 15.0;
        notes.push_back("Price above SMA20");
    } else {
        strength_score -= 10.0;
    }

    if (current_price > current_sma_50) {
        strength_score += 15.0;
        notes.push_back("Price above SMA50");
    } else {
        strength_score -= 15.0;
    }

    if (current_sma_20 > current_sma_50) {
        strength_score += 15.0;
        notes.push_back("Bullish MA alignment");
    } else {
        strength_score -= 10.0;
    }

    strength_score += slope_20 > 0.0 ? 10.0 : -10.0;
    strength_score += slope_50 > 0.0 ? 10.0 : -10.0;

    if (has_higher_highs_and_lows(bars)) {
        strength_score += 20.0;
        notes.push_back("Higher highs and higher lows");
    } else if (has_lower_lows_and_highs(bars)) {
        strength_score -= 20.0;
        notes.push_back("Lower highs and lower lows");
    }

    if (close_values.size() >= 200) {
        double current_sma_200 = mean(tail(close_values, 200));
        if (current_price > current_sma_200) {
            strength_score += 15.0;
            notes.push_back("Price above SMA200");
        } else {
            strength_score -= 10.0;
        }
    }

    assessment.strength = std::max(0.0, std::min(100.0, 50.0 + strength_score));
    if (assessment.strength >= 65.0) {
        assessment.trend = TrendType::BULLISH;
    } else if (assessment.strength <= 35.0) {
        assessment.trend = TrendType::BEARISH;
    } else {
        assessment.trend = TrendType::NEUTRAL;
    }
    assessment.notes = notes.empty() ? "Mixed signals" : FormatUtils::join(notes, "; ");
    return assessment;
}

StageAssessment TrendAnalyzer::determine_weinstein_stage(const BarSeries& bars) const {
    if (bars.empty() || static_cast<int>(bars.size()) < config.stage_minimum_bars) {
        StageAssessment unclassified = make_stage(WeinsteinStage::STAGE_1, "Insufficient data for stage analysis");
        unclassified.classified = false;
        return unclassified;
    }

    Series close_values = closes(bars);
    double current_price = close_values.back();
    Series weekly_ma = rolling_mean(close_values, config.stage_ma_period);
    double current_weekly_ma = weekly_ma.back();
    double ma_slope = percent_change_slope(weekly_ma, config.stage_ma_period);
    bool price_above_ma = current_price > current_weekly_ma;

    size_t lookback = std::min(static_cast<size_t>(STAGE_STRUCTURE_LOOKBACK), bars.size() - 1);
    Series recent_highs = tail(highs(bars), lookback);
    Series recent_lows = tail(lows(bars), lookback);
    int higher_highs = recent_highs.size() < static_cast<size_t>(STAGE_STRUCTURE_MINIMUM) ? 0 : count_higher_values(recent_highs);
    int lower_lows = recent_lows.size() < static_cast<size_t>(STAGE_STRUCTURE_MINIMUM) ? 0 : count_lower_values(recent_lows);

    double deadband = config.stage_slope_deadband;
    if (price_above_ma && ma_slope > deadband) {
        if (higher_highs > lower_lows) {
            return make_stage(WeinsteinStage::STAGE_2, "Stage 2: Advancing - BUY ZONE");
        }
        return make_stage(WeinsteinStage::STAGE_2, "Stage 2: Advancing (consolidating)");
    }

    if (!price_above_ma && ma_slope < -deadband) {
        if (lower_lows > higher_highs) {
            return make_stage(WeinsteinStage::STAGE_4, "Stage 4: Declining - AVOID/SHORT");
        }
        return make_stage(WeinsteinStage::STAGE_4, "Stage 4: Declining (potential bottom)");
    }

    if (std::abs(ma_slope) <= deadband) {
        // Compare where price sat against the average at the start of the window
        size_t prior_index = close_values.size() - lookback;
        double prior_ma = weekly_ma.size() > lookback ? weekly_ma[prior_index] : current_weekly_ma;
        double prior_price = close_values.size() > lookback ? close_values[prior_index] : current_price;

        if (prior_price < prior_ma && price_above_ma) {
            return make_stage(WeinsteinStage::STAGE_1, "Stage 1: Basing - Watch for breakout");
        }
        if (prior_price > prior_ma && !price_above_ma) {
            return make_stage(WeinsteinStage::STAGE_3, "Stage 3: Topping - Consider selling");
        }
        return make_stage(WeinsteinStage::STAGE_1, "Stage 1/3: Consolidating - Wait for direction");
    }

    return make_stage(WeinsteinStage::STAGE_1, "Transitional - Monitor for direction");
}

bool TrendAnalyzer::is_uptrend(const BarSeries& bars) const {
    return analyze_trend(bars).trend == TrendType::BULLISH;
}

bool TrendAnalyzer::is_downtrend(const BarSeries& bars) const {
    return analyze_trend(bars).trend == TrendType::BEARISH;
}

bool TrendAnalyzer::has_higher_highs_and_lows(const BarSeries& bars) const {
    size_t window = static_cast<size_t>(config.structure_window);
    if (bars.size() < window) {
        return false;
    }
    Series recent_highs = tail(highs(bars), window);
    Series recent_lows = tail(lows(bars), window);
    double required = static_cast<double>(window) * config.structure_ratio;
    return count_higher_values(recent_highs) > required && count_higher_values(recent_lows) > required;
}

bool TrendAnalyzer::has_lower_lows_and_highs(const BarSeries& bars) const {
    size_t window = static_cast<size_t>(config.structure_window);
    if (bars.size() < window) {
        return false;
    }
    Series recent_highs = tail(highs(bars), window);
    Series recent_lows = tail(lows(bars), window);
    double required = static_cast<double>(window) * config.structure_ratio;
    return count_lower_values(recent_highs) > required && count_lower_values(recent_lows) > required;
}

int count_higher_values(const std::vector<double>& values) {
    int count = 0;
    for (size_t index = 1; index < values.size(); ++index) {
        if (values[index] > values[index - 1]) {
            ++count;
        }
    }
    return count;
}

int count_lower_values(const std::vector<double>& values) {
    int count = 0;
    for (size_t index = 1; index < values.size(); ++index) {
        if (values[index] < values[index - 1]) {
            ++count;
        }
    }
    return count;
}

} // namespace Core
} // namespace ChartAnalyzer

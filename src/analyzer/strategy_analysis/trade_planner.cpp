#include "trade_planner.hpp"
#include <algorithm>
#include <cmath>
#include "utils/format_utils.hpp"

namespace ChartAnalyzer {
namespace Core {

using ChartAnalyzer::Config::TradePlanConfig;

namespace {
    const size_t STOP_SUPPORT_LEVELS = 3;
    const size_t BUY_REASONING_FACTORS = 4;
    const size_t AVOID_REASONING_FACTORS = 3;
}

TradePlanner::TradePlanner(const TradePlanConfig& trade_plan_config) : config(trade_plan_config) {}

std::optional<TradeSuggestion> TradePlanner::generate(const AnalysisResult& analysis, const CompositeResult& composite) const {
    switch (composite.signal) {
        case SignalType::BUY:
            return build_buy_plan(analysis, composite);
        case SignalType::AVOID:
            return build_avoid_plan(analysis, composite);
        case SignalType::HOLD:
        case SignalType::SELL:
            return std::nullopt;
    }
    return std::nullopt;
}

TradeSuggestion TradePlanner::build_avoid_plan(const AnalysisResult& analysis, const CompositeResult& composite) const {
    double current_price = analysis.current_price;
    TradeSuggestion plan;
    plan.symbol = analysis.symbol;
    plan.timestamp = analysis.timestamp;
    plan.action = SignalType::AVOID;
    plan.conviction = composite.conviction;

    plan.entry_price = current_price;
    plan.entry_zone = EntryZone(current_price * 0.99, current_price * 1.01);
    plan.entry_trigger = "Do not enter - wait for better setup";

    plan.stop_loss = current_price * 1.05;
    plan.stop_loss_type = StopLossType::PERCENTAGE;
    plan.stop_loss_pct = 5.0;
    plan.risk_per_share = current_price * 0.05;

    plan.target_1 = Target(current_price, 0.0, "N/A");
    plan.target_2 = Target(current_price, 0.0, "N/A");
    plan.target_3 = Target(current_price, 0.0, "N/A");

    plan.suggested_position_pct = 0.0;
    plan.max_position_pct = 0.0;
    plan.risk_reward_ratio = 0.0;
    plan.holding_period = HoldingPeriod::SWING;
    plan.strategy_source = "Composite Strategy";

    plan.reasoning.push_back("Current setup not favorable");
    for (size_t index = 0; index < composite.bearish_factors.size() && index < AVOID_REASONING_FACTORS; ++index) {
        plan.reasoning.push_back(composite.bearish_factors[index]);
    }
    plan.warnings = composite.warnings;
    return plan;
}

TradeSuggestion TradePlanner::build_buy_plan(const AnalysisResult& analysis, const CompositeResult& composite) const {
    double current_price = analysis.current_price;
    std::optional<double> atr_value = analysis.indicators.get(IndicatorNames::ATR_14);
    double atr = (atr_value && *atr_value > 0.0) ? *atr_value : current_price * config.fallback_atr_pct;

    double entry_price = current_price;
    const std::vector<Level>& support = analysis.support_levels;
    const std::vector<Level>& resistance = analysis.resistance_levels;

    double stop_loss = 0.0;
    if (!support.empty()) {
        size_t considered = std::min(STOP_SUPPORT_LEVELS, support.size());
        double highest_support = support.front().price;
        for (size_t index = 1; index < considered; ++index) {
            highest_support = std::max(highest_support, support[index].price);
        }
        stop_loss = highest_support - atr * config.support_stop_atr_buffer;
    } else {
        stop_loss = current_price - atr * config.no_support_stop_atr_multiple;
    }
    // Never tighter than the ATR floor
    stop_loss = std::min(stop_loss, current_price - atr * config.max_stop_atr_multiple);

    double risk_per_share = entry_price - stop_loss;
    double conservative_multiple = target_multiple(0, 1.5);
    double moderate_multiple = target_multiple(1, 2.5);
    double aggressive_multiple = target_multiple(2, 4.0);

    double target_1_price = entry_price + risk_per_share * conservative_multiple;
    double target_2_price = entry_price + risk_per_share * moderate_multiple;
    double target_3_price = entry_price + risk_per_share * aggressive_multiple;

    if (!resistance.empty()) {
        const Level* nearest_resistance = &resistance.front();
        for (const Level& level : resistance) {
            if (std::abs(level.price - entry_price) < std::abs(nearest_resistance->price - entry_price)) {
                nearest_resistance = &level;
            }
        }
        if (nearest_resistance->price > entry_price && nearest_resistance->price < target_2_price) {
            target_2_price = nearest_resistance->price * config.resistance_cap_factor;
        }
    }

    double position_pct = position_for(composite.conviction);

    TradeSuggestion plan;
    plan.symbol = analysis.symbol;
    plan.timestamp = analysis.timestamp;
    plan.action = composite.signal;
    plan.conviction = composite.conviction;

    plan.entry_price = entry_price;
    plan.entry_zone = EntryZone(current_price - atr * config.entry_zone_atr_multiple,
                                current_price + atr * config.entry_zone_atr_multiple);
    plan.entry_trigger = "Current price level";
    if (!analysis.detected_patterns.empty() && analysis.detected_patterns.front().breakout_level) {
        plan.entry_trigger = "Buy on breakout above " +
                             FormatUtils::format_fixed(*analysis.detected_patterns.front().breakout_level, 2);
    }

    plan.stop_loss = stop_loss;
    plan.stop_loss_type = support.empty() ? StopLossType::ATR : StopLossType::SUPPORT;
    plan.stop_loss_pct = risk_per_share / entry_price * 100.0;
    plan.risk_per_share = risk_per_share;

    plan.target_1 = Target(target_1_price, conservative_multiple, "Conservative target");
    plan.target_2 = Target(target_2_price, moderate_multiple, "Moderate target");
    plan.target_3 = Target(target_3_price, aggressive_multiple, "Aggressive target");

    plan.suggested_position_pct = position_pct;
    plan.max_position_pct = position_pct * config.max_position_factor;
    plan.risk_reward_ratio = 2.0;
    plan.holding_period = HoldingPeriod::SWING;
    plan.strategy_source = "Composite: Minervini + Weinstein + Lynch";

    if (!analysis.detected_patterns.empty()) {
        plan.reasoning.push_back("Pattern: " + analysis.detected_patterns.front().pattern_name);
    }
    for (size_t index = 0; index < composite.bullish_factors.size() && index < BUY_REASONING_FACTORS; ++index) {
        plan.reasoning.push_back(composite.bullish_factors[index]);
    }
    plan.warnings = composite.warnings;
    return plan;
}

double TradePlanner::position_for(ConvictionLevel conviction) const {
    switch (conviction) {
        case ConvictionLevel::HIGH:
            return config.high_conviction_position_pct;
        case ConvictionLevel::MEDIUM:
            return config.medium_conviction_position_pct;
        case ConvictionLevel::LOW:
            return config.low_conviction_position_pct;
    }
    return config.low_conviction_position_pct;
}

double TradePlanner::target_multiple(size_t index, double fallback) const {
    return index < config.target_risk_multiples.size() ? config.target_risk_multiples[index] : fallback;
}

} // namespace Core
} // namespace ChartAnalyzer

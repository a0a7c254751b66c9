#include "data_structures.hpp"
#include "utils/format_utils.hpp"
#include <stdexcept>

namespace ChartAnalyzer {
namespace Core {

using FormatUtils::to_upper;

std::string to_string(TrendType trend) {
    switch (trend) {
        case TrendType::BULLISH: return "BULLISH";
        case TrendType::BEARISH: return "BEARISH";
        case TrendType::NEUTRAL: return "NEUTRAL";
    }
    return "NEUTRAL";
}

std::string to_string(SignalType signal) {
    switch (signal) {
        case SignalType::BUY: return "BUY";
        case SignalType::SELL: return "SELL";
        case SignalType::HOLD: return "HOLD";
        case SignalType::AVOID: return "AVOID";
    }
    return "HOLD";
}

std::string to_string(ConvictionLevel conviction) {
    switch (conviction) {
        case ConvictionLevel::LOW: return "LOW";
        case ConvictionLevel::MEDIUM: return "MEDIUM";
        case ConvictionLevel::HIGH: return "HIGH";
    }
    return "LOW";
}

std::string to_string(LevelType level_type) {
    return level_type == LevelType::SUPPORT ? "support" : "resistance";
}

std::string to_string(PatternType pattern_type) {
    switch (pattern_type) {
        case PatternType::CUP_HANDLE: return "CUP_HANDLE";
        case PatternType::VCP: return "VCP";
        case PatternType::DOUBLE_TOP: return "DOUBLE_TOP";
        case PatternType::DOUBLE_BOTTOM: return "DOUBLE_BOTTOM";
        case PatternType::HEAD_SHOULDERS: return "HEAD_SHOULDERS";
        case PatternType::HEAD_SHOULDERS_INVERSE: return "HEAD_SHOULDERS_INVERSE";
        case PatternType::ASCENDING_TRIANGLE: return "ASCENDING_TRIANGLE";
        case PatternType::DESCENDING_TRIANGLE: return "DESCENDING_TRIANGLE";
        case PatternType::FLAG: return "FLAG";
        case PatternType::PENNANT: return "PENNANT";
        case PatternType::WEDGE_RISING: return "WEDGE_RISING";
        case PatternType::WEDGE_FALLING: return "WEDGE_FALLING";
        case PatternType::BASE_BREAKOUT: return "BASE_BREAKOUT";
        case PatternType::HIGH_TIGHT_FLAG: return "HIGH_TIGHT_FLAG";
        case PatternType::PULLBACK_MA: return "PULLBACK_MA";
    }
    return "UNKNOWN";
}

std::string to_string(StopLossType stop_loss_type) {
    switch (stop_loss_type) {
        case StopLossType::PERCENTAGE: return "PERCENTAGE";
        case StopLossType::ATR: return "ATR";
        case StopLossType::SUPPORT: return "SUPPORT";
        case StopLossType::SWING_LOW: return "SWING_LOW";
    }
    return "PERCENTAGE";
}

std::string to_string(HoldingPeriod holding_period) {
    switch (holding_period) {
        case HoldingPeriod::INTRADAY: return "INTRADAY";
        case HoldingPeriod::SWING: return "SWING";
        case HoldingPeriod::POSITIONAL: return "POSITIONAL";
    }
    return "SWING";
}

int to_int(WeinsteinStage stage) {
    return static_cast<int>(stage);
}

TrendType parse_trend_type(const std::string& value) {
    std::string normalized_value = to_upper(value);
    if (normalized_value == "BULLISH") return TrendType::BULLISH;
    if (normalized_value == "BEARISH") return TrendType::BEARISH;
    if (normalized_value == "NEUTRAL") return TrendType::NEUTRAL;
    throw std::runtime_error("Unknown trend type: " + value);
}

SignalType parse_signal_type(const std::string& value) {
    std::string normalized_value = to_upper(value);
    if (normalized_value == "BUY") return SignalType::BUY;
    if (normalized_value == "SELL") return SignalType::SELL;
    if (normalized_value == "HOLD") return SignalType::HOLD;
    if (normalized_value == "AVOID") return SignalType::AVOID;
    throw std::runtime_error("Unknown signal type: " + value);
}

ConvictionLevel parse_conviction_level(const std::string& value) {
    std::string normalized_value = to_upper(value);
    if (normalized_value == "LOW") return ConvictionLevel::LOW;
    if (normalized_value == "MEDIUM") return ConvictionLevel::MEDIUM;
    if (normalized_value == "HIGH") return ConvictionLevel::HIGH;
    throw std::runtime_error("Unknown conviction level: " + value);
}

WeinsteinStage parse_weinstein_stage(int value) {
    if (value < 1 || value > 4) {
        throw std::runtime_error("Weinstein stage must be between 1 and 4, got " + std::to_string(value));
    }
    return static_cast<WeinsteinStage>(value);
}

} // namespace Core
} // namespace ChartAnalyzer

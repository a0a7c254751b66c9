#include "strategy_common.hpp"
#include <algorithm>

namespace ChartAnalyzer {
namespace Core {

std::pair<SignalType, ConvictionLevel> signal_from_score(double score) {
    if (score >= 80.0) {
        return {SignalType::BUY, ConvictionLevel::HIGH};
    }
    if (score >= 65.0) {
        return {SignalType::BUY, ConvictionLevel::MEDIUM};
    }
    if (score >= 50.0) {
        return {SignalType::HOLD, ConvictionLevel::LOW};
    }
    if (score >= 35.0) {
        return {SignalType::AVOID, ConvictionLevel::MEDIUM};
    }
    return {SignalType::SELL, ConvictionLevel::HIGH};
}

StrategyResult insufficient_result(const std::string& warning) {
    StrategyResult result;
    result.score = 0.0;
    result.bearish_factors.push_back("Insufficient data");
    result.warnings.push_back(warning);
    result.signal = SignalType::AVOID;
    result.conviction = ConvictionLevel::LOW;
    return result;
}

void finalize_result(StrategyResult& result) {
    std::pair<SignalType, ConvictionLevel> signal_and_conviction = signal_from_score(result.score);
    result.signal = signal_and_conviction.first;
    result.conviction = signal_and_conviction.second;
}

double clamp_score(double score, double minimum, double maximum) {
    return std::max(minimum, std::min(maximum, score));
}

} // namespace Core
} // namespace ChartAnalyzer

#include "indicator_set.hpp"
#include <cmath>

namespace ChartAnalyzer {
namespace Core {

std::optional<double> IndicatorSet::get(const std::string& name) const {
    auto value_iterator = indicator_values.find(name);
    if (value_iterator == indicator_values.end()) {
        return std::nullopt;
    }
    return value_iterator->second;
}

bool IndicatorSet::has(const std::string& name) const {
    return indicator_values.find(name) != indicator_values.end();
}

void IndicatorSet::set(const std::string& name, double value) {
    if (!std::isfinite(value)) {
        indicator_values.erase(name);
        return;
    }
    indicator_values[name] = value;
}

void IndicatorSet::set(const std::string& name, const std::optional<double>& value) {
    if (!value) {
        indicator_values.erase(name);
        return;
    }
    set(name, *value);
}

const std::vector<std::string>& IndicatorSet::reported_names() {
    using namespace IndicatorNames;
    static const std::vector<std::string> names{
        SMA_10, SMA_20, SMA_50, SMA_150, SMA_200, EMA_8, EMA_21,
        MACD, MACD_SIGNAL, MACD_HISTOGRAM, RSI_14, STOCH_K, STOCH_D,
        BB_UPPER, BB_MIDDLE, BB_LOWER, BB_WIDTH, ATR_14, ADX_14, PLUS_DI, MINUS_DI,
        VOLUME_SMA_20, VOLUME_SMA_50, OBV, OBV_SMA, RELATIVE_STRENGTH
    };
    return names;
}

} // namespace Core
} // namespace ChartAnalyzer

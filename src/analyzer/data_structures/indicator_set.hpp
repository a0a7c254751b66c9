#ifndef INDICATOR_SET_HPP
#define INDICATOR_SET_HPP

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace ChartAnalyzer {
namespace Core {

namespace IndicatorNames {
constexpr const char* SMA_10 = "sma_10";
constexpr const char* SMA_20 = "sma_20";
constexpr const char* SMA_50 = "sma_50";
constexpr const char* SMA_150 = "sma_150";
constexpr const char* SMA_200 = "sma_200";
constexpr const char* EMA_8 = "ema_8";
constexpr const char* EMA_21 = "ema_21";
constexpr const char* MACD = "macd";
constexpr const char* MACD_SIGNAL = "macd_signal";
constexpr const char* MACD_HISTOGRAM = "macd_histogram";
constexpr const char* RSI_14 = "rsi_14";
constexpr const char* STOCH_K = "stoch_k";
constexpr const char* STOCH_D = "stoch_d";
constexpr const char* BB_UPPER = "bb_upper";
constexpr const char* BB_MIDDLE = "bb_middle";
constexpr const char* BB_LOWER = "bb_lower";
constexpr const char* BB_WIDTH = "bb_width";
constexpr const char* ATR_14 = "atr_14";
constexpr const char* ADX_14 = "adx_14";
constexpr const char* PLUS_DI = "plus_di";
constexpr const char* MINUS_DI = "minus_di";
constexpr const char* VOLUME_SMA_20 = "volume_sma_20";
constexpr const char* VOLUME_SMA_50 = "volume_sma_50";
constexpr const char* OBV = "obv";
constexpr const char* OBV_SMA = "obv_sma";
constexpr const char* RELATIVE_STRENGTH = "relative_strength";
} // namespace IndicatorNames

/**
 * Latest value per indicator name.
 * A name without a value means the lookback window was not satisfied; get() is the
 * only accessor strategies use, so absence is always explicit.
 */
class IndicatorSet {
public:
    std::optional<double> get(const std::string& name) const;
    bool has(const std::string& name) const;
    bool empty() const { return indicator_values.empty(); }
    std::size_t size() const { return indicator_values.size(); }

    // Non-finite values are dropped so they read back as absent
    void set(const std::string& name, double value);
    void set(const std::string& name, const std::optional<double>& value);

    const std::map<std::string, double>& values() const { return indicator_values; }

    // Canonical reporting order, including names that may be absent
    static const std::vector<std::string>& reported_names();

private:
    std::map<std::string, double> indicator_values;
};

} // namespace Core
} // namespace ChartAnalyzer

#endif // INDICATOR_SET_HPP

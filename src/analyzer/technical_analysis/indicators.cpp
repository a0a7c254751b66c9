#include "indicators.hpp"
#include "series_math.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <unordered_map>

namespace ChartAnalyzer {
namespace Core {

using namespace SeriesMath;
using ChartAnalyzer::Config::IndicatorConfig;

namespace {
    const double NOT_A_NUMBER = std::numeric_limits<double>::quiet_NaN();

    bool has_at_least(const BarSeries& bars, int required_bars) {
        return static_cast<int>(bars.size()) >= required_bars;
    }
}

IndicatorEngine::IndicatorEngine(const IndicatorConfig& indicator_config) : config(indicator_config) {}

IndicatorSet IndicatorEngine::calculate_all(const BarSeries& bars) const {
    IndicatorSet indicators;
    if (bars.empty() || !has_at_least(bars, config.minimum_bars)) {
        return indicators;
    }

    add_moving_averages(indicators, bars);
    add_macd(indicators, bars);
    add_rsi(indicators, bars);
    add_stochastic(indicators, bars);
    add_bollinger_bands(indicators, bars);
    add_atr(indicators, bars);
    add_adx(indicators, bars);
    add_volume_indicators(indicators, bars);
    return indicators;
}

IndicatorSet IndicatorEngine::calculate_all(const BarSeries& bars, const BarSeries& benchmark_bars) const {
    IndicatorSet indicators = calculate_all(bars);
    if (!indicators.empty()) {
        indicators.set(IndicatorNames::RELATIVE_STRENGTH, compute_relative_strength(bars, benchmark_bars));
    }
    return indicators;
}

void IndicatorEngine::add_moving_averages(IndicatorSet& indicators, const BarSeries& bars) const {
    Series close_values = closes(bars);
    for (int period : config.sma_periods) {
        if (has_at_least(bars, period)) {
            indicators.set("sma_" + std::to_string(period), last_value(rolling_mean(close_values, period)));
        }
    }
    for (int span : config.ema_periods) {
        if (has_at_least(bars, span)) {
            indicators.set("ema_" + std::to_string(span), last_value(ewm_mean(close_values, span)));
        }
    }
}

void IndicatorEngine::add_macd(IndicatorSet& indicators, const BarSeries& bars) const {
    Series close_values = closes(bars);
    Series fast_ema = ewm_mean(close_values, config.macd_fast);
    Series slow_ema = ewm_mean(close_values, config.macd_slow);

    Series macd_line(close_values.size());
    for (std::size_t index = 0; index < close_values.size(); ++index) {
        macd_line[index] = fast_ema[index] - slow_ema[index];
    }
    Series signal_line = ewm_mean(macd_line, config.macd_signal);

    indicators.set(IndicatorNames::MACD, macd_line.back());
    indicators.set(IndicatorNames::MACD_SIGNAL, signal_line.back());
    indicators.set(IndicatorNames::MACD_HISTOGRAM, macd_line.back() - signal_line.back());
}

void IndicatorEngine::add_rsi(IndicatorSet& indicators, const BarSeries& bars) const {
    if (!has_at_least(bars, config.rsi_period + 1)) {
        return;
    }
    Series price_changes = diff(closes(bars));
    Series gains(price_changes.size(), NOT_A_NUMBER);
    Series losses(price_changes.size(), NOT_A_NUMBER);
    for (std::size_t index = 1; index < price_changes.size(); ++index) {
        gains[index] = price_changes[index] > 0.0 ? price_changes[index] : 0.0;
        losses[index] = price_changes[index] < 0.0 ? -price_changes[index] : 0.0;
    }

    std::optional<double> average_gain = last_value(rolling_mean(gains, config.rsi_period));
    std::optional<double> average_loss = last_value(rolling_mean(losses, config.rsi_period));
    if (!average_gain || !average_loss) {
        return;
    }

    // A zero average loss is an infinite relative strength
    if (*average_loss == 0.0) {
        indicators.set(IndicatorNames::RSI_14, 100.0);
        return;
    }
    double relative_strength = *average_gain / *average_loss;
    indicators.set(IndicatorNames::RSI_14, 100.0 - 100.0 / (1.0 + relative_strength));
}

void IndicatorEngine::add_stochastic(IndicatorSet& indicators, const BarSeries& bars) const {
    if (!has_at_least(bars, config.stoch_k)) {
        return;
    }
    Series close_values = closes(bars);
    Series lowest_lows = rolling_min(lows(bars), config.stoch_k);
    Series highest_highs = rolling_max(highs(bars), config.stoch_k);

    Series raw_k(close_values.size(), NOT_A_NUMBER);
    for (std::size_t index = 0; index < close_values.size(); ++index) {
        if (std::isnan(lowest_lows[index]) || std::isnan(highest_highs[index])) {
            continue;
        }
        double price_range = highest_highs[index] - lowest_lows[index];
        // Zero range divides by infinity
        raw_k[index] = price_range == 0.0 ? 0.0 : 100.0 * (close_values[index] - lowest_lows[index]) / price_range;
    }
    Series smoothed_k = rolling_mean(raw_k, config.stoch_smooth);
    Series smoothed_d = rolling_mean(smoothed_k, config.stoch_d);

    indicators.set(IndicatorNames::STOCH_K, last_value(smoothed_k));
    indicators.set(IndicatorNames::STOCH_D, last_value(smoothed_d));
}

void IndicatorEngine::add_bollinger_bands(IndicatorSet& indicators, const BarSeries& bars) const {
    if (!has_at_least(bars, config.bb_period)) {
        return;
    }
    Series close_values = closes(bars);
    std::optional<double> middle_band = last_value(rolling_mean(close_values, config.bb_period));
    std::optional<double> band_deviation = last_value(rolling_std(close_values, config.bb_period));
    if (!middle_band || !band_deviation) {
        return;
    }
    double upper_band = *middle_band + config.bb_std * *band_deviation;
    double lower_band = *middle_band - config.bb_std * *band_deviation;

    indicators.set(IndicatorNames::BB_UPPER, upper_band);
    indicators.set(IndicatorNames::BB_MIDDLE, *middle_band);
    indicators.set(IndicatorNames::BB_LOWER, lower_band);
    if (*middle_band != 0.0) {
        indicators.set(IndicatorNames::BB_WIDTH, (upper_band - lower_band) / *middle_band * 100.0);
    }
}

void IndicatorEngine::add_atr(IndicatorSet& indicators, const BarSeries& bars) const {
    if (!has_at_least(bars, config.atr_period + 1)) {
        return;
    }
    indicators.set(IndicatorNames::ATR_14, last_value(rolling_mean(compute_true_range(bars), config.atr_period)));
}

void IndicatorEngine::add_adx(IndicatorSet& indicators, const BarSeries& bars) const {
    int period = config.adx_period;
    if (!has_at_least(bars, period * 2)) {
        return;
    }
    Series high_changes = diff(highs(bars));
    Series low_changes = diff(lows(bars));
    Series plus_movement(high_changes.size(), NOT_A_NUMBER);
    Series minus_movement(low_changes.size(), NOT_A_NUMBER);
    for (std::size_t index = 1; index < high_changes.size(); ++index) {
        plus_movement[index] = std::max(high_changes[index], 0.0);
        minus_movement[index] = std::max(-low_changes[index], 0.0);
    }

    Series average_true_range = rolling_mean(compute_true_range(bars), period);
    Series plus_movement_average = rolling_mean(plus_movement, period);
    Series minus_movement_average = rolling_mean(minus_movement, period);

    Series plus_indicator(bars.size(), NOT_A_NUMBER);
    Series minus_indicator(bars.size(), NOT_A_NUMBER);
    Series directional_index(bars.size(), NOT_A_NUMBER);
    for (std::size_t index = 0; index < bars.size(); ++index) {
        if (std::isnan(average_true_range[index]) || average_true_range[index] == 0.0 ||
            std::isnan(plus_movement_average[index]) || std::isnan(minus_movement_average[index])) {
            continue;
        }
        plus_indicator[index] = 100.0 * plus_movement_average[index] / average_true_range[index];
        minus_indicator[index] = 100.0 * minus_movement_average[index] / average_true_range[index];
        double indicator_sum = plus_indicator[index] + minus_indicator[index];
        // Zero denominator divides by infinity
        directional_index[index] = indicator_sum == 0.0
            ? 0.0
            : 100.0 * std::abs(plus_indicator[index] - minus_indicator[index]) / indicator_sum;
    }
    Series average_directional_index = rolling_mean(directional_index, period);

    indicators.set(IndicatorNames::ADX_14, last_value(average_directional_index));
    indicators.set(IndicatorNames::PLUS_DI, last_value(plus_indicator));
    indicators.set(IndicatorNames::MINUS_DI, last_value(minus_indicator));
}

void IndicatorEngine::add_volume_indicators(IndicatorSet& indicators, const BarSeries& bars) const {
    Series volume_values = volumes(bars);
    for (int period : config.volume_sma_periods) {
        if (has_at_least(bars, period)) {
            indicators.set("volume_sma_" + std::to_string(period), last_value(rolling_mean(volume_values, period)));
        }
    }

    // On-balance volume, sign(0) = 0
    Series on_balance_volume(bars.size(), 0.0);
    for (std::size_t index = 1; index < bars.size(); ++index) {
        double close_change = bars[index].close_price - bars[index - 1].close_price;
        double direction = close_change > 0.0 ? 1.0 : (close_change < 0.0 ? -1.0 : 0.0);
        on_balance_volume[index] = on_balance_volume[index - 1] + bars[index].volume * direction;
    }
    indicators.set(IndicatorNames::OBV, on_balance_volume.back());
    if (has_at_least(bars, config.obv_sma_period)) {
        indicators.set(IndicatorNames::OBV_SMA, last_value(rolling_mean(on_balance_volume, config.obv_sma_period)));
    }
}

std::vector<double> compute_true_range(const BarSeries& bars) {
    std::vector<double> true_range_values(bars.size(), NOT_A_NUMBER);
    for (std::size_t index = 0; index < bars.size(); ++index) {
        double bar_range = bars[index].high_price - bars[index].low_price;
        if (index == 0) {
            true_range_values[index] = bar_range;
            continue;
        }
        double previous_close = bars[index - 1].close_price;
        true_range_values[index] = std::max({bar_range,
                                             std::abs(bars[index].high_price - previous_close),
                                             std::abs(bars[index].low_price - previous_close)});
    }
    return true_range_values;
}

std::optional<double> compute_relative_strength(const BarSeries& bars, const BarSeries& benchmark_bars) {
    if (bars.empty() || benchmark_bars.empty()) {
        return std::nullopt;
    }
    std::unordered_map<long long, double> benchmark_closes;
    for (const Bar& benchmark_bar : benchmark_bars) {
        benchmark_closes[benchmark_bar.epoch_seconds] = benchmark_bar.close_price;
    }

    Series aligned_stock;
    Series aligned_benchmark;
    for (const Bar& bar : bars) {
        auto benchmark_iterator = benchmark_closes.find(bar.epoch_seconds);
        if (benchmark_iterator == benchmark_closes.end()) {
            continue;
        }
        aligned_stock.push_back(bar.close_price);
        aligned_benchmark.push_back(benchmark_iterator->second);
    }
    if (aligned_stock.size() < 2) {
        return std::nullopt;
    }

    double stock_change = aligned_stock.back() / aligned_stock.front();
    double benchmark_change = aligned_benchmark.back() / aligned_benchmark.front();
    if (benchmark_change == 0.0 || !std::isfinite(benchmark_change)) {
        return std::nullopt;
    }
    return stock_change / benchmark_change;
}

} // namespace Core
} // namespace ChartAnalyzer

#ifndef TEST_HELPERS_HPP
#define TEST_HELPERS_HPP

#include <cmath>
#include <ctime>
#include <string>
#include <vector>
#include "analyzer/data_structures/data_structures.hpp"

namespace TestBars {

using ChartAnalyzer::Core::Bar;
using ChartAnalyzer::Core::BarSeries;

constexpr long long FIRST_DAY_EPOCH = 1672531200;   // 2023-01-01T00:00:00Z
constexpr long long SECONDS_PER_DAY = 86400;

inline std::string day_timestamp(int day_index) {
    std::time_t epoch_seconds = static_cast<std::time_t>(FIRST_DAY_EPOCH + day_index * SECONDS_PER_DAY);
    std::tm calendar_time{};
    gmtime_r(&epoch_seconds, &calendar_time);
    char buffer[16];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%d", &calendar_time);
    return std::string(buffer);
}

inline Bar make_bar(int day_index, double open, double high, double low, double close, double volume) {
    Bar bar;
    bar.open_price = open;
    bar.high_price = high;
    bar.low_price = low;
    bar.close_price = close;
    bar.volume = volume;
    bar.timestamp = day_timestamp(day_index);
    bar.epoch_seconds = FIRST_DAY_EPOCH + day_index * SECONDS_PER_DAY;
    return bar;
}

// Close compounds by growth per bar, open is the previous close, range is +/-0.5% of close
inline BarSeries compounding_series(int count, double growth, double start_price = 100.0, double volume = 1e6) {
    BarSeries bars;
    double previous_close = start_price;
    for (int index = 0; index < count; ++index) {
        double close = start_price * std::pow(growth, index);
        bars.push_back(make_bar(index, previous_close, close * 1.005, close * 0.995, close, volume));
        previous_close = close;
    }
    return bars;
}

inline BarSeries smooth_uptrend(int count = 250) {
    return compounding_series(count, 1.002);
}

inline BarSeries smooth_downtrend(int count = 250) {
    return compounding_series(count, 0.998);
}

// Smooth uptrend with a wide-range bar every 12 bars whose range shrinks over time
inline BarSeries contracting_uptrend(int count = 250) {
    BarSeries bars = smooth_uptrend(count);
    for (int index = 6; index < count; index += 12) {
        double width = 0.06 - 0.0002 * index;
        Bar& bar = bars[static_cast<size_t>(index)];
        bar.high_price = bar.close_price * (1.005 + width);
        bar.low_price = bar.close_price * (0.995 - width);
    }
    return bars;
}

inline BarSeries flat_series(int count, double price = 100.0, double volume = 1e6) {
    BarSeries bars;
    for (int index = 0; index < count; ++index) {
        bars.push_back(make_bar(index, price, price, price, price, volume));
    }
    return bars;
}

// Bars around a close path with a fixed half range
inline BarSeries from_closes(const std::vector<double>& closes, double half_range, double volume = 1e6) {
    BarSeries bars;
    for (size_t index = 0; index < closes.size(); ++index) {
        double close = closes[index];
        bars.push_back(make_bar(static_cast<int>(index), close, close + half_range, close - half_range, close, volume));
    }
    return bars;
}

} // namespace TestBars

#endif // TEST_HELPERS_HPP

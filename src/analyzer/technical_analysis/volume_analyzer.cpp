#include "volume_analyzer.hpp"
#include "series_math.hpp"
#include "utils/format_utils.hpp"
#include <cmath>

namespace ChartAnalyzer {
namespace Core {

using namespace SeriesMath;
using ChartAnalyzer::Config::VolumeConfig;

CandleVolumeSplit split_candle_volume(const BarSeries& bars, std::size_t lookback) {
    CandleVolumeSplit split;
    double up_total = 0.0;
    double down_total = 0.0;
    int up_days = 0;
    int down_days = 0;

    std::size_t start_index = bars.size() > lookback ? bars.size() - lookback : 0;
    for (std::size_t index = start_index; index < bars.size(); ++index) {
        const Bar& bar = bars[index];
        if (bar.close_price > bar.open_price) {
            up_total += bar.volume;
            ++up_days;
        } else if (bar.close_price < bar.open_price) {
            down_total += bar.volume;
            ++down_days;
        }
    }

    if (up_days > 0) {
        split.average_up_volume = up_total / up_days;
    }
    if (down_days > 0) {
        split.average_down_volume = down_total / down_days;
    }
    return split;
}

VolumeAnalyzer::VolumeAnalyzer(const VolumeConfig& volume_config) : config(volume_config) {}

int VolumeAnalyzer::short_period() const {
    return config.sma_periods.empty() ? 20 : config.sma_periods.front();
}

int VolumeAnalyzer::long_period() const {
    return config.sma_periods.size() < 2 ? 50 : config.sma_periods[1];
}

VolumeAnalysis VolumeAnalyzer::analyze_volume(const BarSeries& bars) const {
    VolumeAnalysis analysis;
    if (bars.empty()) {
        return analysis;
    }

    Series volume_values = volumes(bars);
    analysis.current_volume = volume_values.back();

    if (static_cast<int>(volume_values.size()) >= short_period()) {
        analysis.avg_volume_20 = mean(tail(volume_values, static_cast<size_t>(short_period())));
    }
    if (static_cast<int>(volume_values.size()) >= long_period()) {
        analysis.avg_volume_50 = mean(tail(volume_values, static_cast<size_t>(long_period())));
    }
    if (analysis.avg_volume_20 && *analysis.avg_volume_20 > 0.0) {
        analysis.volume_ratio = analysis.current_volume / *analysis.avg_volume_20;
    }

    analysis.volume_trend = classify_volume_trend(bars);
    analysis.on_breakout = detect_breakout_volume(bars);
    detect_accumulation_distribution(bars, analysis);
    analysis.volume_confirmation = check_volume_confirmation(bars);
    analysis.notes = generate_notes(analysis);
    return analysis;
}

std::string VolumeAnalyzer::classify_volume_trend(const BarSeries& bars) const {
    if (static_cast<int>(bars.size()) < long_period()) {
        return "neutral";
    }

    Series volume_values = volumes(bars);
    double short_average = mean(tail(volume_values, static_cast<size_t>(short_period())));
    double long_average = mean(tail(volume_values, static_cast<size_t>(long_period())));

    if (short_average > long_average * 1.2) {
        return "increasing";
    }
    if (short_average < long_average * 0.8) {
        return "decreasing";
    }
    return "stable";
}

bool VolumeAnalyzer::detect_breakout_volume(const BarSeries& bars) const {
    if (static_cast<int>(bars.size()) < short_period()) {
        return false;
    }

    double average_volume = mean(tail(volumes(bars), static_cast<size_t>(short_period())));
    double current_close = bars.back().close_price;
    double previous_close = bars.size() > 1 ? bars[bars.size() - 2].close_price : current_close;
    double price_change_pct = std::abs((current_close - previous_close) / previous_close) * 100.0;

    return bars.back().volume > average_volume * config.spike_threshold && price_change_pct > 1.0;
}

void VolumeAnalyzer::detect_accumulation_distribution(const BarSeries& bars, VolumeAnalysis& analysis) const {
    if (static_cast<int>(bars.size()) < short_period()) {
        return;
    }

    CandleVolumeSplit split = split_candle_volume(bars, static_cast<size_t>(short_period()));
    if (!split.both_present()) {
        return;
    }

    double average_up_volume = *split.average_up_volume;
    double average_down_volume = *split.average_down_volume;
    analysis.accumulation_detected = average_up_volume > average_down_volume * config.accumulation_threshold;
    analysis.distribution_detected = average_down_volume > average_up_volume * config.accumulation_threshold;
}

bool VolumeAnalyzer::check_volume_confirmation(const BarSeries& bars) const {
    const size_t confirmation_window = 10;
    if (bars.size() < confirmation_window) {
        return false;
    }

    // Only an advancing window can be confirmed
    const Bar& first_bar = bars[bars.size() - confirmation_window];
    if (!(bars.back().close_price > first_bar.close_price)) {
        return false;
    }

    CandleVolumeSplit split = split_candle_volume(bars, confirmation_window);
    return split.both_present() && *split.average_up_volume > *split.average_down_volume;
}

std::vector<std::string> VolumeAnalyzer::generate_notes(const VolumeAnalysis& analysis) const {
    std::vector<std::string> notes;

    if (analysis.volume_ratio && *analysis.volume_ratio > 1.5) {
        notes.push_back("Volume " + FormatUtils::format_fixed(*analysis.volume_ratio, 1) + "x above average");
    }
    if (analysis.on_breakout) {
        notes.push_back("Breakout volume detected");
    }
    if (analysis.accumulation_detected) {
        notes.push_back("Accumulation pattern: high volume on up days");
    }
    if (analysis.distribution_detected) {
        notes.push_back("Distribution pattern: high volume on down days");
    }
    if (analysis.volume_trend == "increasing") {
        notes.push_back("Volume trend increasing");
    } else if (analysis.volume_trend == "decreasing") {
        notes.push_back("Volume trend decreasing");
    }
    return notes;
}

bool VolumeAnalyzer::is_volume_drying_up(const BarSeries& bars, int lookback) const {
    if (lookback <= 0 || static_cast<int>(bars.size()) < lookback) {
        return false;
    }

    Series volume_values = volumes(bars);
    Series recent_volume = tail(volume_values, static_cast<size_t>(lookback));
    if (static_cast<int>(volume_values.size()) < long_period()) {
        return false;
    }

    double long_average = mean(tail(volume_values, static_cast<size_t>(long_period())));
    bool is_decreasing = recent_volume.back() < recent_volume.front();
    bool is_below_average = mean(recent_volume) < long_average * 0.7;
    return is_decreasing && is_below_average;
}

std::optional<VolumeClimax> VolumeAnalyzer::get_volume_climax(const BarSeries& bars) const {
    if (static_cast<int>(bars.size()) < short_period()) {
        return std::nullopt;
    }

    VolumeClimax climax;
    double average_volume = mean(tail(volumes(bars), static_cast<size_t>(short_period())));
    double current_volume = bars.back().volume;

    if (current_volume > average_volume * config.climax_multiplier) {
        double previous_close = bars[bars.size() - 2].close_price;
        climax.detected = true;
        climax.volume_ratio = current_volume / average_volume;
        climax.price_change_pct = (bars.back().close_price - previous_close) / previous_close * 100.0;
        climax.climax_type = climax.price_change_pct > 0.0 ? "buying_climax" : "selling_climax";
    }
    return climax;
}

} // namespace Core
} // namespace ChartAnalyzer

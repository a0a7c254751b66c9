#include "pattern_detector.hpp"
#include "pivot_detection.hpp"
#include "series_math.hpp"
#include "utils/format_utils.hpp"
#include <algorithm>
#include <cmath>

namespace ChartAnalyzer {
namespace Core {

using namespace SeriesMath;
using ChartAnalyzer::Config::PatternConfig;
using FormatUtils::format_fixed;

namespace {
    BarSeries tail_bars(const BarSeries& bars, size_t count) {
        if (bars.size() <= count) {
            return bars;
        }
        return BarSeries(bars.end() - static_cast<long>(count), bars.end());
    }

    int bar_count(const BarSeries& bars) {
        return static_cast<int>(bars.size());
    }

    PatternMatch make_match(PatternType pattern_type, const std::string& pattern_name, bool bullish,
                            double completion_pct, double breakout_level, double target_price,
                            double stop_loss, double confidence, const std::string& description) {
        PatternMatch match;
        match.pattern_type = pattern_type;
        match.pattern_name = pattern_name;
        match.bullish = bullish;
        match.completion_pct = completion_pct;
        match.breakout_level = breakout_level;
        match.target_price = target_price;
        match.stop_loss = stop_loss;
        match.confidence = confidence;
        match.description = description;
        return match;
    }
}

PatternDetector::PatternDetector(const PatternConfig& pattern_config) : config(pattern_config) {}

std::vector<PatternMatch> PatternDetector::detect_patterns(const BarSeries& bars) const {
    std::vector<PatternMatch> matches;
    if (bars.empty() || bar_count(bars) < config.minimum_bars) {
        return matches;
    }

    detect_cup_handle(bars, matches);
    detect_vcp(bars, matches);
    detect_double_top_bottom(bars, matches);
    detect_head_shoulders(bars, matches);
    detect_triangles(bars, matches);
    detect_flags(bars, matches);
    detect_wedges(bars, matches);
    detect_base_breakout(bars, matches);
    detect_high_tight_flag(bars, matches);
    detect_ma_pullback(bars, matches);

    std::stable_sort(matches.begin(), matches.end(), [](const PatternMatch& left, const PatternMatch& right) {
        return left.confidence > right.confidence;
    });
    return matches;
}

void PatternDetector::detect_cup_handle(const BarSeries& bars, std::vector<PatternMatch>& matches) const {
    if (bar_count(bars) < 60) {
        return;
    }

    BarSeries window = tail_bars(bars, 100);
    Series high_values = highs(window);
    Series low_values = lows(window);
    Series close_values = closes(window);

    double left_high = max_value(slice(high_values, 0, high_values.size() / 2));
    double bottom = min_value(low_values);
    double right_high = max_value(tail(high_values, 20));

    double cup_depth = (left_high - bottom) / left_high;
    if (!(cup_depth > config.cup_depth_min && cup_depth < config.cup_depth_max)) {
        return;
    }

    Series handle_area = tail(close_values, 10);
    double handle_high = max_value(handle_area);
    double handle_low = min_value(handle_area);
    double handle_depth = (handle_high - handle_low) / handle_high;

    if (handle_depth < 0.15 && handle_low > bottom) {
        double breakout_level = std::max(left_high, right_high);
        matches.push_back(make_match(
            PatternType::CUP_HANDLE, "Cup and Handle", true,
            std::min(100.0, 90.0 + (right_high / left_high) * 10.0),
            breakout_level, breakout_level * 1.2, handle_low * 0.98, 0.75,
            "Cup depth " + format_fixed(cup_depth * 100.0, 1) + "%, handle depth " +
                format_fixed(handle_depth * 100.0, 1) + "%"));
    }
}

void PatternDetector::detect_vcp(const BarSeries& bars, std::vector<PatternMatch>& matches) const {
    if (bar_count(bars) < 80) {
        return;
    }

    BarSeries window = tail_bars(bars, 150);
    std::vector<SwingPoint> pivots = find_swing_points(window, config.pivot_window);
    if (pivots.size() < 3) {
        return;
    }

    // Consecutive pivots are paired regardless of kind: high of one, low of the next
    std::vector<double> contractions;
    for (size_t pivot_index = 0; pivot_index + 1 < pivots.size(); ++pivot_index) {
        double pivot_high = pivots[pivot_index].high_price;
        double pivot_low = pivots[pivot_index + 1].low_price;
        contractions.push_back((pivot_high - pivot_low) / pivot_high);
    }

    if (contractions.size() < 2) {
        return;
    }
    for (size_t contraction_index = 0; contraction_index + 1 < contractions.size(); ++contraction_index) {
        if (!(contractions[contraction_index] > contractions[contraction_index + 1])) {
            return;
        }
    }

    Series volume_values = volumes(window);
    double recent_high = max_value(tail(highs(window), 20));
    double recent_volume = mean(tail(volume_values, 10));
    double earlier_volume = mean(slice(volume_values, volume_values.size() - 50, volume_values.size() - 10));
    bool volume_drying = recent_volume < earlier_volume * 0.8;

    matches.push_back(make_match(
        PatternType::VCP, "Volatility Contraction Pattern", true,
        volume_drying ? 80.0 : 60.0,
        recent_high, recent_high * 1.15, pivots.back().low_price * 0.97,
        volume_drying ? 0.7 : 0.55,
        std::to_string(contractions.size()) + " contractions, " +
            (volume_drying ? "volume drying" : "volume not confirmed")));
}

void PatternDetector::detect_double_top_bottom(const BarSeries& bars, std::vector<PatternMatch>& matches) const {
    if (bar_count(bars) < 40) {
        return;
    }

    BarSeries window = tail_bars(bars, 80);
    Series high_values = highs(window);
    Series low_values = lows(window);
    double current_price = window.back().close_price;

    std::vector<int> peaks = find_peaks(high_values, config.pivot_window);
    std::vector<int> troughs = find_troughs(low_values, config.pivot_window);

    if (peaks.size() >= 2) {
        double first_peak = high_values[peaks[peaks.size() - 2]];
        double second_peak = high_values[peaks.back()];
        double neckline = min_value(slice(low_values, peaks.back(), low_values.size()));

        if (std::abs(first_peak - second_peak) / first_peak < config.double_top_tolerance) {
            matches.push_back(make_match(
                PatternType::DOUBLE_TOP, "Double Top", false,
                current_price < (first_peak + neckline) / 2.0 ? 70.0 : 50.0,
                neckline, neckline - (first_peak - neckline), second_peak * 1.02, 0.65,
                "Two peaks at " + format_fixed(first_peak, 2) + " and " + format_fixed(second_peak, 2)));
        }
    }

    if (troughs.size() >= 2) {
        double first_trough = low_values[troughs[troughs.size() - 2]];
        double second_trough = low_values[troughs.back()];
        double neckline = max_value(slice(high_values, troughs.back(), high_values.size()));

        if (std::abs(first_trough - second_trough) / first_trough < config.double_top_tolerance) {
            matches.push_back(make_match(
                PatternType::DOUBLE_BOTTOM, "Double Bottom", true,
                current_price > (first_trough + neckline) / 2.0 ? 70.0 : 50.0,
                neckline, neckline + (neckline - first_trough), second_trough * 0.98, 0.65,
                "Two troughs at " + format_fixed(first_trough, 2) + " and " + format_fixed(second_trough, 2)));
        }
    }
}

void PatternDetector::detect_head_shoulders(const BarSeries& bars, std::vector<PatternMatch>& matches) const {
    if (bar_count(bars) < 60) {
        return;
    }

    BarSeries window = tail_bars(bars, 100);
    Series high_values = highs(window);
    Series low_values = lows(window);

    std::vector<int> peaks = find_peaks(high_values, 10);
    if (peaks.size() >= 3) {
        int left_index = peaks[peaks.size() - 3];
        int right_index = peaks.back();
        double left_shoulder = high_values[left_index];
        double head = high_values[peaks[peaks.size() - 2]];
        double right_shoulder = high_values[right_index];

        if (head > left_shoulder && head > right_shoulder &&
            std::abs(left_shoulder - right_shoulder) / left_shoulder < 0.05) {
            double neckline = min_value(slice(low_values, left_index, right_index));
            matches.push_back(make_match(
                PatternType::HEAD_SHOULDERS, "Head and Shoulders", false, 75.0,
                neckline, neckline - (head - neckline), head * 1.02, 0.70,
                "Head at " + format_fixed(head, 2) + ", shoulders at " + format_fixed(left_shoulder, 2) +
                    "/" + format_fixed(right_shoulder, 2)));
        }
    }

    std::vector<int> troughs = find_troughs(low_values, 10);
    if (troughs.size() >= 3) {
        int left_index = troughs[troughs.size() - 3];
        int right_index = troughs.back();
        double left_shoulder = low_values[left_index];
        double head = low_values[troughs[troughs.size() - 2]];
        double right_shoulder = low_values[right_index];

        if (head < left_shoulder && head < right_shoulder &&
            std::abs(left_shoulder - right_shoulder) / left_shoulder < 0.05) {
            double neckline = max_value(slice(high_values, left_index, right_index));
            matches.push_back(make_match(
                PatternType::HEAD_SHOULDERS_INVERSE, "Inverse Head and Shoulders", true, 75.0,
                neckline, neckline + (neckline - head), head * 0.98, 0.70,
                "Head at " + format_fixed(head, 2) + ", shoulders at " + format_fixed(left_shoulder, 2) +
                    "/" + format_fixed(right_shoulder, 2)));
        }
    }
}

void PatternDetector::detect_triangles(const BarSeries& bars, std::vector<PatternMatch>& matches) const {
    if (bar_count(bars) < 30) {
        return;
    }

    BarSeries window = tail_bars(bars, 50);
    Series high_values = highs(window);
    Series low_values = lows(window);
    double high_slope = linear_slope(high_values);
    double low_slope = linear_slope(low_values);
    double current_price = window.back().close_price;

    if (std::abs(high_slope) < 0.1 && low_slope > 0.2) {
        double resistance = max_value(high_values);
        matches.push_back(make_match(
            PatternType::ASCENDING_TRIANGLE, "Ascending Triangle", true,
            current_price > resistance * 0.98 ? 80.0 : 60.0,
            resistance, resistance * 1.1, low_values.back() * 0.97, 0.70,
            "Flat resistance with rising support"));
    }

    if (high_slope < -0.2 && std::abs(low_slope) < 0.1) {
        double support = min_value(low_values);
        matches.push_back(make_match(
            PatternType::DESCENDING_TRIANGLE, "Descending Triangle", false,
            current_price < support * 1.02 ? 80.0 : 60.0,
            support, support * 0.9, high_values.back() * 1.03, 0.70,
            "Falling resistance with flat support"));
    }
}

void PatternDetector::detect_flags(const BarSeries& bars, std::vector<PatternMatch>& matches) const {
    if (bar_count(bars) < 30) {
        return;
    }

    BarSeries window = tail_bars(bars, 40);
    Series close_values = closes(window);
    Series high_values = highs(window);
    Series low_values = lows(window);

    double first_move = (close_values[10] - close_values[0]) / close_values[0] * 100.0;
    Series consolidation = slice(close_values, 10, close_values.size());
    double consolidation_mean = mean(consolidation);
    double range_pct = (max_value(consolidation) - min_value(consolidation)) / consolidation_mean * 100.0;

    // Only the bullish continuation is reported
    if (std::abs(first_move) > 10.0 && range_pct < 8.0 && first_move > 0.0) {
        double current_price = close_values.back();
        bool closes_below_mean = consolidation.back() < consolidation_mean;
        matches.push_back(make_match(
            closes_below_mean ? PatternType::FLAG : PatternType::PENNANT,
            closes_below_mean ? "Bull Flag" : "Bull Pennant", true, 75.0,
            max_value(slice(high_values, 10, high_values.size())),
            current_price * 1.15, min_value(tail(low_values, 10)) * 0.98, 0.65,
            "Sharp " + format_fixed(first_move, 1) + "% move with tight consolidation"));
    }
}

void PatternDetector::detect_wedges(const BarSeries& bars, std::vector<PatternMatch>& matches) const {
    if (bar_count(bars) < 30) {
        return;
    }

    BarSeries window = tail_bars(bars, 40);
    Series high_values = highs(window);
    Series low_values = lows(window);
    double high_slope = linear_slope(high_values);
    double low_slope = linear_slope(low_values);
    double current_price = window.back().close_price;

    if (high_slope > 0.0 && low_slope > 0.0 && low_slope > high_slope * 1.5) {
        matches.push_back(make_match(
            PatternType::WEDGE_RISING, "Rising Wedge", false, 70.0,
            min_value(tail(low_values, 5)), current_price * 0.9, high_values.back() * 1.02, 0.60,
            "Converging upward lines - typically bearish"));
    }

    if (high_slope < 0.0 && low_slope < 0.0 && high_slope < low_slope * 1.5) {
        matches.push_back(make_match(
            PatternType::WEDGE_FALLING, "Falling Wedge", true, 70.0,
            max_value(tail(high_values, 5)), current_price * 1.15, low_values.back() * 0.98, 0.60,
            "Converging downward lines - typically bullish"));
    }
}

void PatternDetector::detect_base_breakout(const BarSeries& bars, std::vector<PatternMatch>& matches) const {
    if (bar_count(bars) < 50) {
        return;
    }

    BarSeries window = tail_bars(bars, 80);
    Series high_values = highs(window);
    Series low_values = lows(window);
    Series volume_values = volumes(window);
    size_t base_end = window.size() - 10;

    double base_high = max_value(slice(high_values, 0, base_end));
    double base_low = min_value(slice(low_values, 0, base_end));
    double base_range = (base_high - base_low) / base_high * 100.0;
    double current_price = window.back().close_price;

    if (base_range < 15.0 && current_price > base_high * 1.01) {
        double base_volume = mean(slice(volume_values, 0, base_end));
        double recent_volume = mean(tail(volume_values, 5));
        bool volume_confirmed = recent_volume > base_volume * 1.3;

        matches.push_back(make_match(
            PatternType::BASE_BREAKOUT, "Base Breakout", true, 85.0,
            base_high, base_high + (base_high - base_low), base_low * 0.98,
            volume_confirmed ? 0.75 : 0.60,
            "Breaking out of " + format_fixed(base_range, 1) + "% base range"));
    }
}

void PatternDetector::detect_high_tight_flag(const BarSeries& bars, std::vector<PatternMatch>& matches) const {
    if (bar_count(bars) < 40) {
        return;
    }

    BarSeries window = tail_bars(bars, 60);
    Series high_values = highs(window);
    Series low_values = lows(window);

    double start_price = window.front().close_price;
    double peak_price = max_value(slice(high_values, 0, 30));
    double current_price = window.back().close_price;
    double price_gain = (peak_price - start_price) / start_price * 100.0;

    if (price_gain <= 100.0) {
        return;
    }

    double recent_high = max_value(tail(high_values, 15));
    double recent_low = min_value(tail(low_values, 15));
    double consolidation_depth = (recent_high - recent_low) / recent_high * 100.0;

    if (consolidation_depth < 10.0 && current_price > peak_price * 0.9) {
        matches.push_back(make_match(
            PatternType::HIGH_TIGHT_FLAG, "High Tight Flag", true, 80.0,
            recent_high, recent_high * 1.2, recent_low * 0.97, 0.75,
            "100%+ gain with " + format_fixed(consolidation_depth, 1) + "% consolidation"));
    }
}

void PatternDetector::detect_ma_pullback(const BarSeries& bars, std::vector<PatternMatch>& matches) const {
    if (bar_count(bars) < 100) {
        return;
    }

    Series close_values = closes(bars);
    Series sma_20 = rolling_mean(close_values, 20);
    Series sma_50 = rolling_mean(close_values, 50);
    size_t last_index = close_values.size() - 1;

    double current_price = close_values.back();
    double ma_20 = sma_20[last_index];
    double ma_50 = sma_50[last_index];

    if (std::abs(current_price - ma_20) / ma_20 < 0.02 && sma_20[last_index] > sma_20[last_index - 19]) {
        matches.push_back(make_match(
            PatternType::PULLBACK_MA, "Pullback to 20 MA", true, 85.0,
            current_price * 1.02, current_price * 1.1, ma_20 * 0.97, 0.65,
            "Pullback to rising 20 MA in uptrend"));
    }

    if (std::abs(current_price - ma_50) / ma_50 < 0.02 && sma_50[last_index] > sma_50[last_index - 29]) {
        matches.push_back(make_match(
            PatternType::PULLBACK_MA, "Pullback to 50 MA", true, 85.0,
            current_price * 1.02, current_price * 1.1, ma_50 * 0.96, 0.65,
            "Pullback to rising 50 MA in uptrend"));
    }
}

} // namespace Core
} // namespace ChartAnalyzer

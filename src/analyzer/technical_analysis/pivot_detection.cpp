#include "pivot_detection.hpp"

namespace ChartAnalyzer {
namespace Core {

namespace {
    bool is_local_maximum(const SeriesMath::Series& values, int index, int window) {
        for (int offset = 1; offset <= window; ++offset) {
            if (!(values[index] >= values[index - offset]) || !(values[index] >= values[index + offset])) {
                return false;
            }
        }
        return true;
    }

    bool is_local_minimum(const SeriesMath::Series& values, int index, int window) {
        for (int offset = 1; offset <= window; ++offset) {
            if (!(values[index] <= values[index - offset]) || !(values[index] <= values[index + offset])) {
                return false;
            }
        }
        return true;
    }
}

std::vector<SwingPoint> find_swing_points(const BarSeries& bars, int window) {
    std::vector<SwingPoint> swing_points;
    SeriesMath::Series high_values = SeriesMath::highs(bars);
    SeriesMath::Series low_values = SeriesMath::lows(bars);
    int bar_count = static_cast<int>(bars.size());

    for (int index = window; index < bar_count - window; ++index) {
        if (is_local_maximum(high_values, index, window)) {
            swing_points.emplace_back(true, index, high_values[index], low_values[index]);
        }
        if (is_local_minimum(low_values, index, window)) {
            swing_points.emplace_back(false, index, high_values[index], low_values[index]);
        }
    }
    return swing_points;
}

std::vector<int> find_peaks(const SeriesMath::Series& values, int window) {
    std::vector<int> peak_indices;
    int value_count = static_cast<int>(values.size());
    for (int index = window; index < value_count - window; ++index) {
        if (is_local_maximum(values, index, window)) {
            peak_indices.push_back(index);
        }
    }
    return peak_indices;
}

std::vector<int> find_troughs(const SeriesMath::Series& values, int window) {
    std::vector<int> trough_indices;
    int value_count = static_cast<int>(values.size());
    for (int index = window; index < value_count - window; ++index) {
        if (is_local_minimum(values, index, window)) {
            trough_indices.push_back(index);
        }
    }
    return trough_indices;
}

} // namespace Core
} // namespace ChartAnalyzer

#ifndef PIVOT_DETECTION_HPP
#define PIVOT_DETECTION_HPP

#include <vector>
#include "analyzer/data_structures/data_structures.hpp"
#include "series_math.hpp"

namespace ChartAnalyzer {
namespace Core {

struct SwingPoint {
    bool is_high;
    int index;
    double high_price;
    double low_price;

    SwingPoint() : is_high(false), index(0), high_price(0.0), low_price(0.0) {}
    SwingPoint(bool high_pivot, int bar_index, double bar_high, double bar_low)
        : is_high(high_pivot), index(bar_index), high_price(bar_high), low_price(bar_low) {}

    // High price for a swing high, low price for a swing low
    double value() const { return is_high ? high_price : low_price; }
};

/**
 * Swing highs and lows over a symmetric window, ties inclusive.
 * Bars within `window` of either end never qualify. A bar can be both a swing
 * high and a swing low; the high is listed first.
 */
std::vector<SwingPoint> find_swing_points(const BarSeries& bars, int window);

std::vector<int> find_peaks(const SeriesMath::Series& values, int window);
std::vector<int> find_troughs(const SeriesMath::Series& values, int window);

} // namespace Core
} // namespace ChartAnalyzer

#endif // PIVOT_DETECTION_HPP

#ifndef SERIES_MATH_HPP
#define SERIES_MATH_HPP

#include <cstddef>
#include <optional>
#include <vector>
#include "analyzer/data_structures/data_structures.hpp"

namespace ChartAnalyzer {
namespace Core {
namespace SeriesMath {

// Series are aligned with the bar sequence; NaN marks a position without a value.
using Series = std::vector<double>;

Series opens(const BarSeries& bars);
Series highs(const BarSeries& bars);
Series lows(const BarSeries& bars);
Series closes(const BarSeries& bars);
Series volumes(const BarSeries& bars);

// Rolling statistics produce NaN until a full window of non-NaN values exists
Series rolling_mean(const Series& values, int window);
Series rolling_std(const Series& values, int window);    // Sample deviation (n - 1)
Series rolling_min(const Series& values, int window);
Series rolling_max(const Series& values, int window);

// Recursive EMA seeded with the first value, alpha = 2 / (span + 1)
Series ewm_mean(const Series& values, int span);
Series diff(const Series& values);

std::optional<double> last_value(const Series& values);
Series tail(const Series& values, std::size_t count);
Series slice(const Series& values, std::size_t begin, std::size_t end);
Series drop_nan(const Series& values);

double mean(const Series& values);
double max_value(const Series& values);
double min_value(const Series& values);
double population_std(const Series& values);

// Least-squares slope of values against 0..n-1
double linear_slope(const Series& values);

// (end - start) / start over the trailing lookback, NaN dropped; 0 when undefined
double percent_change_slope(const Series& values, int lookback);

} // namespace SeriesMath
} // namespace Core
} // namespace ChartAnalyzer

#endif // SERIES_MATH_HPP

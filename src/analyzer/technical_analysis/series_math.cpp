#include "series_math.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

namespace ChartAnalyzer {
namespace Core {
namespace SeriesMath {

namespace {
    const double NOT_A_NUMBER = std::numeric_limits<double>::quiet_NaN();

    bool window_is_complete(const Series& values, std::size_t end_index, int window) {
        for (std::size_t offset = 0; offset < static_cast<std::size_t>(window); ++offset) {
            if (std::isnan(values[end_index - offset])) {
                return false;
            }
        }
        return true;
    }

    template <typename Reducer>
    Series rolling_apply(const Series& values, int window, Reducer reducer) {
        Series result(values.size(), NOT_A_NUMBER);
        if (window <= 0) {
            return result;
        }
        for (std::size_t index = static_cast<std::size_t>(window) - 1; index < values.size(); ++index) {
            if (!window_is_complete(values, index, window)) {
                continue;
            }
            result[index] = reducer(values.begin() + static_cast<long>(index + 1 - window),
                                    values.begin() + static_cast<long>(index + 1));
        }
        return result;
    }
}

Series opens(const BarSeries& bars) {
    Series result;
    result.reserve(bars.size());
    for (const Bar& bar : bars) result.push_back(bar.open_price);
    return result;
}

Series highs(const BarSeries& bars) {
    Series result;
    result.reserve(bars.size());
    for (const Bar& bar : bars) result.push_back(bar.high_price);
    return result;
}

Series lows(const BarSeries& bars) {
    Series result;
    result.reserve(bars.size());
    for (const Bar& bar : bars) result.push_back(bar.low_price);
    return result;
}

Series closes(const BarSeries& bars) {
    Series result;
    result.reserve(bars.size());
    for (const Bar& bar : bars) result.push_back(bar.close_price);
    return result;
}

Series volumes(const BarSeries& bars) {
    Series result;
    result.reserve(bars.size());
    for (const Bar& bar : bars) result.push_back(bar.volume);
    return result;
}

Series rolling_mean(const Series& values, int window) {
    return rolling_apply(values, window, [window](Series::const_iterator first, Series::const_iterator last) {
        double window_sum = 0.0;
        for (auto value_iterator = first; value_iterator != last; ++value_iterator) {
            window_sum += *value_iterator;
        }
        return window_sum / window;
    });
}

Series rolling_std(const Series& values, int window) {
    if (window < 2) {
        return Series(values.size(), NOT_A_NUMBER);
    }
    return rolling_apply(values, window, [window](Series::const_iterator first, Series::const_iterator last) {
        double window_sum = 0.0;
        for (auto value_iterator = first; value_iterator != last; ++value_iterator) {
            window_sum += *value_iterator;
        }
        double window_mean = window_sum / window;
        double squared_deviation_sum = 0.0;
        for (auto value_iterator = first; value_iterator != last; ++value_iterator) {
            double deviation = *value_iterator - window_mean;
            squared_deviation_sum += deviation * deviation;
        }
        return std::sqrt(squared_deviation_sum / (window - 1));
    });
}

Series rolling_min(const Series& values, int window) {
    return rolling_apply(values, window, [](Series::const_iterator first, Series::const_iterator last) {
        return *std::min_element(first, last);
    });
}

Series rolling_max(const Series& values, int window) {
    return rolling_apply(values, window, [](Series::const_iterator first, Series::const_iterator last) {
        return *std::max_element(first, last);
    });
}

Series ewm_mean(const Series& values, int span) {
    Series result(values.size(), NOT_A_NUMBER);
    if (values.empty() || span <= 0) {
        return result;
    }
    double alpha = 2.0 / (span + 1.0);
    double running_value = values.front();
    result[0] = running_value;
    for (std::size_t index = 1; index < values.size(); ++index) {
        running_value = alpha * values[index] + (1.0 - alpha) * running_value;
        result[index] = running_value;
    }
    return result;
}

Series diff(const Series& values) {
    Series result(values.size(), NOT_A_NUMBER);
    for (std::size_t index = 1; index < values.size(); ++index) {
        result[index] = values[index] - values[index - 1];
    }
    return result;
}

std::optional<double> last_value(const Series& values) {
    if (values.empty() || !std::isfinite(values.back())) {
        return std::nullopt;
    }
    return values.back();
}

Series tail(const Series& values, std::size_t count) {
    if (count >= values.size()) {
        return values;
    }
    return Series(values.end() - static_cast<long>(count), values.end());
}

Series slice(const Series& values, std::size_t begin, std::size_t end) {
    end = std::min(end, values.size());
    if (begin >= end) {
        return Series();
    }
    return Series(values.begin() + static_cast<long>(begin), values.begin() + static_cast<long>(end));
}

Series drop_nan(const Series& values) {
    Series result;
    result.reserve(values.size());
    for (double value : values) {
        if (!std::isnan(value)) result.push_back(value);
    }
    return result;
}

double mean(const Series& values) {
    if (values.empty()) {
        return NOT_A_NUMBER;
    }
    double value_sum = 0.0;
    for (double value : values) value_sum += value;
    return value_sum / static_cast<double>(values.size());
}

double max_value(const Series& values) {
    if (values.empty()) {
        return NOT_A_NUMBER;
    }
    return *std::max_element(values.begin(), values.end());
}

double min_value(const Series& values) {
    if (values.empty()) {
        return NOT_A_NUMBER;
    }
    return *std::min_element(values.begin(), values.end());
}

double population_std(const Series& values) {
    if (values.empty()) {
        return 0.0;
    }
    double values_mean = mean(values);
    double squared_deviation_sum = 0.0;
    for (double value : values) {
        squared_deviation_sum += (value - values_mean) * (value - values_mean);
    }
    return std::sqrt(squared_deviation_sum / static_cast<double>(values.size()));
}

double linear_slope(const Series& values) {
    std::size_t count = values.size();
    if (count < 2) {
        return 0.0;
    }
    double x_mean = (static_cast<double>(count) - 1.0) / 2.0;
    double y_mean = mean(values);
    double covariance_sum = 0.0;
    double x_variance_sum = 0.0;
    for (std::size_t index = 0; index < count; ++index) {
        double x_deviation = static_cast<double>(index) - x_mean;
        covariance_sum += x_deviation * (values[index] - y_mean);
        x_variance_sum += x_deviation * x_deviation;
    }
    return covariance_sum / x_variance_sum;
}

double percent_change_slope(const Series& values, int lookback) {
    if (lookback <= 0 || values.size() < static_cast<std::size_t>(lookback)) {
        return 0.0;
    }
    Series recent_values = drop_nan(tail(values, static_cast<std::size_t>(lookback)));
    if (recent_values.size() < 2) {
        return 0.0;
    }
    double start_value = recent_values.front();
    double end_value = recent_values.back();
    if (start_value == 0.0) {
        return 0.0;
    }
    return (end_value - start_value) / start_value;
}

} // namespace SeriesMath
} // namespace Core
} // namespace ChartAnalyzer

#include "support_resistance.hpp"
#include "series_math.hpp"
#include <algorithm>
#include <cmath>
#include <initializer_list>

namespace ChartAnalyzer {
namespace Core {

using namespace SeriesMath;
using ChartAnalyzer::Config::SupportResistanceConfig;

namespace {
    void sort_by_strength_then_distance(std::vector<Level>& levels, double current_price) {
        std::stable_sort(levels.begin(), levels.end(), [current_price](const Level& left, const Level& right) {
            if (left.strength != right.strength) {
                return left.strength > right.strength;
            }
            return std::abs(current_price - left.price) < std::abs(current_price - right.price);
        });
    }

    std::vector<Level> nearest(std::vector<Level> levels, double current_price, size_t count) {
        std::stable_sort(levels.begin(), levels.end(), [current_price](const Level& left, const Level& right) {
            return std::abs(current_price - left.price) < std::abs(current_price - right.price);
        });
        if (levels.size() > count) {
            levels.resize(count);
        }
        return levels;
    }

    LevelType classify(double price, double current_price) {
        return price < current_price ? LevelType::SUPPORT : LevelType::RESISTANCE;
    }
}

SupportResistanceDetector::SupportResistanceDetector(const SupportResistanceConfig& sr_config) : config(sr_config) {}

LevelSet SupportResistanceDetector::detect_levels(const BarSeries& bars) const {
    LevelSet level_set;
    if (bars.empty() || static_cast<int>(bars.size()) < config.pivot_lookback * 2) {
        return level_set;
    }

    size_t lookback = std::min(static_cast<size_t>(config.lookback_period), bars.size());
    BarSeries window(bars.end() - static_cast<long>(lookback), bars.end());
    double current_price = bars.back().close_price;

    std::vector<Level> candidates = detect_pivot_levels(window);
    std::vector<Level> volume_levels = detect_volume_levels(window);
    std::vector<Level> ma_levels = detect_ma_levels(bars);
    std::vector<Level> psychological_levels = detect_psychological_levels(bars);
    candidates.insert(candidates.end(), volume_levels.begin(), volume_levels.end());
    candidates.insert(candidates.end(), ma_levels.begin(), ma_levels.end());
    candidates.insert(candidates.end(), psychological_levels.begin(), psychological_levels.end());

    for (const Level& level : cluster_levels(candidates, current_price)) {
        if (level.price < current_price && level.level_type == LevelType::SUPPORT) {
            level_set.support.push_back(level);
        } else if (level.price > current_price && level.level_type == LevelType::RESISTANCE) {
            level_set.resistance.push_back(level);
        }
    }

    sort_by_strength_then_distance(level_set.support, current_price);
    sort_by_strength_then_distance(level_set.resistance, current_price);

    size_t max_levels = static_cast<size_t>(config.max_levels);
    if (level_set.support.size() > max_levels) {
        level_set.support.resize(max_levels);
    }
    if (level_set.resistance.size() > max_levels) {
        level_set.resistance.resize(max_levels);
    }
    return level_set;
}

std::vector<Level> SupportResistanceDetector::detect_pivot_levels(const BarSeries& window) const {
    std::vector<Level> levels;
    Series high_values = highs(window);
    Series low_values = lows(window);
    int bar_total = static_cast<int>(window.size());

    for (int index = config.pivot_lookback; index < bar_total - config.pivot_lookback; ++index) {
        double window_high = max_value(slice(high_values, index - config.pivot_lookback, index + config.pivot_lookback + 1));
        if (high_values[index] == window_high) {
            levels.emplace_back(high_values[index], 3, 1, LevelType::RESISTANCE, "Pivot high resistance");
        }
        double window_low = min_value(slice(low_values, index - config.pivot_lookback, index + config.pivot_lookback + 1));
        if (low_values[index] == window_low) {
            levels.emplace_back(low_values[index], 3, 1, LevelType::SUPPORT, "Pivot low support");
        }
    }
    return levels;
}

std::vector<Level> SupportResistanceDetector::detect_volume_levels(const BarSeries& window) const {
    std::vector<Level> levels;
    double volume_threshold = mean(volumes(window)) * config.volume_threshold;

    for (const Bar& bar : window) {
        if (!(bar.volume > volume_threshold)) {
            continue;
        }
        if (bar.close_price > bar.open_price) {
            levels.emplace_back(bar.high_price, 4, 1, LevelType::RESISTANCE, "High volume resistance");
        } else {
            levels.emplace_back(bar.low_price, 4, 1, LevelType::SUPPORT, "High volume support");
        }
    }
    return levels;
}

std::vector<Level> SupportResistanceDetector::detect_ma_levels(const BarSeries& bars) const {
    std::vector<Level> levels;
    Series close_values = closes(bars);
    double current_price = bars.back().close_price;

    for (int period : config.ma_periods) {
        if (static_cast<int>(close_values.size()) < period) {
            continue;
        }
        double ma_value = mean(tail(close_values, static_cast<size_t>(period)));
        levels.emplace_back(ma_value, 2, period, classify(ma_value, current_price),
                            "SMA " + std::to_string(period) + " dynamic support/resistance");
    }
    return levels;
}

std::vector<Level> SupportResistanceDetector::detect_psychological_levels(const BarSeries& bars) const {
    std::vector<Level> levels;
    double current_price = bars.back().close_price;

    for (int increment : config.psychological_increments) {
        double lower = std::floor(current_price / increment) * increment;
        double upper = lower + increment;
        for (double level_price : {lower, upper}) {
            if (0.9 * current_price <= level_price && level_price <= 1.1 * current_price) {
                levels.emplace_back(level_price, 2, 0, classify(level_price, current_price),
                                    "Psychological level (" + std::to_string(increment) + ")");
            }
        }
    }
    return levels;
}

std::vector<Level> SupportResistanceDetector::cluster_levels(std::vector<Level> levels, double current_price) const {
    std::vector<Level> clustered;
    if (levels.empty()) {
        return clustered;
    }

    std::stable_sort(levels.begin(), levels.end(), [](const Level& left, const Level& right) {
        return left.price < right.price;
    });
    double tolerance = current_price * (config.tolerance_pct / 100.0);

    // The anchor is the first level of the cluster, never a running centroid
    std::vector<Level> current_cluster{levels.front()};
    for (size_t level_index = 1; level_index < levels.size(); ++level_index) {
        const Level& level = levels[level_index];
        if (std::abs(level.price - current_cluster.front().price) <= tolerance) {
            current_cluster.push_back(level);
        } else {
            clustered.push_back(merge_cluster(current_cluster, current_price));
            current_cluster.assign(1, level);
        }
    }
    clustered.push_back(merge_cluster(current_cluster, current_price));
    return clustered;
}

Level SupportResistanceDetector::merge_cluster(const std::vector<Level>& cluster, double current_price) const {
    if (cluster.size() == 1) {
        return cluster.front();
    }

    int total_strength = 0;
    int total_touches = 0;
    double weighted_price_sum = 0.0;
    for (const Level& level : cluster) {
        total_strength += level.strength;
        total_touches += level.touches;
        weighted_price_sum += level.price * level.strength;
    }

    double weighted_price = weighted_price_sum / total_strength;
    int cluster_size = static_cast<int>(cluster.size());
    int aggregate_strength = std::min(5, total_strength / cluster_size + 1);
    LevelType level_type = classify(weighted_price, current_price);

    return Level(weighted_price, aggregate_strength, total_touches, level_type,
                 "Clustered " + to_string(level_type) + " (" + std::to_string(cluster_size) + " touches)");
}

LevelSet SupportResistanceDetector::get_nearest_levels(const std::vector<Level>& support, const std::vector<Level>& resistance,
                                                       double current_price, size_t count) {
    LevelSet level_set;
    level_set.support = nearest(support, current_price, count);
    level_set.resistance = nearest(resistance, current_price, count);
    return level_set;
}

} // namespace Core
} // namespace ChartAnalyzer

#ifndef SUPPORT_RESISTANCE_HPP
#define SUPPORT_RESISTANCE_HPP

#include <vector>
#include "configs/analysis_config.hpp"
#include "analyzer/data_structures/data_structures.hpp"

namespace ChartAnalyzer {
namespace Core {

struct LevelSet {
    std::vector<Level> support;
    std::vector<Level> resistance;
};

/**
 * Support and resistance detector.
 * Candidate levels come from pivots, volume spikes, moving averages and round numbers.
 * Candidates within the tolerance band of a cluster anchor are merged into one level.
 */
class SupportResistanceDetector {
public:
    explicit SupportResistanceDetector(const ChartAnalyzer::Config::SupportResistanceConfig& sr_config);

    // Support below and resistance above the last close, strongest and nearest first
    LevelSet detect_levels(const BarSeries& bars) const;

    // Anchor-based clustering over price-sorted levels; each cluster becomes one level
    std::vector<Level> cluster_levels(std::vector<Level> levels, double current_price) const;

    static LevelSet get_nearest_levels(const std::vector<Level>& support, const std::vector<Level>& resistance,
                                       double current_price, size_t count = 3);

private:
    const ChartAnalyzer::Config::SupportResistanceConfig config;

    std::vector<Level> detect_pivot_levels(const BarSeries& window) const;
    std::vector<Level> detect_volume_levels(const BarSeries& window) const;
    std::vector<Level> detect_ma_levels(const BarSeries& bars) const;
    std::vector<Level> detect_psychological_levels(const BarSeries& bars) const;
    Level merge_cluster(const std::vector<Level>& cluster, double current_price) const;
};

} // namespace Core
} // namespace ChartAnalyzer

#endif // SUPPORT_RESISTANCE_HPP

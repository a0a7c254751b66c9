#ifndef VOLUME_ANALYZER_HPP
#define VOLUME_ANALYZER_HPP

#include <optional>
#include "configs/analysis_config.hpp"
#include "analyzer/data_structures/data_structures.hpp"

namespace ChartAnalyzer {
namespace Core {

struct CandleVolumeSplit {
    std::optional<double> average_up_volume;     // Mean volume where close > open
    std::optional<double> average_down_volume;   // Mean volume where close < open

    bool both_present() const { return average_up_volume.has_value() && average_down_volume.has_value(); }
};

// Up and down candle volume over the trailing lookback; doji candles count as neither
CandleVolumeSplit split_candle_volume(const BarSeries& bars, std::size_t lookback);

/**
 * Volume analyzer.
 * Relates the latest volume to its short and long averages and looks for breakout volume,
 * accumulation or distribution, and trend confirmation.
 */
class VolumeAnalyzer {
public:
    explicit VolumeAnalyzer(const ChartAnalyzer::Config::VolumeConfig& volume_config);

    VolumeAnalysis analyze_volume(const BarSeries& bars) const;

    // Volume contracting and below 70% of its long average
    bool is_volume_drying_up(const BarSeries& bars, int lookback = 10) const;

    // Absent below the short average window
    std::optional<VolumeClimax> get_volume_climax(const BarSeries& bars) const;

private:
    const ChartAnalyzer::Config::VolumeConfig config;

    int short_period() const;
    int long_period() const;

    std::string classify_volume_trend(const BarSeries& bars) const;
    bool detect_breakout_volume(const BarSeries& bars) const;
    void detect_accumulation_distribution(const BarSeries& bars, VolumeAnalysis& analysis) const;
    bool check_volume_confirmation(const BarSeries& bars) const;
    std::vector<std::string> generate_notes(const VolumeAnalysis& analysis) const;
};

} // namespace Core
} // namespace ChartAnalyzer

#endif // VOLUME_ANALYZER_HPP

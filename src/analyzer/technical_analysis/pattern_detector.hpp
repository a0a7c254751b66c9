#ifndef PATTERN_DETECTOR_HPP
#define PATTERN_DETECTOR_HPP

#include <vector>
#include "configs/analysis_config.hpp"
#include "analyzer/data_structures/data_structures.hpp"

namespace ChartAnalyzer {
namespace Core {

/**
 * Chart pattern detector.
 * Each archetype runs on its own trailing window and may fire independently of the others.
 * Matches are returned by descending confidence; equal confidences keep detection order.
 */
class PatternDetector {
public:
    explicit PatternDetector(const ChartAnalyzer::Config::PatternConfig& pattern_config);

    std::vector<PatternMatch> detect_patterns(const BarSeries& bars) const;

private:
    const ChartAnalyzer::Config::PatternConfig config;

    void detect_cup_handle(const BarSeries& bars, std::vector<PatternMatch>& matches) const;
    void detect_vcp(const BarSeries& bars, std::vector<PatternMatch>& matches) const;
    void detect_double_top_bottom(const BarSeries& bars, std::vector<PatternMatch>& matches) const;
    void detect_head_shoulders(const BarSeries& bars, std::vector<PatternMatch>& matches) const;
    void detect_triangles(const BarSeries& bars, std::vector<PatternMatch>& matches) const;
    void detect_flags(const BarSeries& bars, std::vector<PatternMatch>& matches) const;
    void detect_wedges(const BarSeries& bars, std::vector<PatternMatch>& matches) const;
    void detect_base_breakout(const BarSeries& bars, std::vector<PatternMatch>& matches) const;
    void detect_high_tight_flag(const BarSeries& bars, std::vector<PatternMatch>& matches) const;
    void detect_ma_pullback(const BarSeries& bars, std::vector<PatternMatch>& matches) const;
};

} // namespace Core
} // namespace ChartAnalyzer

#endif // PATTERN_DETECTOR_HPP

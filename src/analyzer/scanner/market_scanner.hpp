#ifndef MARKET_SCANNER_HPP
#define MARKET_SCANNER_HPP

#include <atomic>
#include <optional>
#include <string>
#include <vector>
#include "configs/scanner_config.hpp"
#include "analyzer/data_structures/data_structures.hpp"
#include "analyzer/analysis_service/analysis_service.hpp"

namespace ChartAnalyzer {
namespace Core {

struct ScanUniverseEntry {
    std::string symbol;
    BarSeries bars;
    std::optional<BarSeries> benchmark;
    std::optional<FundamentalData> fundamentals;
};

struct ScanFilter {
    double min_composite_score;
    double max_composite_score;
    std::optional<SignalType> signal;
    std::optional<ConvictionLevel> min_conviction;
    std::optional<TrendType> trend;
    std::optional<WeinsteinStage> weinstein_stage;
    std::optional<double> min_volume_ratio;
    std::optional<int> max_results;                  // Falls back to scanner.default_max_results
    std::vector<std::string> required_pattern_keywords;  // Applied after truncation; any keyword in any pattern name

    ScanFilter() : min_composite_score(50.0), max_composite_score(100.0) {}
};

struct ScanResult {
    std::string symbol;
    double current_price;
    double composite_score;
    SignalType signal;
    ConvictionLevel conviction;
    TrendType trend;
    WeinsteinStage weinstein_stage;
    std::vector<std::string> patterns;
    std::optional<double> volume_ratio;
    std::string timestamp;

    ScanResult()
        : current_price(0.0), composite_score(0.0), signal(SignalType::HOLD), conviction(ConvictionLevel::LOW),
          trend(TrendType::NEUTRAL), weinstein_stage(WeinsteinStage::STAGE_1) {}
};

namespace ScanPresets {
    ScanFilter breakouts(double min_volume_ratio = 1.5);
    ScanFilter stage2();
    ScanFilter minervini_setups();
    // Throws std::runtime_error for an unknown preset name
    ScanFilter by_name(const std::string& preset_name);
}

/**
 * Analyses a universe of symbols on a bounded worker pool and keeps the ones
 * that pass a filter, best composite score first.
 */
class MarketScanner {
public:
    MarketScanner(const ChartAnalyzer::Config::ScannerConfig& scanner_config, const AnalysisService& service,
                  const std::atomic<bool>* shutdown_flag = nullptr);

    std::vector<ScanResult> scan(const std::vector<ScanUniverseEntry>& universe, const ScanFilter& filter) const;

    std::vector<ScanResult> scan_for_breakouts(const std::vector<ScanUniverseEntry>& universe, double min_volume_ratio = 1.5) const;
    std::vector<ScanResult> scan_stage2(const std::vector<ScanUniverseEntry>& universe) const;
    std::vector<ScanResult> scan_minervini_setups(const std::vector<ScanUniverseEntry>& universe) const;

    static ScanResult create_scan_result(const AnalysisResult& analysis);
    static bool passes_filter(const ScanResult& result, const ScanFilter& filter, std::string& rejection_reason);

private:
    const ChartAnalyzer::Config::ScannerConfig config;
    const AnalysisService& analysis_service;
    const std::atomic<bool>* shutdown_requested;

    bool shutdown_pending() const;
    std::optional<ScanResult> scan_symbol(const ScanUniverseEntry& entry, const ScanFilter& filter) const;
};

} // namespace Core
} // namespace ChartAnalyzer

#endif // MARKET_SCANNER_HPP

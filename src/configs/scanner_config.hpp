// ScannerConfig.hpp
#ifndef SCANNER_CONFIG_HPP
#define SCANNER_CONFIG_HPP

namespace ChartAnalyzer {
namespace Config {

struct ScannerConfig {
    int max_concurrent_analyses;                     // Worker threads used by a scan
    int default_max_results;                         // Results kept when a filter does not say
    int service_minimum_bars;                        // Bars required for a full analysis

    ScannerConfig()
        : max_concurrent_analyses(5), default_max_results(20), service_minimum_bars(100) {}
};

} // namespace Config
} // namespace ChartAnalyzer

#endif // SCANNER_CONFIG_HPP

#ifndef JSON_SERIALIZER_HPP
#define JSON_SERIALIZER_HPP

#include <optional>
#include <vector>
#include <nlohmann/json.hpp>
#include "analyzer/data_structures/data_structures.hpp"
#include "analyzer/scanner/market_scanner.hpp"

namespace ChartAnalyzer {
namespace Core {

/**
 * Renders analysis products as JSON.
 * Enums become their upper-case names and the Weinstein stage an integer.
 * Absent values become null. Scores are rounded to 1 decimal and plan prices
 * to 2 decimals here, never earlier.
 */
class JsonSerializer {
public:
    static nlohmann::json serialize_report(const AnalysisReport& report);
    static nlohmann::json serialize_analysis(const AnalysisResult& analysis);
    static nlohmann::json serialize_composite_details(const CompositeResult& composite);
    static nlohmann::json serialize_trade_suggestion(const std::optional<TradeSuggestion>& suggestion);
    static nlohmann::json serialize_indicators(const IndicatorSet& indicators);
    static nlohmann::json serialize_scan_results(const std::vector<ScanResult>& results);

    static double round_to(double value, int decimals);

private:
    static nlohmann::json serialize_scores(const StrategyScores& scores);
    static nlohmann::json serialize_level(const Level& level);
    static nlohmann::json serialize_pattern(const PatternMatch& pattern);
    static nlohmann::json serialize_volume(const VolumeAnalysis& volume);
    static nlohmann::json serialize_target(const Target& target);
    static nlohmann::json serialize_scan_result(const ScanResult& result);
};

} // namespace Core
} // namespace ChartAnalyzer

#endif // JSON_SERIALIZER_HPP

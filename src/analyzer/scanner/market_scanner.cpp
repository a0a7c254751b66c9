#include "market_scanner.hpp"
#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <thread>
#include "logging/logger/async_logger.hpp"
#include "logging/logs/scanner_logs.hpp"
#include "utils/format_utils.hpp"

using ChartAnalyzer::Logging::ScannerLogs;
using ChartAnalyzer::Logging::LoggingContext;

namespace ChartAnalyzer {
namespace Core {

namespace {
    const size_t MAX_PATTERN_NAMES = 3;
    const int MINERVINI_MAX_RESULTS = 30;

    bool matches_any_keyword(const std::vector<std::string>& patterns, const std::vector<std::string>& keywords) {
        for (const std::string& pattern_name : patterns) {
            for (const std::string& keyword : keywords) {
                if (pattern_name.find(keyword) != std::string::npos) {
                    return true;
                }
            }
        }
        return false;
    }
}

namespace ScanPresets {

ScanFilter breakouts(double min_volume_ratio) {
    ScanFilter filter;
    filter.min_composite_score = 60.0;
    filter.signal = SignalType::BUY;
    filter.min_volume_ratio = min_volume_ratio;
    return filter;
}

ScanFilter stage2() {
    ScanFilter filter;
    filter.min_composite_score = 55.0;
    filter.weinstein_stage = WeinsteinStage::STAGE_2;
    filter.trend = TrendType::BULLISH;
    return filter;
}

ScanFilter minervini_setups() {
    ScanFilter filter;
    filter.min_composite_score = 65.0;
    filter.signal = SignalType::BUY;
    filter.max_results = MINERVINI_MAX_RESULTS;
    filter.required_pattern_keywords = {"VCP", "Cup"};
    return filter;
}

ScanFilter by_name(const std::string& preset_name) {
    std::string normalized_name = FormatUtils::to_lower(preset_name);
    if (normalized_name == "breakouts") return breakouts();
    if (normalized_name == "stage2") return stage2();
    if (normalized_name == "minervini") return minervini_setups();
    throw std::runtime_error("Unknown scan preset: '" + preset_name + "' (must be breakouts, stage2 or minervini)");
}

} // namespace ScanPresets

MarketScanner::MarketScanner(const ChartAnalyzer::Config::ScannerConfig& scanner_config, const AnalysisService& service,
                             const std::atomic<bool>* shutdown_flag)
    : config(scanner_config), analysis_service(service), shutdown_requested(shutdown_flag) {}

bool MarketScanner::shutdown_pending() const {
    return shutdown_requested && shutdown_requested->load();
}

std::vector<ScanResult> MarketScanner::scan(const std::vector<ScanUniverseEntry>& universe, const ScanFilter& filter) const {
    auto scan_start_time = std::chrono::steady_clock::now();

    int worker_count = std::max(1, std::min(config.max_concurrent_analyses, static_cast<int>(universe.size())));
    ScannerLogs::log_scan_start(universe.size(), worker_count);

    LoggingContext* shared_logging_context = ChartAnalyzer::Logging::has_logging_context()
        ? ChartAnalyzer::Logging::get_logging_context()
        : nullptr;

    // One slot per symbol keeps the merge lock-free and the order reproducible
    std::vector<std::optional<ScanResult>> result_slots(universe.size());
    std::atomic<size_t> next_symbol_index{0};
    std::atomic<size_t> analysed_count{0};

    auto worker_body = [&](int worker_number) {
        if (shared_logging_context) {
            ChartAnalyzer::Logging::set_logging_context(*shared_logging_context);
            ChartAnalyzer::Logging::set_log_thread_tag("SCAN" + std::to_string(worker_number));
        }
        while (!shutdown_pending()) {
            size_t symbol_index = next_symbol_index.fetch_add(1);
            if (symbol_index >= universe.size()) {
                break;
            }
            const ScanUniverseEntry& entry = universe[symbol_index];
            try {
                result_slots[symbol_index] = scan_symbol(entry, filter);
                analysed_count.fetch_add(1);
            } catch (const std::exception& exception_error) {
                ScannerLogs::log_symbol_failure(entry.symbol, exception_error.what());
            }
        }
    };

    std::vector<std::thread> workers;
    workers.reserve(static_cast<size_t>(worker_count));
    for (int worker_number = 1; worker_number <= worker_count && !universe.empty(); ++worker_number) {
        workers.emplace_back(worker_body, worker_number);
    }
    for (std::thread& worker : workers) {
        worker.join();
    }

    if (shutdown_pending()) {
        ScannerLogs::log_scan_interrupted(std::min(next_symbol_index.load(), universe.size()), universe.size());
    }

    std::vector<ScanResult> results;
    for (std::optional<ScanResult>& slot : result_slots) {
        if (slot) {
            results.push_back(std::move(*slot));
        }
    }
    size_t matched_count = results.size();

    std::stable_sort(results.begin(), results.end(), [](const ScanResult& left, const ScanResult& right) {
        return left.composite_score > right.composite_score;
    });

    size_t max_results = static_cast<size_t>(std::max(0, filter.max_results.value_or(config.default_max_results)));
    if (results.size() > max_results) {
        results.resize(max_results);
    }

    if (!filter.required_pattern_keywords.empty()) {
        results.erase(std::remove_if(results.begin(), results.end(), [&](const ScanResult& result) {
            return !matches_any_keyword(result.patterns, filter.required_pattern_keywords);
        }), results.end());
    }

    long long elapsed_milliseconds = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - scan_start_time).count();
    ScannerLogs::log_scan_summary(analysed_count.load(), matched_count, results.size(), elapsed_milliseconds);
    return results;
}

std::optional<ScanResult> MarketScanner::scan_symbol(const ScanUniverseEntry& entry, const ScanFilter& filter) const {
    std::optional<AnalysisReport> report = analysis_service.analyze(entry.symbol, entry.bars, entry.benchmark, entry.fundamentals);
    if (!report) {
        return std::nullopt;
    }

    ScanResult result = create_scan_result(report->analysis);
    std::string rejection_reason;
    if (!passes_filter(result, filter, rejection_reason)) {
        ScannerLogs::log_filter_rejection(result.symbol, rejection_reason);
        return std::nullopt;
    }
    return result;
}

std::vector<ScanResult> MarketScanner::scan_for_breakouts(const std::vector<ScanUniverseEntry>& universe, double min_volume_ratio) const {
    return scan(universe, ScanPresets::breakouts(min_volume_ratio));
}

std::vector<ScanResult> MarketScanner::scan_stage2(const std::vector<ScanUniverseEntry>& universe) const {
    return scan(universe, ScanPresets::stage2());
}

std::vector<ScanResult> MarketScanner::scan_minervini_setups(const std::vector<ScanUniverseEntry>& universe) const {
    return scan(universe, ScanPresets::minervini_setups());
}

ScanResult MarketScanner::create_scan_result(const AnalysisResult& analysis) {
    ScanResult result;
    result.symbol = analysis.symbol;
    result.current_price = analysis.current_price;
    result.composite_score = analysis.scores.composite_score;
    result.signal = analysis.signal;
    result.conviction = analysis.conviction;
    result.trend = analysis.primary_trend;
    result.weinstein_stage = analysis.weinstein_stage;
    result.volume_ratio = analysis.volume.volume_ratio;
    result.timestamp = analysis.timestamp;

    size_t pattern_count = std::min(MAX_PATTERN_NAMES, analysis.detected_patterns.size());
    for (size_t pattern_index = 0; pattern_index < pattern_count; ++pattern_index) {
        result.patterns.push_back(analysis.detected_patterns[pattern_index].pattern_name);
    }
    return result;
}

bool MarketScanner::passes_filter(const ScanResult& result, const ScanFilter& filter, std::string& rejection_reason) {
    if (result.composite_score < filter.min_composite_score) {
        rejection_reason = "composite " + FormatUtils::format_fixed(result.composite_score, 1) + " below minimum " +
                           FormatUtils::format_fixed(filter.min_composite_score, 1);
        return false;
    }
    if (result.composite_score > filter.max_composite_score) {
        rejection_reason = "composite " + FormatUtils::format_fixed(result.composite_score, 1) + " above maximum " +
                           FormatUtils::format_fixed(filter.max_composite_score, 1);
        return false;
    }
    if (filter.signal && result.signal != *filter.signal) {
        rejection_reason = "signal " + to_string(result.signal) + " is not " + to_string(*filter.signal);
        return false;
    }
    if (filter.min_conviction && static_cast<int>(result.conviction) < static_cast<int>(*filter.min_conviction)) {
        rejection_reason = "conviction " + to_string(result.conviction) + " below " + to_string(*filter.min_conviction);
        return false;
    }
    if (filter.trend && result.trend != *filter.trend) {
        rejection_reason = "trend " + to_string(result.trend) + " is not " + to_string(*filter.trend);
        return false;
    }
    if (filter.weinstein_stage && result.weinstein_stage != *filter.weinstein_stage) {
        rejection_reason = "stage " + std::to_string(to_int(result.weinstein_stage)) + " is not " +
                           std::to_string(to_int(*filter.weinstein_stage));
        return false;
    }
    if (filter.min_volume_ratio) {
        if (!result.volume_ratio) {
            rejection_reason = "volume ratio unavailable";
            return false;
        }
        if (*result.volume_ratio < *filter.min_volume_ratio) {
            rejection_reason = "volume ratio " + FormatUtils::format_fixed(*result.volume_ratio, 2) + " below " +
                               FormatUtils::format_fixed(*filter.min_volume_ratio, 2);
            return false;
        }
    }
    return true;
}

} // namespace Core
} // namespace ChartAnalyzer

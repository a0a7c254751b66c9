#include "commands.hpp"
#include <optional>
#include <vector>
#include <nlohmann/json.hpp>
#include "analyzer/analysis_service/analysis_service.hpp"
#include "analyzer/market_data/market_data_loader.hpp"
#include "analyzer/serialization/json_serializer.hpp"
#include "analyzer/strategy_analysis/composite_strategy.hpp"
#include "logging/logs/scanner_logs.hpp"

using namespace ChartAnalyzer::Core;
using ChartAnalyzer::Logging::ScannerLogs;
using json = nlohmann::json;

namespace ChartAnalyzer {
namespace System {

namespace {
    const int JSON_INDENT = 2;
    const char* INSUFFICIENT_DATA_MESSAGE = "Insufficient data for analysis";

    std::optional<BarSeries> load_benchmark(const MarketDataLoader& loader, const CommandLineOptions& options) {
        if (!options.benchmark_file) {
            return std::nullopt;
        }
        return loader.load_bars(*options.benchmark_file).bars;
    }

    int run_analyze(const CommandLineOptions& options, const ChartAnalyzer::Config::SystemConfig& config,
                    std::ostream& output, std::ostream& diagnostics) {
        MarketDataLoader loader;
        BarFile bar_file = loader.load_bars(options.bar_files.front());
        std::optional<BarSeries> benchmark_bars = load_benchmark(loader, options);
        std::optional<FundamentalData> fundamentals;
        if (options.fundamentals_file) {
            fundamentals = loader.load_fundamentals_json(*options.fundamentals_file);
        }
        std::string symbol = options.symbol.value_or(bar_file.symbol);

        AnalysisService service(config);
        std::optional<AnalysisReport> report = service.analyze(symbol, bar_file.bars, benchmark_bars, fundamentals);
        if (!report) {
            diagnostics << INSUFFICIENT_DATA_MESSAGE << std::endl;
            return EXIT_CODE_INSUFFICIENT_DATA;
        }

        output << JsonSerializer::serialize_report(*report).dump(JSON_INDENT) << std::endl;
        if (options.print_summary) {
            diagnostics << strategy_summary(report->composite) << std::endl;
        }
        return EXIT_CODE_SUCCESS;
    }

    int run_indicators(const CommandLineOptions& options, const ChartAnalyzer::Config::SystemConfig& config,
                       std::ostream& output, std::ostream& diagnostics) {
        MarketDataLoader loader;
        BarFile bar_file = loader.load_bars(options.bar_files.front());

        AnalysisService service(config);
        std::optional<IndicatorSet> indicators = service.compute_indicators(bar_file.bars);
        if (!indicators) {
            diagnostics << INSUFFICIENT_DATA_MESSAGE << std::endl;
            return EXIT_CODE_INSUFFICIENT_DATA;
        }

        json indicators_json;
        indicators_json["symbol"] = bar_file.symbol;
        indicators_json["timestamp"] = bar_file.bars.back().timestamp;
        indicators_json["bar_count"] = bar_file.bars.size();
        indicators_json["indicators"] = JsonSerializer::serialize_indicators(*indicators);
        output << indicators_json.dump(JSON_INDENT) << std::endl;
        return EXIT_CODE_SUCCESS;
    }

    int run_scan(const CommandLineOptions& options, const ChartAnalyzer::Config::SystemConfig& config,
                 const std::atomic<bool>& shutdown_flag, std::ostream& output) {
        MarketDataLoader loader;
        std::optional<BarSeries> benchmark_bars = load_benchmark(loader, options);

        std::vector<ScanUniverseEntry> universe;
        for (const std::string& bar_path : options.bar_files) {
            try {
                BarFile bar_file = loader.load_bars(bar_path);
                ScanUniverseEntry entry;
                entry.symbol = bar_file.symbol;
                entry.bars = std::move(bar_file.bars);
                entry.benchmark = benchmark_bars;
                universe.push_back(std::move(entry));
            } catch (const std::exception& load_exception_error) {
                ScannerLogs::log_symbol_failure(bar_path, load_exception_error.what());
            }
        }

        AnalysisService service(config);
        MarketScanner scanner(config.scanner, service, &shutdown_flag);
        std::vector<ScanResult> results = scanner.scan(universe, build_scan_filter(options));

        output << JsonSerializer::serialize_scan_results(results).dump(JSON_INDENT) << std::endl;
        return EXIT_CODE_SUCCESS;
    }
}

ScanFilter build_scan_filter(const CommandLineOptions& options) {
    ScanFilter filter = options.preset ? ScanPresets::by_name(*options.preset) : ScanFilter();

    if (options.min_score) filter.min_composite_score = *options.min_score;
    if (options.max_score) filter.max_composite_score = *options.max_score;
    if (options.signal) filter.signal = parse_signal_type(*options.signal);
    if (options.min_conviction) filter.min_conviction = parse_conviction_level(*options.min_conviction);
    if (options.trend) filter.trend = parse_trend_type(*options.trend);
    if (options.stage) filter.weinstein_stage = parse_weinstein_stage(*options.stage);
    if (options.min_volume_ratio) filter.min_volume_ratio = *options.min_volume_ratio;
    if (options.max_results) filter.max_results = *options.max_results;
    return filter;
}

int run_command(const CommandLineOptions& options, const ChartAnalyzer::Config::SystemConfig& config,
                const std::atomic<bool>& shutdown_flag, std::ostream& output, std::ostream& diagnostics) {
    switch (options.command) {
        case CommandType::ANALYZE: return run_analyze(options, config, output, diagnostics);
        case CommandType::INDICATORS: return run_indicators(options, config, output, diagnostics);
        case CommandType::SCAN: return run_scan(options, config, shutdown_flag, output);
    }
    return EXIT_CODE_FAILURE;
}

} // namespace System
} // namespace ChartAnalyzer

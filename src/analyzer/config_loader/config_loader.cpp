#include "config_loader.hpp"
#include "logging/logger/async_logger.hpp"
#include "logging/logs/system_logs.hpp"
#include <fstream>
#include <sstream>
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <vector>

using ChartAnalyzer::Logging::log_message;
using ChartAnalyzer::Logging::SystemLogs;

namespace ChartAnalyzer {
namespace Config {

namespace {
    inline std::string trim(const std::string& input_string) {
        const char* whitespace_chars = " \t\r\n";
        auto begin_position = input_string.find_first_not_of(whitespace_chars);
        auto end_position = input_string.find_last_not_of(whitespace_chars);
        if (begin_position == std::string::npos) return "";
        return input_string.substr(begin_position, end_position - begin_position + 1);
    }

    inline bool to_bool(const std::string& input_value) {
        std::string normalized_value = input_value;
        std::transform(normalized_value.begin(), normalized_value.end(), normalized_value.begin(), ::tolower);
        return normalized_value == "1" || normalized_value == "true" || normalized_value == "yes";
    }

    // std::stoi and std::stod accept trailing garbage, so the whole value must be consumed
    int to_int(const std::string& input_value) {
        size_t consumed_characters = 0;
        int parsed_value = std::stoi(input_value, &consumed_characters);
        if (consumed_characters != input_value.size()) {
            throw std::runtime_error("Malformed integer value: '" + input_value + "'");
        }
        return parsed_value;
    }

    double to_double(const std::string& input_value) {
        size_t consumed_characters = 0;
        double parsed_value = std::stod(input_value, &consumed_characters);
        if (consumed_characters != input_value.size() || !std::isfinite(parsed_value)) {
            throw std::runtime_error("Malformed numeric value: '" + input_value + "'");
        }
        return parsed_value;
    }

    std::vector<std::string> split_list(const std::string& input_value) {
        std::vector<std::string> items;
        std::stringstream list_stream(input_value);
        std::string item;
        while (std::getline(list_stream, item, ';')) {
            item = trim(item);
            if (!item.empty()) items.push_back(item);
        }
        if (items.empty()) {
            throw std::runtime_error("List value is empty");
        }
        return items;
    }

    std::vector<int> to_int_list(const std::string& input_value) {
        std::vector<int> values;
        for (const std::string& item : split_list(input_value)) values.push_back(to_int(item));
        return values;
    }

    std::vector<double> to_double_list(const std::string& input_value) {
        std::vector<double> values;
        for (const std::string& item : split_list(input_value)) values.push_back(to_double(item));
        return values;
    }

    bool all_positive(const std::vector<int>& periods) {
        if (periods.empty()) return false;
        for (int period : periods) {
            if (period <= 0) return false;
        }
        return true;
    }

    // Returns false when the key is not recognised
    bool apply_config_value(SystemConfig& cfg, const std::string& key, const std::string& value) {
        // Indicators
        if (key == "indicators.sma_periods") cfg.indicators.sma_periods = to_int_list(value);
        else if (key == "indicators.ema_periods") cfg.indicators.ema_periods = to_int_list(value);
        else if (key == "indicators.rsi_period") cfg.indicators.rsi_period = to_int(value);
        else if (key == "indicators.macd_fast") cfg.indicators.macd_fast = to_int(value);
        else if (key == "indicators.macd_slow") cfg.indicators.macd_slow = to_int(value);
        else if (key == "indicators.macd_signal") cfg.indicators.macd_signal = to_int(value);
        else if (key == "indicators.stoch_k") cfg.indicators.stoch_k = to_int(value);
        else if (key == "indicators.stoch_d") cfg.indicators.stoch_d = to_int(value);
        else if (key == "indicators.stoch_smooth") cfg.indicators.stoch_smooth = to_int(value);
        else if (key == "indicators.bb_period") cfg.indicators.bb_period = to_int(value);
        else if (key == "indicators.bb_std") cfg.indicators.bb_std = to_double(value);
        else if (key == "indicators.atr_period") cfg.indicators.atr_period = to_int(value);
        else if (key == "indicators.adx_period") cfg.indicators.adx_period = to_int(value);
        else if (key == "indicators.volume_sma_periods") cfg.indicators.volume_sma_periods = to_int_list(value);
        else if (key == "indicators.obv_sma_period") cfg.indicators.obv_sma_period = to_int(value);
        else if (key == "indicators.minimum_bars") cfg.indicators.minimum_bars = to_int(value);

        // Patterns
        else if (key == "patterns.minimum_bars") cfg.patterns.minimum_bars = to_int(value);
        else if (key == "patterns.pivot_window") cfg.patterns.pivot_window = to_int(value);
        else if (key == "patterns.double_top_tolerance") cfg.patterns.double_top_tolerance = to_double(value);
        else if (key == "patterns.cup_depth_min") cfg.patterns.cup_depth_min = to_double(value);
        else if (key == "patterns.cup_depth_max") cfg.patterns.cup_depth_max = to_double(value);

        // Support and resistance
        else if (key == "support_resistance.lookback_period") cfg.support_resistance.lookback_period = to_int(value);
        else if (key == "support_resistance.tolerance_pct") cfg.support_resistance.tolerance_pct = to_double(value);
        else if (key == "support_resistance.pivot_lookback") cfg.support_resistance.pivot_lookback = to_int(value);
        else if (key == "support_resistance.volume_threshold") cfg.support_resistance.volume_threshold = to_double(value);
        else if (key == "support_resistance.max_levels") cfg.support_resistance.max_levels = to_int(value);
        else if (key == "support_resistance.ma_periods") cfg.support_resistance.ma_periods = to_int_list(value);
        else if (key == "support_resistance.psychological_increments") cfg.support_resistance.psychological_increments = to_int_list(value);

        // Trend and stage
        else if (key == "trend.minimum_bars") cfg.trend.minimum_bars = to_int(value);
        else if (key == "trend.stage_minimum_bars") cfg.trend.stage_minimum_bars = to_int(value);
        else if (key == "trend.stage_ma_period") cfg.trend.stage_ma_period = to_int(value);
        else if (key == "trend.stage_slope_deadband") cfg.trend.stage_slope_deadband = to_double(value);
        else if (key == "trend.structure_window") cfg.trend.structure_window = to_int(value);
        else if (key == "trend.structure_ratio") cfg.trend.structure_ratio = to_double(value);

        // Volume
        else if (key == "volume.sma_periods") cfg.volume.sma_periods = to_int_list(value);
        else if (key == "volume.spike_threshold") cfg.volume.spike_threshold = to_double(value);
        else if (key == "volume.accumulation_threshold") cfg.volume.accumulation_threshold = to_double(value);
        else if (key == "volume.climax_multiplier") cfg.volume.climax_multiplier = to_double(value);

        // Composite
        else if (key == "composite.minervini_weight") cfg.composite.minervini_weight = to_double(value);
        else if (key == "composite.weinstein_weight") cfg.composite.weinstein_weight = to_double(value);
        else if (key == "composite.lynch_weight") cfg.composite.lynch_weight = to_double(value);
        else if (key == "composite.technical_weight") cfg.composite.technical_weight = to_double(value);
        else if (key == "composite.agreement_std_threshold") cfg.composite.agreement_std_threshold = to_double(value);
        else if (key == "composite.lynch_neutral_score") cfg.composite.lynch_neutral_score = to_double(value);

        // Trade plan
        else if (key == "trade_plan.entry_zone_atr_multiple") cfg.trade_plan.entry_zone_atr_multiple = to_double(value);
        else if (key == "trade_plan.support_stop_atr_buffer") cfg.trade_plan.support_stop_atr_buffer = to_double(value);
        else if (key == "trade_plan.max_stop_atr_multiple") cfg.trade_plan.max_stop_atr_multiple = to_double(value);
        else if (key == "trade_plan.no_support_stop_atr_multiple") cfg.trade_plan.no_support_stop_atr_multiple = to_double(value);
        else if (key == "trade_plan.fallback_atr_pct") cfg.trade_plan.fallback_atr_pct = to_double(value);
        else if (key == "trade_plan.target_risk_multiples") cfg.trade_plan.target_risk_multiples = to_double_list(value);
        else if (key == "trade_plan.resistance_cap_factor") cfg.trade_plan.resistance_cap_factor = to_double(value);
        else if (key == "trade_plan.high_conviction_position_pct") cfg.trade_plan.high_conviction_position_pct = to_double(value);
        else if (key == "trade_plan.medium_conviction_position_pct") cfg.trade_plan.medium_conviction_position_pct = to_double(value);
        else if (key == "trade_plan.low_conviction_position_pct") cfg.trade_plan.low_conviction_position_pct = to_double(value);
        else if (key == "trade_plan.max_position_factor") cfg.trade_plan.max_position_factor = to_double(value);

        // Scanner
        else if (key == "scanner.max_concurrent_analyses") cfg.scanner.max_concurrent_analyses = to_int(value);
        else if (key == "scanner.default_max_results") cfg.scanner.default_max_results = to_int(value);
        else if (key == "scanner.service_minimum_bars") cfg.scanner.service_minimum_bars = to_int(value);

        // Logging
        else if (key == "logging.log_file") cfg.logging.log_file = value;
        else if (key == "logging.runtime_logs_directory") cfg.logging.runtime_logs_directory = value;
        else if (key == "logging.console_output_enabled") cfg.logging.console_output_enabled = to_bool(value);
        else if (key == "logging.flush_interval_milliseconds") cfg.logging.flush_interval_milliseconds = to_int(value);
        else return false;

        return true;
    }
}

bool load_config_from_csv(SystemConfig& cfg, const std::string& csv_path) {
    try {
        std::ifstream config_file_stream(csv_path);
        if (!config_file_stream.is_open()) {
            SystemLogs::log_config_file_missing(csv_path);
            return false;
        }
        std::string config_line_string;
        while (std::getline(config_file_stream, config_line_string)) {
            try {
                config_line_string = trim(config_line_string);
                if (config_line_string.empty() || config_line_string[0] == '#') continue;
                std::stringstream config_line_stream(config_line_string);
                std::string config_key_string, config_value_string;
                if (!std::getline(config_line_stream, config_key_string, ',')) continue;
                if (!std::getline(config_line_stream, config_value_string)) continue;
                config_key_string = trim(config_key_string);
                config_value_string = trim(config_value_string);

                if (!apply_config_value(cfg, config_key_string, config_value_string)) {
                    SystemLogs::log_unknown_config_key(config_key_string, csv_path);
                }
            } catch (const std::exception& line_exception_error) {
                SystemLogs::log_config_line_error(config_line_string, csv_path, line_exception_error.what());
                throw;
            }
        }
        return true;
    } catch (const std::exception& exception_error) {
        log_message("Exception in load_config_from_csv: " + std::string(exception_error.what()), "");
        return false;
    }
}

int load_system_config(SystemConfig& config, const std::string& config_directory) {
    std::vector<std::string> config_files = {
        "analysis_config.csv",
        "scanner_config.csv",
        "logging_config.csv"
    };

    for (const auto& config_file : config_files) {
        std::string config_path = config_directory + "/" + config_file;
        if (!load_config_from_csv(config, config_path)) {
            log_message("ERROR: Failed to load config CSV from " + config_path, "");
            return 1;
        }
    }

    std::string validation_error;
    if (!validate_config(config, validation_error)) {
        log_message("ERROR: Configuration validation failed: " + validation_error, "");
        return 1;
    }

    SystemLogs::log_configuration_loaded(config_directory);
    return 0;
}

bool validate_config(const SystemConfig& config, std::string& error_message) {
    const CompositeConfig& composite = config.composite;
    if (composite.minervini_weight < 0.0 || composite.weinstein_weight < 0.0 ||
        composite.lynch_weight < 0.0 || composite.technical_weight < 0.0) {
        error_message = "Strategy weights must be non-negative (composite.*_weight)";
        return false;
    }
    double weight_sum = composite.minervini_weight + composite.weinstein_weight + composite.lynch_weight + composite.technical_weight;
    if (std::fabs(weight_sum - 1.0) > 1e-9) {
        error_message = "Strategy weights must sum to 1.0, got " + std::to_string(weight_sum);
        return false;
    }

    const IndicatorConfig& indicators = config.indicators;
    if (!all_positive(indicators.sma_periods) || !all_positive(indicators.ema_periods) ||
        !all_positive(indicators.volume_sma_periods) ||
        indicators.rsi_period <= 0 || indicators.macd_fast <= 0 || indicators.macd_slow <= 0 ||
        indicators.macd_signal <= 0 || indicators.stoch_k <= 0 || indicators.stoch_d <= 0 ||
        indicators.stoch_smooth <= 0 || indicators.bb_period <= 0 || indicators.atr_period <= 0 ||
        indicators.adx_period <= 0 || indicators.obv_sma_period <= 0 || indicators.minimum_bars <= 0) {
        error_message = "Indicator periods must be > 0 (indicators.*)";
        return false;
    }

    if (config.patterns.pivot_window <= 0 || config.patterns.minimum_bars <= 0) {
        error_message = "Pattern periods must be > 0 (patterns.*)";
        return false;
    }

    const SupportResistanceConfig& levels = config.support_resistance;
    if (levels.lookback_period <= 0 || levels.pivot_lookback <= 0 || levels.max_levels <= 0 ||
        !all_positive(levels.ma_periods) || !all_positive(levels.psychological_increments)) {
        error_message = "Support/resistance periods must be > 0 (support_resistance.*)";
        return false;
    }
    if (levels.tolerance_pct <= 0.0) {
        error_message = "support_resistance.tolerance_pct must be > 0";
        return false;
    }

    const TrendConfig& trend = config.trend;
    if (trend.minimum_bars <= 0 || trend.stage_minimum_bars <= 0 || trend.stage_ma_period <= 0 ||
        trend.structure_window <= 0) {
        error_message = "Trend periods must be > 0 (trend.*)";
        return false;
    }

    if (config.volume.sma_periods.size() < 2 || !all_positive(config.volume.sma_periods)) {
        error_message = "volume.sma_periods needs a short and a long period, both > 0";
        return false;
    }

    if (config.trade_plan.target_risk_multiples.size() != 3) {
        error_message = "trade_plan.target_risk_multiples must list exactly three multiples";
        return false;
    }

    if (config.scanner.max_concurrent_analyses < 1) {
        error_message = "scanner.max_concurrent_analyses must be >= 1";
        return false;
    }
    if (config.scanner.default_max_results <= 0 || config.scanner.service_minimum_bars <= 0) {
        error_message = "Scanner limits must be > 0 (scanner.*)";
        return false;
    }

    if (config.logging.log_file.empty()) {
        error_message = "Log file name missing (provide logging.log_file via logging_config.csv)";
        return false;
    }
    if (config.logging.flush_interval_milliseconds <= 0) {
        error_message = "logging.flush_interval_milliseconds must be > 0";
        return false;
    }

    return true;
}

} // namespace Config
} // namespace ChartAnalyzer

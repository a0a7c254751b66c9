#include "market_data_loader.hpp"
#include <filesystem>
#include <fstream>
#include <map>
#include <sstream>
#include <stdexcept>
#include <vector>
#include <nlohmann/json.hpp>
#include "utils/format_utils.hpp"

using json = nlohmann::json;

namespace ChartAnalyzer {
namespace Core {

namespace {
    const std::vector<std::string> REQUIRED_COLUMNS = {"timestamp", "open", "high", "low", "close", "volume"};
    const std::vector<std::string> FUNDAMENTAL_FIELDS = {
        "pe_ratio", "pb_ratio", "roe", "roce", "debt_to_equity", "eps_growth", "revenue_growth"};

    std::vector<std::string> split_csv_line(const std::string& line) {
        std::vector<std::string> fields;
        std::stringstream line_stream(line);
        std::string field;
        while (std::getline(line_stream, field, ',')) {
            fields.push_back(FormatUtils::trim(field));
        }
        if (!line.empty() && line.back() == ',') {
            fields.push_back("");
        }
        return fields;
    }

    double parse_number(const std::string& text, const std::string& column, size_t line_number, const std::string& source_name) {
        size_t consumed = 0;
        double value = 0.0;
        try {
            value = std::stod(text, &consumed);
        } catch (const std::exception&) {
            throw std::runtime_error("CRITICAL: Malformed number '" + text + "' in column " + column +
                                     " | Line: " + std::to_string(line_number) + " | Source: " + source_name);
        }
        if (consumed != text.size()) {
            throw std::runtime_error("CRITICAL: Malformed number '" + text + "' in column " + column +
                                     " | Line: " + std::to_string(line_number) + " | Source: " + source_name);
        }
        return value;
    }

    std::string read_file(const std::string& path) {
        std::ifstream file(path);
        if (!file.is_open()) {
            throw std::runtime_error("CRITICAL: Cannot open file: " + path);
        }
        std::stringstream buffer;
        buffer << file.rdbuf();
        return buffer.str();
    }

    json parse_json_document(const std::string& json_text, const std::string& source_name) {
        try {
            return json::parse(json_text);
        } catch (const std::exception& json_parse_exception) {
            throw std::runtime_error("CRITICAL: Failed to parse JSON - " + std::string(json_parse_exception.what()) +
                                     " | Source: " + source_name);
        }
    }

    double json_number(const json& bar_object, const std::string& key, size_t bar_index, const std::string& source_name) {
        if (!bar_object.contains(key) || !bar_object[key].is_number()) {
            throw std::runtime_error("CRITICAL: Bar field '" + key + "' missing or not numeric | Bar index: " +
                                     std::to_string(bar_index) + " | Source: " + source_name);
        }
        return bar_object[key].get<double>();
    }

    Bar bar_from_json(const json& bar_object, size_t bar_index, const std::string& source_name) {
        if (!bar_object.is_object()) {
            throw std::runtime_error("CRITICAL: Bar entry is not an object | Bar index: " +
                                     std::to_string(bar_index) + " | Source: " + source_name);
        }
        if (!bar_object.contains("timestamp") || !bar_object["timestamp"].is_string()) {
            throw std::runtime_error("CRITICAL: Bar field 'timestamp' missing or not a string | Bar index: " +
                                     std::to_string(bar_index) + " | Source: " + source_name);
        }

        Bar bar_data;
        bar_data.timestamp = bar_object["timestamp"].get<std::string>();
        bar_data.open_price = json_number(bar_object, "open", bar_index, source_name);
        bar_data.high_price = json_number(bar_object, "high", bar_index, source_name);
        bar_data.low_price = json_number(bar_object, "low", bar_index, source_name);
        bar_data.close_price = json_number(bar_object, "close", bar_index, source_name);
        bar_data.volume = json_number(bar_object, "volume", bar_index, source_name);
        return bar_data;
    }
}

BarFile MarketDataLoader::load_bars(const std::string& path) const {
    std::string extension = FormatUtils::to_lower(std::filesystem::path(path).extension().string());
    if (extension == ".json") {
        return load_bars_json(path);
    }
    return load_bars_csv(path);
}

BarFile MarketDataLoader::load_bars_csv(const std::string& path) const {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("CRITICAL: Cannot open bars file: " + path);
    }

    BarFile bar_file;
    bar_file.symbol = symbol_from_path(path);
    bar_file.bars = parse_bars_csv(file, path);
    return bar_file;
}

BarFile MarketDataLoader::load_bars_json(const std::string& path) const {
    BarFile bar_file = parse_bars_json(read_file(path), path);
    if (bar_file.symbol.empty()) {
        bar_file.symbol = symbol_from_path(path);
    }
    return bar_file;
}

FundamentalData MarketDataLoader::load_fundamentals_json(const std::string& path) const {
    FundamentalData fundamentals = parse_fundamentals_json(read_file(path), path);
    if (fundamentals.symbol.empty()) {
        fundamentals.symbol = symbol_from_path(path);
    }
    return fundamentals;
}

BarSeries MarketDataLoader::parse_bars_csv(std::istream& input, const std::string& source_name) const {
    std::string header_line;
    if (!std::getline(input, header_line)) {
        throw std::runtime_error("CRITICAL: Bars CSV has no header | Source: " + source_name);
    }

    std::vector<std::string> header = split_csv_line(header_line);
    std::map<std::string, size_t> column_positions;
    for (size_t column_index = 0; column_index < header.size(); ++column_index) {
        column_positions[FormatUtils::to_lower(header[column_index])] = column_index;
    }
    for (const std::string& column : REQUIRED_COLUMNS) {
        if (column_positions.find(column) == column_positions.end()) {
            throw std::runtime_error("CRITICAL: Bars CSV header missing column '" + column + "' | Source: " + source_name);
        }
    }

    BarSeries bars;
    std::string line;
    size_t line_number = 1;
    while (std::getline(input, line)) {
        ++line_number;
        if (FormatUtils::trim(line).empty()) {
            continue;
        }

        std::vector<std::string> fields = split_csv_line(line);
        if (fields.size() < header.size()) {
            throw std::runtime_error("CRITICAL: Bars CSV row has " + std::to_string(fields.size()) + " fields, expected " +
                                     std::to_string(header.size()) + " | Line: " + std::to_string(line_number) +
                                     " | Source: " + source_name);
        }

        Bar bar_data;
        bar_data.timestamp = fields[column_positions["timestamp"]];
        bar_data.open_price = parse_number(fields[column_positions["open"]], "open", line_number, source_name);
        bar_data.high_price = parse_number(fields[column_positions["high"]], "high", line_number, source_name);
        bar_data.low_price = parse_number(fields[column_positions["low"]], "low", line_number, source_name);
        bar_data.close_price = parse_number(fields[column_positions["close"]], "close", line_number, source_name);
        bar_data.volume = parse_number(fields[column_positions["volume"]], "volume", line_number, source_name);
        bars.push_back(bar_data);
    }

    validator.validate_bars(bars);
    return bars;
}

BarFile MarketDataLoader::parse_bars_json(const std::string& json_text, const std::string& source_name) const {
    json document = parse_json_document(json_text, source_name);
    BarFile bar_file;

    const json* bar_array = &document;
    if (document.is_object()) {
        if (!document.contains("bars") || !document["bars"].is_array()) {
            throw std::runtime_error("CRITICAL: Bars JSON object missing 'bars' array | Source: " + source_name);
        }
        if (document.contains("symbol") && document["symbol"].is_string()) {
            bar_file.symbol = FormatUtils::to_upper(document["symbol"].get<std::string>());
        }
        bar_array = &document["bars"];
    } else if (!document.is_array()) {
        throw std::runtime_error("CRITICAL: Bars JSON must be an array or an object with 'bars' | Source: " + source_name);
    }

    for (size_t bar_index = 0; bar_index < bar_array->size(); ++bar_index) {
        bar_file.bars.push_back(bar_from_json((*bar_array)[bar_index], bar_index, source_name));
    }

    validator.validate_bars(bar_file.bars);
    return bar_file;
}

FundamentalData MarketDataLoader::parse_fundamentals_json(const std::string& json_text, const std::string& source_name) const {
    json document = parse_json_document(json_text, source_name);
    if (!document.is_object()) {
        throw std::runtime_error("CRITICAL: Fundamentals JSON must be an object | Source: " + source_name);
    }

    std::map<std::string, std::optional<double>> metrics;
    for (const std::string& field : FUNDAMENTAL_FIELDS) {
        if (!document.contains(field) || document[field].is_null()) {
            continue;
        }
        if (!document[field].is_number()) {
            throw std::runtime_error("CRITICAL: Fundamental field '" + field + "' is not numeric | Source: " + source_name);
        }
        metrics[field] = document[field].get<double>();
    }

    FundamentalData fundamentals;
    if (document.contains("symbol") && document["symbol"].is_string()) {
        fundamentals.symbol = FormatUtils::to_upper(document["symbol"].get<std::string>());
    }
    fundamentals.pe_ratio = metrics["pe_ratio"];
    fundamentals.pb_ratio = metrics["pb_ratio"];
    fundamentals.roe = metrics["roe"];
    fundamentals.roce = metrics["roce"];
    fundamentals.debt_to_equity = metrics["debt_to_equity"];
    fundamentals.eps_growth = metrics["eps_growth"];
    fundamentals.revenue_growth = metrics["revenue_growth"];
    return fundamentals;
}

std::string MarketDataLoader::symbol_from_path(const std::string& path) {
    return FormatUtils::to_upper(std::filesystem::path(path).stem().string());
}

} // namespace Core
} // namespace ChartAnalyzer

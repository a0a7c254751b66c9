#ifndef MARKET_DATA_LOADER_HPP
#define MARKET_DATA_LOADER_HPP

#include <istream>
#include <string>
#include "analyzer/data_structures/data_structures.hpp"
#include "market_data_validator.hpp"

namespace ChartAnalyzer {
namespace Core {

// Bars loaded from one file, validated and ready for the pipeline
struct BarFile {
    std::string symbol;
    BarSeries bars;
};

/**
 * Local file ingestion for bars and fundamentals.
 * Every bar series is validated before it is returned. Failures throw std::runtime_error.
 * The symbol is the upper-cased file stem unless the JSON document names one.
 */
class MarketDataLoader {
public:
    BarFile load_bars(const std::string& path) const;
    BarFile load_bars_csv(const std::string& path) const;
    BarFile load_bars_json(const std::string& path) const;
    FundamentalData load_fundamentals_json(const std::string& path) const;

    // Stream and text forms used by the file loaders
    BarSeries parse_bars_csv(std::istream& input, const std::string& source_name) const;
    BarFile parse_bars_json(const std::string& json_text, const std::string& source_name) const;
    FundamentalData parse_fundamentals_json(const std::string& json_text, const std::string& source_name) const;

    static std::string symbol_from_path(const std::string& path);

private:
    MarketDataValidator validator;
};

} // namespace Core
} // namespace ChartAnalyzer

#endif // MARKET_DATA_LOADER_HPP

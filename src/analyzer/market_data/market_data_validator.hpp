#ifndef MARKET_DATA_VALIDATOR_HPP
#define MARKET_DATA_VALIDATOR_HPP

#include <string>
#include "analyzer/data_structures/data_structures.hpp"

namespace ChartAnalyzer {
namespace Core {

/**
 * Ingestion checks for OHLCV sequences.
 * validate_bars throws std::runtime_error naming the first offending bar and fills in
 * epoch_seconds for every bar it accepts.
 */
class MarketDataValidator {
public:
    void validate_bars(BarSeries& bars) const;

    bool validate_price_data(const Bar& bar_data) const;
    bool validate_volume_data(const Bar& bar_data) const;
    bool validate_price_relationships(const Bar& bar_data) const;
};

} // namespace Core
} // namespace ChartAnalyzer

#endif // MARKET_DATA_VALIDATOR_HPP

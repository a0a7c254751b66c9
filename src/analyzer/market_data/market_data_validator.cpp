#include "market_data_validator.hpp"
#include <algorithm>
#include <cmath>
#include <optional>
#include <stdexcept>
#include "utils/time_utils.hpp"

namespace ChartAnalyzer {
namespace Core {

namespace {
    std::string bar_context(size_t bar_index, const Bar& bar_data) {
        return " | Bar index: " + std::to_string(bar_index) + " | Timestamp: " + bar_data.timestamp;
    }
}

void MarketDataValidator::validate_bars(BarSeries& bars) const {
    if (bars.empty()) {
        throw std::runtime_error("CRITICAL: Bar sequence is empty");
    }

    for (size_t bar_index = 0; bar_index < bars.size(); ++bar_index) {
        Bar& bar_data = bars[bar_index];

        if (!validate_price_data(bar_data)) {
            throw std::runtime_error("CRITICAL: Invalid bar data - OHLC prices must be finite and positive" +
                                     bar_context(bar_index, bar_data));
        }

        if (!validate_price_relationships(bar_data)) {
            throw std::runtime_error("CRITICAL: Invalid bar data - price relationships violated | H:" +
                                     std::to_string(bar_data.high_price) + " L:" + std::to_string(bar_data.low_price) +
                                     bar_context(bar_index, bar_data));
        }

        if (!validate_volume_data(bar_data)) {
            throw std::runtime_error("CRITICAL: Invalid bar data - volume must be finite and non-negative" +
                                     bar_context(bar_index, bar_data));
        }

        std::optional<long long> epoch_seconds = TimeUtils::parse_timestamp_to_epoch(bar_data.timestamp);
        if (!epoch_seconds) {
            throw std::runtime_error("CRITICAL: Unparseable bar timestamp" + bar_context(bar_index, bar_data));
        }
        bar_data.epoch_seconds = *epoch_seconds;

        if (bar_index > 0 && bar_data.epoch_seconds <= bars[bar_index - 1].epoch_seconds) {
            throw std::runtime_error("CRITICAL: Bar timestamps must be strictly increasing" +
                                     bar_context(bar_index, bar_data));
        }
    }
}

bool MarketDataValidator::validate_price_data(const Bar& bar_data) const {
    // Validate that price data is not null/empty
    if (!std::isfinite(bar_data.close_price) || !std::isfinite(bar_data.open_price) ||
        !std::isfinite(bar_data.high_price) || !std::isfinite(bar_data.low_price)) {
        return false;
    }

    if (bar_data.close_price <= 0.0 || bar_data.open_price <= 0.0 || bar_data.high_price <= 0.0 || bar_data.low_price <= 0.0) {
        return false;
    }

    return true;
}

bool MarketDataValidator::validate_price_relationships(const Bar& bar_data) const {
    // H >= L, H covers the body, L sits under the body
    if (bar_data.high_price < bar_data.low_price) {
        return false;
    }
    if (bar_data.high_price < std::max(bar_data.open_price, bar_data.close_price)) {
        return false;
    }
    if (bar_data.low_price > std::min(bar_data.open_price, bar_data.close_price)) {
        return false;
    }
    return true;
}

bool MarketDataValidator::validate_volume_data(const Bar& bar_data) const {
    return std::isfinite(bar_data.volume) && bar_data.volume >= 0.0;
}

} // namespace Core
} // namespace ChartAnalyzer

// include/signal_ngin/data/market_data_source.hpp
#pragma once

#include <optional>
#include <vector>
#include "signal_ngin/core/error.hpp"
#include "signal_ngin/core/types.hpp"

namespace signal_ngin {

/**
 * @brief Read access to stored candles
 */
class MarketDataSource {
public:
    virtual ~MarketDataSource() = default;

    /**
     * @brief Candles of one timeframe inside a window, oldest first
     */
    virtual Result<std::vector<Candle>> fetch_candles(const Instrument& instrument,
                                                      const Timeframe& timeframe,
                                                      const TimeWindow& window) = 0;

    /**
     * @brief Most recent candle, or std::nullopt when none is stored
     */
    virtual Result<std::optional<Candle>> latest_candle(const Instrument& instrument,
                                                        const Timeframe& timeframe) = 0;
};

}  // namespace signal_ngin

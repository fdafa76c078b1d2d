// include/signal_ngin/data/candle_aggregator.hpp
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "signal_ngin/core/types.hpp"

namespace signal_ngin {

/**
 * @brief What add_tick did with a tick
 */
enum class TickOutcome {
    OPENED,   // Started a new bucket (closing the previous one, if any)
    UPDATED,  // Folded into the current bucket
    DROPPED   // Older than the current bucket
};

/**
 * @brief Folds a tick stream into fixed-width OHLCV candles
 *
 * The bucket of a tick is floor(epoch_seconds / width) * width. Prices are
 * the bid/ask mid. Ticks that arrive for a bucket older than the current
 * one are dropped without touching any candle. Not thread-safe: one
 * aggregator belongs to one ingestion loop.
 */
class CandleAggregator {
public:
    /**
     * @param instrument Instrument key stamped on every candle
     * @param timeframe Candle width
     * @throws std::invalid_argument if timeframe.seconds <= 0
     */
    CandleAggregator(std::string instrument, Timeframe timeframe);

    TickOutcome add_tick(const Timestamp& timestamp, Price bid, Price ask, double volume);

    TickOutcome add_tick(const Tick& tick) {
        return add_tick(tick.timestamp, tick.bid, tick.ask, tick.volume);
    }

    /**
     * @brief The in-progress candle, if any tick has been accepted
     */
    std::optional<Candle> current() const {
        return current_;
    }

    /**
     * @brief Hand over candles closed since the last call
     */
    std::vector<Candle> take_closed();

    /**
     * @brief Close the in-progress candle (shutdown path)
     * @return The candle that was closed, if there was one
     */
    std::optional<Candle> flush();

    uint64_t dropped_ticks() const {
        return dropped_ticks_;
    }

    const Timeframe& timeframe() const {
        return timeframe_;
    }

    /**
     * @brief Bucket start (epoch seconds) containing the given instant
     */
    static int64_t bucket_of(const Timestamp& timestamp, int64_t width_seconds);

private:
    std::string instrument_;
    Timeframe timeframe_;
    std::optional<Candle> current_;
    int64_t current_bucket_{0};
    bool started_{false};
    std::vector<Candle> closed_;
    uint64_t dropped_ticks_{0};
};

}  // namespace signal_ngin

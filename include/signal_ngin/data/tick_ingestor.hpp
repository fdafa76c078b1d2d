// include/signal_ngin/data/tick_ingestor.hpp
#pragma once

#include <memory>
#include <vector>
#include "signal_ngin/core/error.hpp"
#include "signal_ngin/core/types.hpp"
#include "signal_ngin/data/candle_aggregator.hpp"

namespace signal_ngin {

/**
 * @brief Source of raw quote ticks for one instrument
 */
class TickSource {
public:
    virtual ~TickSource() = default;

    /**
     * @brief Ticks received since the previous poll, oldest first
     */
    virtual Result<std::vector<Tick>> poll(const Instrument& instrument) = 0;
};

/**
 * @brief Destination for closed candles
 */
class CandleStore {
public:
    virtual ~CandleStore() = default;
    virtual Result<void> store_candles(const std::vector<Candle>& candles) = 0;
};

/**
 * @brief Ingestion loop body for one instrument and timeframe
 *
 * Owns its CandleAggregator. Every closed candle is published as a
 * CANDLE_CLOSED event on the MarketDataBus and, when a store is configured,
 * persisted. Candles the store rejects are kept and retried by the next
 * poll_once or flush; they are published only once.
 */
class TickIngestor {
public:
    TickIngestor(Instrument instrument, Timeframe timeframe, std::shared_ptr<TickSource> source,
                 std::shared_ptr<CandleStore> store = nullptr);

    /**
     * @brief Pull pending ticks and fold them
     * @return Number of candles closed by this poll
     */
    Result<size_t> poll_once();

    /**
     * @brief Close and publish the in-progress candle
     */
    Result<void> flush();

    const CandleAggregator& aggregator() const {
        return aggregator_;
    }

    size_t unstored_candles() const {
        return unstored_.size();
    }

private:
    Result<size_t> publish_closed();

    Instrument instrument_;
    std::shared_ptr<TickSource> source_;
    std::shared_ptr<CandleStore> store_;
    CandleAggregator aggregator_;
    std::vector<Candle> unstored_;
};

}  // namespace signal_ngin

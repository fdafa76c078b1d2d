// src/data/tick_ingestor.cpp

#include "signal_ngin/data/tick_ingestor.hpp"
#include <stdexcept>
#include "signal_ngin/core/logger.hpp"
#include "signal_ngin/data/market_data_bus.hpp"

namespace signal_ngin {

TickIngestor::TickIngestor(Instrument instrument, Timeframe timeframe,
                           std::shared_ptr<TickSource> source, std::shared_ptr<CandleStore> store)
    : instrument_(std::move(instrument)),
      source_(std::move(source)),
      store_(std::move(store)),
      aggregator_(instrument_.key(), std::move(timeframe)) {
    if (!source_) {
        throw std::invalid_argument("TickIngestor requires a tick source");
    }
}

Result<size_t> TickIngestor::poll_once() {
    Logger::register_component("TickIngestor");

    auto ticks = source_->poll(instrument_);
    if (ticks.is_error()) {
        return make_error<size_t>(ErrorCode::DATA_UNAVAILABLE,
                                  "Tick poll failed for " + instrument_.key() + ": " +
                                      ticks.error()->what(),
                                  "TickIngestor");
    }

    const uint64_t dropped_before = aggregator_.dropped_ticks();
    for (const auto& tick : ticks.value()) {
        aggregator_.add_tick(tick);
    }

    const uint64_t dropped = aggregator_.dropped_ticks() - dropped_before;
    if (dropped > 0) {
        DEBUG("Dropped " << dropped << " late ticks for " << instrument_.key());
    }

    return publish_closed();
}

Result<void> TickIngestor::flush() {
    aggregator_.flush();
    auto published = publish_closed();
    if (published.is_error()) {
        return make_error<void>(published.error()->code(), published.error()->what(),
                                "TickIngestor");
    }
    return Result<void>();
}

Result<size_t> TickIngestor::publish_closed() {
    std::vector<Candle> closed = aggregator_.take_closed();

    for (const auto& candle : closed) {
        MarketDataEvent event;
        event.type = MarketDataEventType::CANDLE_CLOSED;
        event.symbol = candle.instrument;
        event.timestamp = candle.timestamp;
        event.numeric_fields["open"] = candle.open;
        event.numeric_fields["high"] = candle.high;
        event.numeric_fields["low"] = candle.low;
        event.numeric_fields["close"] = candle.close;
        event.numeric_fields["volume"] = candle.volume;
        event.string_fields["timeframe"] = candle.timeframe;
        MarketDataBus::instance().publish(event);
    }

    if (store_) {
        // Candles a failed store left behind go first, in close order
        unstored_.insert(unstored_.end(), closed.begin(), closed.end());
        if (!unstored_.empty()) {
            auto stored = store_->store_candles(unstored_);
            if (stored.is_error()) {
                WARN("Keeping " << unstored_.size() << " unstored candles for "
                                << instrument_.key() << " until the next poll");
                return make_error<size_t>(stored.error()->code(),
                                          "Failed to store closed candles for " +
                                              instrument_.key() + ": " + stored.error()->what(),
                                          "TickIngestor");
            }
            unstored_.clear();
        }
    }

    return Result<size_t>(closed.size());
}

}  // namespace signal_ngin

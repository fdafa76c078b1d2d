// src/data/candle_aggregator.cpp

#include "signal_ngin/data/candle_aggregator.hpp"
#include <algorithm>
#include <stdexcept>
#include "signal_ngin/core/time_utils.hpp"

namespace signal_ngin {

CandleAggregator::CandleAggregator(std::string instrument, Timeframe timeframe)
    : instrument_(std::move(instrument)), timeframe_(std::move(timeframe)) {
    if (timeframe_.seconds <= 0) {
        throw std::invalid_argument("Candle width must be positive for timeframe '" +
                                    timeframe_.label + "'");
    }
}

int64_t CandleAggregator::bucket_of(const Timestamp& timestamp, int64_t width_seconds) {
    int64_t seconds = core::to_epoch_seconds(timestamp);
    int64_t bucket = seconds / width_seconds;
    if (seconds % width_seconds != 0 && seconds < 0) {
        --bucket;
    }
    return bucket * width_seconds;
}

TickOutcome CandleAggregator::add_tick(const Timestamp& timestamp, Price bid, Price ask,
                                       double volume) {
    const int64_t bucket = bucket_of(timestamp, timeframe_.seconds);
    const Price mid = (bid + ask) / 2.0;

    // A flushed bucket is closed for good
    if (started_ && (bucket < current_bucket_ || (bucket == current_bucket_ && !current_))) {
        ++dropped_ticks_;
        return TickOutcome::DROPPED;
    }

    if (current_ && bucket == current_bucket_) {
        current_->high = std::max(current_->high, mid);
        current_->low = std::min(current_->low, mid);
        current_->close = mid;
        current_->volume += volume;
        return TickOutcome::UPDATED;
    }

    if (current_) {
        closed_.push_back(*current_);
    }

    started_ = true;
    current_bucket_ = bucket;
    current_ = Candle(core::from_epoch_seconds(bucket), mid, mid, mid, mid, volume, instrument_,
                      timeframe_.label);
    return TickOutcome::OPENED;
}

std::vector<Candle> CandleAggregator::take_closed() {
    std::vector<Candle> out;
    out.swap(closed_);
    return out;
}

std::optional<Candle> CandleAggregator::flush() {
    std::optional<Candle> closed = current_;
    if (current_) {
        closed_.push_back(*current_);
        current_.reset();
    }
    return closed;
}

}  // namespace signal_ngin

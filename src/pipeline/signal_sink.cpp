// src/pipeline/signal_sink.cpp

#include "signal_ngin/pipeline/signal_sink.hpp"
#include <stdexcept>
#include "signal_ngin/core/logger.hpp"
#include "signal_ngin/data/market_data_bus.hpp"

namespace signal_ngin {

CompositeSignalSink::CompositeSignalSink(std::vector<std::shared_ptr<SignalSink>> sinks) {
    for (auto& sink : sinks) {
        add_sink(std::move(sink));
    }
}

void CompositeSignalSink::add_sink(std::shared_ptr<SignalSink> sink) {
    if (!sink) {
        throw std::invalid_argument("CompositeSignalSink: null sink");
    }
    sinks_.push_back(std::move(sink));
}

Result<void> CompositeSignalSink::emit(const AggregatedSignal& signal) {
    std::string failures;
    for (size_t i = 0; i < sinks_.size(); ++i) {
        auto result = sinks_[i]->emit(signal);
        if (result.is_error()) {
            if (!failures.empty()) {
                failures += "; ";
            }
            failures += "sink " + std::to_string(i) + ": " + result.error()->what();
        }
    }

    if (!failures.empty()) {
        return make_error<void>(ErrorCode::EMISSION_ERROR, failures, "CompositeSignalSink");
    }
    return Result<void>();
}

Result<void> BusSignalSink::emit(const AggregatedSignal& signal) {
    MarketDataEvent event;
    event.type = MarketDataEventType::SIGNAL;
    event.symbol = signal.instrument;
    event.timestamp = signal.timestamp;
    event.numeric_fields["confidence"] = signal.confidence;
    event.numeric_fields["bull_score"] = signal.bull_score;
    event.numeric_fields["bear_score"] = signal.bear_score;
    event.numeric_fields["policy_id"] = static_cast<double>(signal.policy_id);
    event.string_fields["signal"] = signal_type_to_string(signal.type);

    MarketDataBus::instance().publish(event);
    return Result<void>();
}

PostgresSignalSink::PostgresSignalSink(std::shared_ptr<DatabaseInterface> db,
                                       std::string table_name)
    : db_(std::move(db)), table_name_(std::move(table_name)) {
    if (!db_) {
        throw std::invalid_argument("PostgresSignalSink: null database");
    }
}

Result<void> PostgresSignalSink::emit(const AggregatedSignal& signal) {
    auto result = db_->store_signal(signal.instrument, signal_type_to_string(signal.type),
                                    signal.confidence, signal.bull_score, signal.bear_score,
                                    signal.policy_id, signal.timestamp, signal.to_json(),
                                    table_name_);
    if (result.is_error()) {
        return make_error<void>(ErrorCode::EMISSION_ERROR,
                                "Failed to store signal for " + signal.instrument + ": " +
                                    result.error()->what(),
                                "PostgresSignalSink");
    }
    return Result<void>();
}

}  // namespace signal_ngin

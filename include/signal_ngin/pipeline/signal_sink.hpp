// include/signal_ngin/pipeline/signal_sink.hpp
#pragma once

#include <memory>
#include <string>
#include <vector>
#include "signal_ngin/core/error.hpp"
#include "signal_ngin/data/database_interface.hpp"
#include "signal_ngin/strategy/aggregation_engine.hpp"

namespace signal_ngin {

/**
 * @brief Destination for aggregated signals
 * Fan-out to storage or notification is the sink's concern.
 */
class SignalSink {
public:
    virtual ~SignalSink() = default;

    /**
     * @return EMISSION_ERROR when the signal could not be delivered
     */
    virtual Result<void> emit(const AggregatedSignal& signal) = 0;
};

/**
 * @brief Forwards each signal to every child, in order
 *
 * All children are tried; the result is an EMISSION_ERROR naming every
 * child that failed.
 */
class CompositeSignalSink : public SignalSink {
public:
    CompositeSignalSink() = default;
    explicit CompositeSignalSink(std::vector<std::shared_ptr<SignalSink>> sinks);

    void add_sink(std::shared_ptr<SignalSink> sink);

    size_t size() const {
        return sinks_.size();
    }

    Result<void> emit(const AggregatedSignal& signal) override;

private:
    std::vector<std::shared_ptr<SignalSink>> sinks_;
};

/**
 * @brief Publishes SIGNAL events on the MarketDataBus
 */
class BusSignalSink : public SignalSink {
public:
    Result<void> emit(const AggregatedSignal& signal) override;
};

/**
 * @brief Writes signals to the aggregated signals table
 */
class PostgresSignalSink : public SignalSink {
public:
    explicit PostgresSignalSink(std::shared_ptr<DatabaseInterface> db,
                                std::string table_name = "signals.aggregated_signals");

    Result<void> emit(const AggregatedSignal& signal) override;

private:
    std::shared_ptr<DatabaseInterface> db_;
    std::string table_name_;
};

}  // namespace signal_ngin

// include/signal_ngin/data/database_interface.hpp

#pragma once

#include <arrow/api.h>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "signal_ngin/core/error.hpp"
#include "signal_ngin/core/types.hpp"

namespace signal_ngin {

/**
 * @brief Abstract interface for database operations
 * Defines the contract that any database implementation must fulfill
 */
class DatabaseInterface {
public:
    virtual ~DatabaseInterface() = default;

    virtual Result<void> connect() = 0;
    virtual void disconnect() = 0;
    virtual bool is_connected() const = 0;

    /**
     * @brief Get candles for one instrument and timeframe in a date range
     * @param instrument Instrument key ("VENUE:TICKER")
     * @param timeframe Timeframe label
     * @param start_date Inclusive start
     * @param end_date Inclusive end
     * @param table_name Name of the table to query
     * @return Result containing Arrow table with columns
     *         time, instrument, timeframe, open, high, low, close, volume
     */
    virtual Result<std::shared_ptr<arrow::Table>> get_candles(
        const std::string& instrument, const std::string& timeframe, const Timestamp& start_date,
        const Timestamp& end_date, const std::string& table_name = "market.candles") = 0;

    /**
     * @brief Get the most recent candle (zero or one row)
     */
    virtual Result<std::shared_ptr<arrow::Table>> get_latest_candle(
        const std::string& instrument, const std::string& timeframe,
        const std::string& table_name = "market.candles") = 0;

    /**
     * @brief Upsert candles keyed by (instrument, timeframe, time)
     */
    virtual Result<void> store_candles(const std::vector<Candle>& candles,
                                       const std::string& table_name = "market.candles") = 0;

    /**
     * @brief Store one aggregated signal
     * @param instrument Instrument key
     * @param signal_type BUY, SELL or HOLD
     * @param confidence Confidence in [0, 1]
     * @param bull_score Sum of bullish weights
     * @param bear_score Sum of bearish weights
     * @param policy_id Strategy policy used
     * @param timestamp Signal time
     * @param details Per-timeframe contributions
     * @param table_name Name of the table to insert into
     */
    virtual Result<void> store_signal(const std::string& instrument,
                                      const std::string& signal_type, double confidence,
                                      double bull_score, double bear_score, int policy_id,
                                      const Timestamp& timestamp, const nlohmann::json& details,
                                      const std::string& table_name =
                                          "signals.aggregated_signals") = 0;

    /**
     * @brief Instruments flagged active, ordered by venue then ticker
     */
    virtual Result<std::vector<Instrument>> get_active_instruments(
        const std::string& table_name = "market.instruments") = 0;

    /**
     * @brief Atomically take a workflow lease if it is absent or expired
     * @return true if the caller now holds the lease
     */
    virtual Result<bool> try_acquire_lease(const std::string& workflow_class,
                                           const std::string& owner, int64_t ttl_seconds,
                                           const std::string& table_name =
                                               "ops.workflow_leases") = 0;

    /**
     * @brief Release a lease only if owner still holds it
     * @return true if a row was deleted
     */
    virtual Result<bool> release_lease(const std::string& workflow_class,
                                       const std::string& owner,
                                       const std::string& table_name = "ops.workflow_leases") = 0;

    /**
     * @brief Current unexpired holder of a workflow lease
     */
    virtual Result<std::optional<ActiveWorkflowMarker>> get_lease(
        const std::string& workflow_class,
        const std::string& table_name = "ops.workflow_leases") = 0;

    /**
     * @brief Execute a custom SQL query
     */
    virtual Result<std::shared_ptr<arrow::Table>> execute_query(const std::string& query) = 0;

protected:
    virtual Result<void> validate_date_range(const Timestamp& start_date,
                                             const Timestamp& end_date) const {
        if (start_date > end_date) {
            return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                    "Start date must not be after end date", "DatabaseInterface");
        }
        return Result<void>();
    }
};

}  // namespace signal_ngin

// include/signal_ngin/data/postgres_database.hpp

#pragma once

#include <arrow/api.h>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <pqxx/pqxx>
#include <string>
#include <vector>
#include "signal_ngin/core/error.hpp"
#include "signal_ngin/core/logger.hpp"
#include "signal_ngin/core/types.hpp"
#include "signal_ngin/data/database_interface.hpp"

namespace signal_ngin {

/**
 * @brief Database interface for PostgreSQL
 *
 * One connection guarded by a mutex; every public call runs in its own
 * transaction.
 */
class PostgresDatabase : public DatabaseInterface {
public:
    /**
     * @brief Constructor
     * @param connection_string Connection string for PostgreSQL
     */
    explicit PostgresDatabase(std::string connection_string);

    ~PostgresDatabase() override;

    PostgresDatabase(const PostgresDatabase&) = delete;
    PostgresDatabase& operator=(const PostgresDatabase&) = delete;
    PostgresDatabase(PostgresDatabase&&) = delete;
    PostgresDatabase& operator=(PostgresDatabase&&) = delete;

    Result<void> connect() override;
    void disconnect() override;
    bool is_connected() const override;

    Result<std::shared_ptr<arrow::Table>> get_candles(
        const std::string& instrument, const std::string& timeframe, const Timestamp& start_date,
        const Timestamp& end_date, const std::string& table_name = "market.candles") override;

    Result<std::shared_ptr<arrow::Table>> get_latest_candle(
        const std::string& instrument, const std::string& timeframe,
        const std::string& table_name = "market.candles") override;

    Result<void> store_candles(const std::vector<Candle>& candles,
                               const std::string& table_name = "market.candles") override;

    Result<void> store_signal(const std::string& instrument, const std::string& signal_type,
                              double confidence, double bull_score, double bear_score,
                              int policy_id, const Timestamp& timestamp,
                              const nlohmann::json& details,
                              const std::string& table_name =
                                  "signals.aggregated_signals") override;

    Result<std::vector<Instrument>> get_active_instruments(
        const std::string& table_name = "market.instruments") override;

    Result<bool> try_acquire_lease(const std::string& workflow_class, const std::string& owner,
                                   int64_t ttl_seconds,
                                   const std::string& table_name = "ops.workflow_leases") override;

    Result<bool> release_lease(const std::string& workflow_class, const std::string& owner,
                               const std::string& table_name = "ops.workflow_leases") override;

    Result<std::optional<ActiveWorkflowMarker>> get_lease(
        const std::string& workflow_class,
        const std::string& table_name = "ops.workflow_leases") override;

    /**
     * @brief Execute a query and return the result as an Arrow table
     * Every column is returned as utf8.
     */
    Result<std::shared_ptr<arrow::Table>> execute_query(const std::string& query) override;

    const std::string& get_component_id() const {
        return component_id_;
    }

    /**
     * @brief Validate table name to prevent SQL injection
     */
    Result<void> validate_table_name(const std::string& table_name) const;

    /**
     * @brief Validate an instrument key or timeframe label
     */
    Result<void> validate_identifier(const std::string& identifier) const;

private:
    std::string connection_string_;
    std::unique_ptr<pqxx::connection> connection_;
    mutable std::mutex mutex_;
    std::string component_id_;

    Result<void> validate_connection() const;

    Result<std::shared_ptr<arrow::Table>> convert_candles_to_arrow(
        const pqxx::result& result) const;

    Result<std::shared_ptr<arrow::Table>> convert_generic_to_arrow(
        const pqxx::result& result) const;
};

}  // namespace signal_ngin

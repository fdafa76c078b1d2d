// include/signal_ngin/data/postgres_market_data.hpp
#pragma once

#include <memory>
#include <string>
#include "signal_ngin/data/database_interface.hpp"
#include "signal_ngin/data/market_data_source.hpp"
#include "signal_ngin/data/tick_ingestor.hpp"

namespace signal_ngin {

/**
 * @brief MarketDataSource backed by the candles table
 */
class PostgresMarketDataSource : public MarketDataSource {
public:
    explicit PostgresMarketDataSource(std::shared_ptr<DatabaseInterface> db,
                                      std::string table_name = "market.candles");

    Result<std::vector<Candle>> fetch_candles(const Instrument& instrument,
                                              const Timeframe& timeframe,
                                              const TimeWindow& window) override;

    Result<std::optional<Candle>> latest_candle(const Instrument& instrument,
                                                const Timeframe& timeframe) override;

private:
    std::shared_ptr<DatabaseInterface> db_;
    std::string table_name_;
};

/**
 * @brief CandleStore writing closed candles to the candles table
 */
class PostgresCandleStore : public CandleStore {
public:
    explicit PostgresCandleStore(std::shared_ptr<DatabaseInterface> db,
                                 std::string table_name = "market.candles")
        : db_(std::move(db)), table_name_(std::move(table_name)) {}

    Result<void> store_candles(const std::vector<Candle>& candles) override {
        return db_->store_candles(candles, table_name_);
    }

private:
    std::shared_ptr<DatabaseInterface> db_;
    std::string table_name_;
};

}  // namespace signal_ngin

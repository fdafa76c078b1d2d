// src/data/postgres_market_data.cpp

#include "signal_ngin/data/postgres_market_data.hpp"
#include <stdexcept>
#include "signal_ngin/data/conversion_utils.hpp"

namespace signal_ngin {

PostgresMarketDataSource::PostgresMarketDataSource(std::shared_ptr<DatabaseInterface> db,
                                                   std::string table_name)
    : db_(std::move(db)), table_name_(std::move(table_name)) {
    if (!db_) {
        throw std::invalid_argument("PostgresMarketDataSource requires a database");
    }
}

Result<std::vector<Candle>> PostgresMarketDataSource::fetch_candles(const Instrument& instrument,
                                                                    const Timeframe& timeframe,
                                                                    const TimeWindow& window) {
    auto table =
        db_->get_candles(instrument.key(), timeframe.label, window.start, window.end, table_name_);
    if (table.is_error()) {
        return make_error<std::vector<Candle>>(ErrorCode::DATA_UNAVAILABLE,
                                               table.error()->what(), "PostgresMarketDataSource");
    }
    return DataConversionUtils::arrow_table_to_candles(table.value());
}

Result<std::optional<Candle>> PostgresMarketDataSource::latest_candle(
    const Instrument& instrument, const Timeframe& timeframe) {
    auto table = db_->get_latest_candle(instrument.key(), timeframe.label, table_name_);
    if (table.is_error()) {
        return make_error<std::optional<Candle>>(ErrorCode::DATA_UNAVAILABLE,
                                                 table.error()->what(),
                                                 "PostgresMarketDataSource");
    }

    auto candles = DataConversionUtils::arrow_table_to_candles(table.value());
    if (candles.is_error()) {
        return make_error<std::optional<Candle>>(candles.error()->code(), candles.error()->what(),
                                                 "PostgresMarketDataSource");
    }

    if (candles.value().empty()) {
        return Result<std::optional<Candle>>(std::optional<Candle>());
    }
    return Result<std::optional<Candle>>(std::optional<Candle>(candles.value().back()));
}

}  // namespace signal_ngin

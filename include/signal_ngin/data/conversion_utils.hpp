// include/signal_ngin/data/conversion_utils.hpp
#pragma once

#include <arrow/api.h>
#include <memory>
#include <vector>
#include "signal_ngin/core/error.hpp"
#include "signal_ngin/core/types.hpp"

namespace signal_ngin {

class DataConversionUtils {
public:
    /**
     * @brief Convert an Arrow candle table to Candles
     * @param table Arrow table with columns time, instrument, timeframe,
     *        open, high, low, close, volume
     * @return Result containing candles in table order
     */
    static Result<std::vector<Candle>> arrow_table_to_candles(
        const std::shared_ptr<arrow::Table>& table);

private:
    static Result<Timestamp> extract_timestamp(const std::shared_ptr<arrow::Array>& array,
                                               int64_t index);

    static Result<double> extract_double(const std::shared_ptr<arrow::Array>& array,
                                         int64_t index);

    static Result<std::string> extract_string(const std::shared_ptr<arrow::Array>& array,
                                              int64_t index);
};

}  // namespace signal_ngin

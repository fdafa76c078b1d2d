// src/data/conversion_utils.cpp

#include "signal_ngin/data/conversion_utils.hpp"
#include <arrow/type_traits.h>

namespace signal_ngin {

Result<std::vector<Candle>> DataConversionUtils::arrow_table_to_candles(
    const std::shared_ptr<arrow::Table>& table) {
    if (!table) {
        return make_error<std::vector<Candle>>(ErrorCode::INVALID_ARGUMENT,
                                               "Table pointer is null", "DataConversionUtils");
    }

    const std::vector<std::string> required_columns = {
        "time", "instrument", "timeframe", "open", "high", "low", "close", "volume"};

    for (const auto& col : required_columns) {
        if (table->GetColumnByName(col) == nullptr) {
            return make_error<std::vector<Candle>>(ErrorCode::INVALID_DATA,
                                                   "Missing required column: " + col,
                                                   "DataConversionUtils");
        }
    }

    std::vector<Candle> candles;
    if (table->num_rows() == 0) {
        return candles;
    }

    try {
        // Builders in PostgresDatabase produce single-chunk columns
        auto combined = table->CombineChunks();
        if (!combined.ok()) {
            return make_error<std::vector<Candle>>(ErrorCode::CONVERSION_ERROR,
                                                   "Failed to combine chunks: " +
                                                       combined.status().ToString(),
                                                   "DataConversionUtils");
        }
        auto flat = *combined;

        auto time_array = flat->GetColumnByName("time")->chunk(0);
        auto instrument_array = flat->GetColumnByName("instrument")->chunk(0);
        auto timeframe_array = flat->GetColumnByName("timeframe")->chunk(0);
        auto open_array = flat->GetColumnByName("open")->chunk(0);
        auto high_array = flat->GetColumnByName("high")->chunk(0);
        auto low_array = flat->GetColumnByName("low")->chunk(0);
        auto close_array = flat->GetColumnByName("close")->chunk(0);
        auto volume_array = flat->GetColumnByName("volume")->chunk(0);

        candles.reserve(flat->num_rows());

        for (int64_t i = 0; i < flat->num_rows(); ++i) {
            auto ts_result = extract_timestamp(time_array, i);
            if (ts_result.is_error()) {
                return make_error<std::vector<Candle>>(ts_result.error()->code(),
                                                       ts_result.error()->what(),
                                                       "DataConversionUtils");
            }

            auto instrument_result = extract_string(instrument_array, i);
            auto timeframe_result = extract_string(timeframe_array, i);
            if (instrument_result.is_error() || timeframe_result.is_error()) {
                return make_error<std::vector<Candle>>(
                    ErrorCode::CONVERSION_ERROR,
                    "Error extracting instrument/timeframe at row " + std::to_string(i),
                    "DataConversionUtils");
            }

            auto open_result = extract_double(open_array, i);
            auto high_result = extract_double(high_array, i);
            auto low_result = extract_double(low_array, i);
            auto close_result = extract_double(close_array, i);
            auto volume_result = extract_double(volume_array, i);

            if (open_result.is_error() || high_result.is_error() || low_result.is_error() ||
                close_result.is_error() || volume_result.is_error()) {
                return make_error<std::vector<Candle>>(
                    ErrorCode::CONVERSION_ERROR,
                    "Error extracting OHLCV values at row " + std::to_string(i),
                    "DataConversionUtils");
            }

            candles.emplace_back(ts_result.value(), open_result.value(), high_result.value(),
                                 low_result.value(), close_result.value(), volume_result.value(),
                                 instrument_result.value(), timeframe_result.value());
        }

        return candles;

    } catch (const std::exception& e) {
        return make_error<std::vector<Candle>>(
            ErrorCode::CONVERSION_ERROR,
            std::string("Error converting table to candles: ") + e.what(), "DataConversionUtils");
    }
}

Result<Timestamp> DataConversionUtils::extract_timestamp(
    const std::shared_ptr<arrow::Array>& array, int64_t index) {
    if (!array || index < 0 || index >= array->length()) {
        return make_error<Timestamp>(ErrorCode::INVALID_ARGUMENT, "Invalid array or index",
                                     "DataConversionUtils");
    }

    if (array->type_id() != arrow::Type::TIMESTAMP) {
        return make_error<Timestamp>(ErrorCode::CONVERSION_ERROR,
                                     "Column is not a timestamp array", "DataConversionUtils");
    }

    auto ts_array = std::static_pointer_cast<arrow::TimestampArray>(array);
    if (ts_array->IsNull(index)) {
        return make_error<Timestamp>(ErrorCode::INVALID_DATA,
                                     "Null timestamp value at index " + std::to_string(index),
                                     "DataConversionUtils");
    }

    return Result<Timestamp>(Timestamp(std::chrono::seconds(ts_array->Value(index))));
}

Result<double> DataConversionUtils::extract_double(const std::shared_ptr<arrow::Array>& array,
                                                   int64_t index) {
    if (!array || index < 0 || index >= array->length()) {
        return make_error<double>(ErrorCode::INVALID_ARGUMENT, "Invalid array or index",
                                  "DataConversionUtils");
    }

    if (array->type_id() != arrow::Type::DOUBLE) {
        return make_error<double>(ErrorCode::CONVERSION_ERROR, "Column is not a double array",
                                  "DataConversionUtils");
    }

    auto double_array = std::static_pointer_cast<arrow::DoubleArray>(array);
    if (double_array->IsNull(index)) {
        return make_error<double>(ErrorCode::INVALID_DATA,
                                  "Null double value at index " + std::to_string(index),
                                  "DataConversionUtils");
    }

    return Result<double>(double_array->Value(index));
}

Result<std::string> DataConversionUtils::extract_string(const std::shared_ptr<arrow::Array>& array,
                                                        int64_t index) {
    if (!array || index < 0 || index >= array->length()) {
        return make_error<std::string>(ErrorCode::INVALID_ARGUMENT, "Invalid array or index",
                                       "DataConversionUtils");
    }

    if (array->type_id() != arrow::Type::STRING) {
        return make_error<std::string>(ErrorCode::CONVERSION_ERROR,
                                       "Column is not a string array", "DataConversionUtils");
    }

    auto string_array = std::static_pointer_cast<arrow::StringArray>(array);
    if (string_array->IsNull(index)) {
        return make_error<std::string>(ErrorCode::INVALID_DATA,
                                       "Null string value at index " + std::to_string(index),
                                       "DataConversionUtils");
    }

    return Result<std::string>(string_array->GetString(index));
}

}  // namespace signal_ngin

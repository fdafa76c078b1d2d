// src/data/postgres_database.cpp

#include "signal_ngin/data/postgres_database.hpp"
#include <algorithm>
#include <atomic>
#include <cctype>
#include "signal_ngin/core/state_manager.hpp"
#include "signal_ngin/core/time_utils.hpp"

namespace signal_ngin {

namespace {

std::shared_ptr<arrow::Schema> candle_schema() {
    return arrow::schema({arrow::field("time", arrow::timestamp(arrow::TimeUnit::SECOND)),
                          arrow::field("instrument", arrow::utf8()),
                          arrow::field("timeframe", arrow::utf8()),
                          arrow::field("open", arrow::float64()),
                          arrow::field("high", arrow::float64()),
                          arrow::field("low", arrow::float64()),
                          arrow::field("close", arrow::float64()),
                          arrow::field("volume", arrow::float64())});
}

// Candle queries return epoch seconds so no timezone parsing happens client side
const char* kCandleColumns =
    "EXTRACT(EPOCH FROM time)::bigint AS epoch, instrument, timeframe, "
    "open, high, low, close, volume";

}  // namespace

PostgresDatabase::PostgresDatabase(std::string connection_string)
    : connection_string_(std::move(connection_string)), connection_(nullptr) {
    Logger::register_component("PostgresDatabase");
}

PostgresDatabase::~PostgresDatabase() {
    disconnect();
}

Result<void> PostgresDatabase::connect() {
    std::lock_guard<std::mutex> lock(mutex_);

    try {
        connection_ = std::make_unique<pqxx::connection>(connection_string_);
        if (!connection_->is_open()) {
            return make_error<void>(ErrorCode::CONNECTION_ERROR,
                                    "Failed to open database connection", "PostgresDatabase");
        }

        static std::atomic<int> counter{0};
        std::string unique_id = "POSTGRES_DB_" + std::to_string(++counter);

        ComponentInfo info{ComponentType::DATABASE,
                           ComponentState::INITIALIZED,
                           unique_id,
                           "",
                           std::chrono::system_clock::now(),
                           {}};

        auto register_result = StateManager::instance().register_component(info);
        if (register_result.is_error()) {
            // The connection is still usable without state tracking
            WARN("Failed to register database with StateManager: "
                 << register_result.error()->what());
        } else {
            component_id_ = unique_id;
            auto state_result =
                StateManager::instance().update_state(component_id_, ComponentState::RUNNING);
            if (state_result.is_error()) {
                WARN("Failed to mark database RUNNING: " << state_result.error()->what());
            }
            INFO("Connected to PostgreSQL database with ID: " << component_id_);
        }

        return Result<void>();

    } catch (const std::exception& e) {
        return make_error<void>(ErrorCode::CONNECTION_ERROR,
                                "Database connection error: " + std::string(e.what()),
                                "PostgresDatabase");
    }
}

void PostgresDatabase::disconnect() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (connection_ && connection_->is_open()) {
        connection_->close();
        connection_.reset();

        if (!component_id_.empty()) {
            auto unregister_result = StateManager::instance().unregister_component(component_id_);
            if (unregister_result.is_error()) {
                WARN("Error unregistering database component: "
                     << unregister_result.error()->what());
            }
            component_id_.clear();
        }

        INFO("Disconnected from PostgreSQL database");
    }
}

bool PostgresDatabase::is_connected() const {
    return connection_ && connection_->is_open();
}

Result<void> PostgresDatabase::validate_connection() const {
    if (!is_connected()) {
        return make_error<void>(ErrorCode::CONNECTION_ERROR, "Not connected to database",
                                "PostgresDatabase");
    }
    return Result<void>();
}

Result<std::shared_ptr<arrow::Table>> PostgresDatabase::get_candles(
    const std::string& instrument, const std::string& timeframe, const Timestamp& start_date,
    const Timestamp& end_date, const std::string& table_name) {
    auto range = validate_date_range(start_date, end_date);
    if (range.is_error()) {
        return make_error<std::shared_ptr<arrow::Table>>(range.error()->code(),
                                                         range.error()->what(), "PostgresDatabase");
    }
    for (const auto* check : {&instrument, &timeframe}) {
        auto valid = validate_identifier(*check);
        if (valid.is_error()) {
            return make_error<std::shared_ptr<arrow::Table>>(
                valid.error()->code(), valid.error()->what(), "PostgresDatabase");
        }
    }
    auto table_validation = validate_table_name(table_name);
    if (table_validation.is_error()) {
        return make_error<std::shared_ptr<arrow::Table>>(table_validation.error()->code(),
                                                         table_validation.error()->what(),
                                                         "PostgresDatabase");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto validation = validate_connection();
    if (validation.is_error()) {
        return make_error<std::shared_ptr<arrow::Table>>(
            validation.error()->code(), validation.error()->what(), "PostgresDatabase");
    }

    try {
        pqxx::work txn(*connection_);
        std::string query = std::string("SELECT ") + kCandleColumns + " FROM " + table_name +
                            " WHERE instrument = $1 AND timeframe = $2"
                            " AND time >= to_timestamp($3) AND time <= to_timestamp($4)"
                            " ORDER BY time ASC";
        auto result = txn.exec_params(query, instrument, timeframe,
                                      core::to_epoch_seconds(start_date),
                                      core::to_epoch_seconds(end_date));
        txn.commit();

        DEBUG("Fetched " << result.size() << " " << timeframe << " candles for " << instrument);
        return convert_candles_to_arrow(result);

    } catch (const std::exception& e) {
        return make_error<std::shared_ptr<arrow::Table>>(
            ErrorCode::DATABASE_ERROR, "Failed to fetch candles: " + std::string(e.what()),
            "PostgresDatabase");
    }
}

Result<std::shared_ptr<arrow::Table>> PostgresDatabase::get_latest_candle(
    const std::string& instrument, const std::string& timeframe, const std::string& table_name) {
    for (const auto* check : {&instrument, &timeframe}) {
        auto valid = validate_identifier(*check);
        if (valid.is_error()) {
            return make_error<std::shared_ptr<arrow::Table>>(
                valid.error()->code(), valid.error()->what(), "PostgresDatabase");
        }
    }
    auto table_validation = validate_table_name(table_name);
    if (table_validation.is_error()) {
        return make_error<std::shared_ptr<arrow::Table>>(table_validation.error()->code(),
                                                         table_validation.error()->what(),
                                                         "PostgresDatabase");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto validation = validate_connection();
    if (validation.is_error()) {
        return make_error<std::shared_ptr<arrow::Table>>(
            validation.error()->code(), validation.error()->what(), "PostgresDatabase");
    }

    try {
        pqxx::work txn(*connection_);
        std::string query = std::string("SELECT ") + kCandleColumns + " FROM " + table_name +
                            " WHERE instrument = $1 AND timeframe = $2"
                            " ORDER BY time DESC LIMIT 1";
        auto result = txn.exec_params(query, instrument, timeframe);
        txn.commit();
        return convert_candles_to_arrow(result);

    } catch (const std::exception& e) {
        return make_error<std::shared_ptr<arrow::Table>>(
            ErrorCode::DATABASE_ERROR, "Failed to fetch latest candle: " + std::string(e.what()),
            "PostgresDatabase");
    }
}

Result<void> PostgresDatabase::store_candles(const std::vector<Candle>& candles,
                                             const std::string& table_name) {
    auto table_validation = validate_table_name(table_name);
    if (table_validation.is_error()) {
        return table_validation;
    }
    if (candles.empty()) {
        return Result<void>();
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto validation = validate_connection();
    if (validation.is_error()) {
        return validation;
    }

    try {
        pqxx::work txn(*connection_);

        std::string query = "INSERT INTO " + table_name +
                            " (instrument, timeframe, time, open, high, low, close, volume)"
                            " VALUES ($1, $2, to_timestamp($3), $4, $5, $6, $7, $8)"
                            " ON CONFLICT (instrument, timeframe, time) DO UPDATE SET"
                            " open = EXCLUDED.open, high = EXCLUDED.high, low = EXCLUDED.low,"
                            " close = EXCLUDED.close, volume = EXCLUDED.volume";

        for (const auto& candle : candles) {
            txn.exec_params(query, candle.instrument, candle.timeframe,
                            core::to_epoch_seconds(candle.timestamp), candle.open, candle.high,
                            candle.low, candle.close, candle.volume);
        }

        txn.commit();
        DEBUG("Stored " << candles.size() << " candles into " << table_name);
        return Result<void>();

    } catch (const std::exception& e) {
        return make_error<void>(ErrorCode::DATABASE_ERROR,
                                "Failed to store candles: " + std::string(e.what()),
                                "PostgresDatabase");
    }
}

Result<void> PostgresDatabase::store_signal(const std::string& instrument,
                                            const std::string& signal_type, double confidence,
                                            double bull_score, double bear_score, int policy_id,
                                            const Timestamp& timestamp,
                                            const nlohmann::json& details,
                                            const std::string& table_name) {
    auto table_validation = validate_table_name(table_name);
    if (table_validation.is_error()) {
        return table_validation;
    }
    auto instrument_validation = validate_identifier(instrument);
    if (instrument_validation.is_error()) {
        return instrument_validation;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto validation = validate_connection();
    if (validation.is_error()) {
        return validation;
    }

    try {
        pqxx::work txn(*connection_);
        std::string query = "INSERT INTO " + table_name +
                            " (instrument, signal_type, confidence, bull_score, bear_score,"
                            " policy_id, signal_time, details)"
                            " VALUES ($1, $2, $3, $4, $5, $6, to_timestamp($7), $8::jsonb)";
        txn.exec_params(query, instrument, signal_type, confidence, bull_score, bear_score,
                        policy_id, core::to_epoch_seconds(timestamp), details.dump());
        txn.commit();
        return Result<void>();

    } catch (const std::exception& e) {
        return make_error<void>(ErrorCode::DATABASE_ERROR,
                                "Failed to store signal: " + std::string(e.what()),
                                "PostgresDatabase");
    }
}

Result<std::vector<Instrument>> PostgresDatabase::get_active_instruments(
    const std::string& table_name) {
    auto table_validation = validate_table_name(table_name);
    if (table_validation.is_error()) {
        return make_error<std::vector<Instrument>>(table_validation.error()->code(),
                                                   table_validation.error()->what(),
                                                   "PostgresDatabase");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto validation = validate_connection();
    if (validation.is_error()) {
        return make_error<std::vector<Instrument>>(validation.error()->code(),
                                                   validation.error()->what(), "PostgresDatabase");
    }

    try {
        pqxx::work txn(*connection_);
        auto result = txn.exec("SELECT ticker, venue FROM " + table_name +
                               " WHERE active = true ORDER BY venue, ticker");
        txn.commit();

        std::vector<Instrument> instruments;
        instruments.reserve(result.size());
        for (const auto& row : result) {
            instruments.emplace_back(row["ticker"].as<std::string>(),
                                     row["venue"].as<std::string>(), true);
        }
        return instruments;

    } catch (const std::exception& e) {
        return make_error<std::vector<Instrument>>(
            ErrorCode::DATABASE_ERROR, "Failed to load instruments: " + std::string(e.what()),
            "PostgresDatabase");
    }
}

Result<bool> PostgresDatabase::try_acquire_lease(const std::string& workflow_class,
                                                 const std::string& owner, int64_t ttl_seconds,
                                                 const std::string& table_name) {
    auto table_validation = validate_table_name(table_name);
    if (table_validation.is_error()) {
        return make_error<bool>(table_validation.error()->code(),
                                table_validation.error()->what(), "PostgresDatabase");
    }
    if (ttl_seconds <= 0) {
        return make_error<bool>(ErrorCode::INVALID_ARGUMENT, "Lease TTL must be positive",
                                "PostgresDatabase");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto validation = validate_connection();
    if (validation.is_error()) {
        return make_error<bool>(validation.error()->code(), validation.error()->what(),
                                "PostgresDatabase");
    }

    try {
        pqxx::work txn(*connection_);
        // Single statement: insert, or take over only a row whose lease has expired
        std::string query = "INSERT INTO " + table_name +
                            " AS l (workflow_class, owner, acquired_at, expires_at)"
                            " VALUES ($1, $2, now(), now() + make_interval(secs => $3))"
                            " ON CONFLICT (workflow_class) DO UPDATE SET"
                            " owner = EXCLUDED.owner, acquired_at = EXCLUDED.acquired_at,"
                            " expires_at = EXCLUDED.expires_at"
                            " WHERE l.expires_at <= now()"
                            " RETURNING owner";
        auto result =
            txn.exec_params(query, workflow_class, owner, static_cast<double>(ttl_seconds));
        txn.commit();
        return Result<bool>(!result.empty());

    } catch (const std::exception& e) {
        return make_error<bool>(ErrorCode::DATABASE_ERROR,
                                "Failed to acquire lease: " + std::string(e.what()),
                                "PostgresDatabase");
    }
}

Result<bool> PostgresDatabase::release_lease(const std::string& workflow_class,
                                             const std::string& owner,
                                             const std::string& table_name) {
    auto table_validation = validate_table_name(table_name);
    if (table_validation.is_error()) {
        return make_error<bool>(table_validation.error()->code(),
                                table_validation.error()->what(), "PostgresDatabase");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto validation = validate_connection();
    if (validation.is_error()) {
        return make_error<bool>(validation.error()->code(), validation.error()->what(),
                                "PostgresDatabase");
    }

    try {
        pqxx::work txn(*connection_);
        auto result = txn.exec_params("DELETE FROM " + table_name +
                                          " WHERE workflow_class = $1 AND owner = $2"
                                          " RETURNING workflow_class",
                                      workflow_class, owner);
        txn.commit();
        return Result<bool>(!result.empty());

    } catch (const std::exception& e) {
        return make_error<bool>(ErrorCode::DATABASE_ERROR,
                                "Failed to release lease: " + std::string(e.what()),
                                "PostgresDatabase");
    }
}

Result<std::optional<ActiveWorkflowMarker>> PostgresDatabase::get_lease(
    const std::string& workflow_class, const std::string& table_name) {
    using MarkerResult = Result<std::optional<ActiveWorkflowMarker>>;

    auto table_validation = validate_table_name(table_name);
    if (table_validation.is_error()) {
        return make_error<std::optional<ActiveWorkflowMarker>>(
            table_validation.error()->code(), table_validation.error()->what(),
            "PostgresDatabase");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto validation = validate_connection();
    if (validation.is_error()) {
        return make_error<std::optional<ActiveWorkflowMarker>>(
            validation.error()->code(), validation.error()->what(), "PostgresDatabase");
    }

    try {
        pqxx::work txn(*connection_);
        auto result = txn.exec_params(
            "SELECT owner, EXTRACT(EPOCH FROM acquired_at)::bigint AS acquired,"
            " EXTRACT(EPOCH FROM expires_at)::bigint AS expires FROM " +
                table_name + " WHERE workflow_class = $1 AND expires_at > now()",
            workflow_class);
        txn.commit();

        if (result.empty()) {
            return MarkerResult(std::optional<ActiveWorkflowMarker>());
        }

        const auto& row = result[0];
        ActiveWorkflowMarker marker;
        marker.workflow_class = workflow_class;
        marker.owner = row["owner"].as<std::string>();
        marker.acquired_at = core::from_epoch_seconds(row["acquired"].as<int64_t>());
        marker.expires_at = core::from_epoch_seconds(row["expires"].as<int64_t>());
        return MarkerResult(std::optional<ActiveWorkflowMarker>(marker));

    } catch (const std::exception& e) {
        return make_error<std::optional<ActiveWorkflowMarker>>(
            ErrorCode::DATABASE_ERROR, "Failed to read lease: " + std::string(e.what()),
            "PostgresDatabase");
    }
}

Result<std::shared_ptr<arrow::Table>> PostgresDatabase::execute_query(const std::string& query) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto validation = validate_connection();
    if (validation.is_error()) {
        return make_error<std::shared_ptr<arrow::Table>>(
            validation.error()->code(), validation.error()->what(), "PostgresDatabase");
    }

    try {
        pqxx::work txn(*connection_);
        auto result = txn.exec(query);
        txn.commit();
        return convert_generic_to_arrow(result);

    } catch (const std::exception& e) {
        return make_error<std::shared_ptr<arrow::Table>>(
            ErrorCode::DATABASE_ERROR, "Failed to execute query: " + std::string(e.what()),
            "PostgresDatabase");
    }
}

Result<std::shared_ptr<arrow::Table>> PostgresDatabase::convert_candles_to_arrow(
    const pqxx::result& result) const {
    arrow::MemoryPool* pool = arrow::default_memory_pool();

    arrow::TimestampBuilder time_builder(arrow::timestamp(arrow::TimeUnit::SECOND), pool);
    arrow::StringBuilder instrument_builder(pool);
    arrow::StringBuilder timeframe_builder(pool);
    arrow::DoubleBuilder open_builder(pool);
    arrow::DoubleBuilder high_builder(pool);
    arrow::DoubleBuilder low_builder(pool);
    arrow::DoubleBuilder close_builder(pool);
    arrow::DoubleBuilder volume_builder(pool);

    auto handle_builder_error = [](const std::string& operation) {
        return make_error<std::shared_ptr<arrow::Table>>(
            ErrorCode::CONVERSION_ERROR, "Arrow builder error during " + operation,
            "PostgresDatabase");
    };

    try {
        const auto rows = static_cast<int64_t>(result.size());
        if (!time_builder.Reserve(rows).ok() || !instrument_builder.Reserve(rows).ok() ||
            !timeframe_builder.Reserve(rows).ok() || !open_builder.Reserve(rows).ok() ||
            !high_builder.Reserve(rows).ok() || !low_builder.Reserve(rows).ok() ||
            !close_builder.Reserve(rows).ok() || !volume_builder.Reserve(rows).ok()) {
            return handle_builder_error("reserve");
        }

        for (const auto& row : result) {
            if (!time_builder.Append(row["epoch"].as<int64_t>()).ok() ||
                !instrument_builder.Append(row["instrument"].as<std::string>()).ok() ||
                !timeframe_builder.Append(row["timeframe"].as<std::string>()).ok() ||
                !open_builder.Append(row["open"].as<double>()).ok() ||
                !high_builder.Append(row["high"].as<double>()).ok() ||
                !low_builder.Append(row["low"].as<double>()).ok() ||
                !close_builder.Append(row["close"].as<double>()).ok() ||
                !volume_builder.Append(row["volume"].as<double>()).ok()) {
                return handle_builder_error("append");
            }
        }

        std::shared_ptr<arrow::Array> time_array, instrument_array, timeframe_array, open_array,
            high_array, low_array, close_array, volume_array;

        if (!time_builder.Finish(&time_array).ok() ||
            !instrument_builder.Finish(&instrument_array).ok() ||
            !timeframe_builder.Finish(&timeframe_array).ok() ||
            !open_builder.Finish(&open_array).ok() || !high_builder.Finish(&high_array).ok() ||
            !low_builder.Finish(&low_array).ok() || !close_builder.Finish(&close_array).ok() ||
            !volume_builder.Finish(&volume_array).ok()) {
            return handle_builder_error("finish");
        }

        auto table = arrow::Table::Make(candle_schema(),
                                        {time_array, instrument_array, timeframe_array,
                                         open_array, high_array, low_array, close_array,
                                         volume_array});
        return Result<std::shared_ptr<arrow::Table>>(table);

    } catch (const std::exception& e) {
        return make_error<std::shared_ptr<arrow::Table>>(
            ErrorCode::CONVERSION_ERROR,
            "Exception during Arrow table conversion: " + std::string(e.what()),
            "PostgresDatabase");
    }
}

Result<std::shared_ptr<arrow::Table>> PostgresDatabase::convert_generic_to_arrow(
    const pqxx::result& result) const {
    try {
        arrow::MemoryPool* pool = arrow::default_memory_pool();
        std::vector<std::shared_ptr<arrow::Field>> fields;
        std::vector<std::shared_ptr<arrow::Array>> arrays;

        for (pqxx::row::size_type col = 0; col < result.columns(); ++col) {
            std::string col_name = result.column_name(col);
            arrow::StringBuilder builder(pool);

            if (!builder.Reserve(static_cast<int64_t>(result.size())).ok()) {
                return make_error<std::shared_ptr<arrow::Table>>(
                    ErrorCode::CONVERSION_ERROR, "Failed to reserve memory for column: " + col_name,
                    "PostgresDatabase");
            }

            for (const auto& row : result) {
                arrow::Status status = row[col].is_null()
                                           ? builder.AppendNull()
                                           : builder.Append(row[col].as<std::string>());
                if (!status.ok()) {
                    return make_error<std::shared_ptr<arrow::Table>>(
                        ErrorCode::CONVERSION_ERROR, "Failed to append value for column: " + col_name,
                        "PostgresDatabase");
                }
            }

            std::shared_ptr<arrow::Array> array;
            if (!builder.Finish(&array).ok()) {
                return make_error<std::shared_ptr<arrow::Table>>(
                    ErrorCode::CONVERSION_ERROR, "Failed to finish array for column: " + col_name,
                    "PostgresDatabase");
            }

            fields.push_back(arrow::field(col_name, arrow::utf8()));
            arrays.push_back(array);
        }

        return Result<std::shared_ptr<arrow::Table>>(arrow::Table::Make(arrow::schema(fields), arrays));

    } catch (const std::exception& e) {
        return make_error<std::shared_ptr<arrow::Table>>(
            ErrorCode::CONVERSION_ERROR,
            "Exception during generic Arrow table conversion: " + std::string(e.what()),
            "PostgresDatabase");
    }
}

Result<void> PostgresDatabase::validate_table_name(const std::string& table_name) const {
    if (table_name.empty() || table_name.size() > 100) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Invalid table_name: must be 1-100 characters", "PostgresDatabase");
    }

    // schema.table with alphanumerics and underscores only
    for (char c : table_name) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_' && c != '.') {
            return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                    "Invalid table_name: contains invalid characters",
                                    "PostgresDatabase");
        }
    }

    std::string lower_name = table_name;
    std::transform(lower_name.begin(), lower_name.end(), lower_name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    static const std::vector<std::string> forbidden = {"drop",  "delete", "insert", "alter",
                                                       "union", "select", "truncate"};
    for (const auto& forbidden_word : forbidden) {
        if (lower_name.find(forbidden_word) != std::string::npos) {
            return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                    "Invalid table_name: contains forbidden SQL keywords",
                                    "PostgresDatabase");
        }
    }

    return Result<void>();
}

Result<void> PostgresDatabase::validate_identifier(const std::string& identifier) const {
    if (identifier.empty() || identifier.size() > 64) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Invalid identifier: must be 1-64 characters", "PostgresDatabase");
    }

    for (char c : identifier) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_' && c != '.' && c != '-' &&
            c != ':') {
            return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                    "Invalid identifier '" + identifier +
                                        "': contains invalid characters",
                                    "PostgresDatabase");
        }
    }

    return Result<void>();
}

}  // namespace signal_ngin

// include/signal_ngin/core/config_loader.hpp
#pragma once

#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>
#include "signal_ngin/core/config_base.hpp"
#include "signal_ngin/core/error.hpp"
#include "signal_ngin/core/logger.hpp"
#include "signal_ngin/pipeline/pipeline_executor.hpp"
#include "signal_ngin/scheduler/market_calendar.hpp"
#include "signal_ngin/scheduler/scheduler.hpp"
#include "signal_ngin/scheduler/worker_pool_job_queue.hpp"
#include "signal_ngin/strategy/config_registry.hpp"

namespace signal_ngin {

/**
 * @brief Database configuration
 *
 * A non-empty url takes precedence over the individual fields.
 */
struct DatabaseConfig : public ConfigBase {
    std::string url;
    std::string host{"localhost"};
    std::string port{"5432"};
    std::string username;
    std::string password;
    std::string name;
    std::string candles_table{"market.candles"};
    std::string instruments_table{"market.instruments"};
    std::string signals_table{"signals.aggregated_signals"};
    std::string leases_table{"ops.workflow_leases"};

    std::string get_connection_string() const {
        if (!url.empty()) {
            return url;
        }
        return "postgresql://" + username + ":" + password + "@" + host + ":" + port + "/" +
               name;
    }

    nlohmann::json to_json() const override {
        nlohmann::json j;
        j["url"] = url;
        j["host"] = host;
        j["port"] = port;
        j["username"] = username;
        j["password"] = password;
        j["name"] = name;
        j["candles_table"] = candles_table;
        j["instruments_table"] = instruments_table;
        j["signals_table"] = signals_table;
        j["leases_table"] = leases_table;
        return j;
    }

    void from_json(const nlohmann::json& j) override {
        read_field(j, "url", url);
        read_field(j, "host", host);
        if (j.contains("port")) {
            const auto& p = j.at("port");
            if (p.is_number_integer()) {
                port = std::to_string(p.get<int>());
            } else {
                read_field(j, "port", port);
            }
        }
        read_field(j, "username", username);
        read_field(j, "password", password);
        read_field(j, "name", name);
        read_field(j, "candles_table", candles_table);
        read_field(j, "instruments_table", instruments_table);
        read_field(j, "signals_table", signals_table);
        read_field(j, "leases_table", leases_table);
    }

    std::string section_name() const override {
        return "database";
    }
};

/**
 * @brief Consolidated application configuration
 *
 * Sections: logging, database, pipeline, scheduler, job_queue, calendar,
 * registry. instrument_source is "registry" or "database"; lease_store is
 * "postgres" or "memory".
 */
struct AppConfig {
    LoggerConfig logging;
    DatabaseConfig database;
    PipelineConfig pipeline;
    SchedulerConfig scheduler;
    JobQueueConfig job_queue;
    MarketCalendarConfig calendar;
    RegistryConfig registry;
    std::string instrument_source{"registry"};
    std::string lease_store{"postgres"};

    nlohmann::json to_json() const;
};

/**
 * @brief Loads AppConfig from a single JSON file
 *
 * The environment variable SIGNAL_NGIN_DB_URL, when set, replaces
 * database.url after the file is read.
 */
class ConfigLoader {
public:
    static constexpr const char* DB_URL_ENV = "SIGNAL_NGIN_DB_URL";

    /**
     * @brief Load, apply environment overrides and validate
     * @param config_file_path Path to the JSON configuration
     */
    static Result<AppConfig> load(const std::filesystem::path& config_file_path);

    /**
     * @brief Build a config from an already parsed JSON document
     */
    static Result<AppConfig> from_json(const nlohmann::json& j);

    static Result<nlohmann::json> load_json_file(const std::filesystem::path& file_path);

    /**
     * @brief Recursively merge JSON objects, source overriding target
     */
    static void merge_json(nlohmann::json& target, const nlohmann::json& source);

    static Result<void> validate_config(const AppConfig& config);

private:
    static Result<AppConfig> extract_config(const nlohmann::json& merged);
    static void apply_environment(AppConfig& config);
    static void log_config_summary(const AppConfig& config);
};

}  // namespace signal_ngin

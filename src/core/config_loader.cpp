// src/core/config_loader.cpp

#include "signal_ngin/core/config_loader.hpp"

#include <cstdlib>
#include <fstream>
#include <set>
#include <utility>
#include <vector>

namespace signal_ngin {

nlohmann::json AppConfig::to_json() const {
    nlohmann::json j;
    j["logging"] = logging.to_json();
    j["database"] = database.to_json();
    j["pipeline"] = pipeline.to_json();
    j["scheduler"] = scheduler.to_json();
    j["job_queue"] = job_queue.to_json();
    j["calendar"] = calendar.to_json();
    j["registry"] = registry.to_json();
    j["instrument_source"] = instrument_source;
    j["lease_store"] = lease_store;
    return j;
}

Result<nlohmann::json> ConfigLoader::load_json_file(const std::filesystem::path& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        return make_error<nlohmann::json>(ErrorCode::FILE_NOT_FOUND,
                                          "Failed to open config file: " + file_path.string(),
                                          "ConfigLoader");
    }

    try {
        nlohmann::json j;
        file >> j;
        return j;
    } catch (const nlohmann::json::parse_error& e) {
        return make_error<nlohmann::json>(
            ErrorCode::JSON_PARSE_ERROR,
            "Failed to parse JSON file " + file_path.string() + ": " + e.what(), "ConfigLoader");
    } catch (const std::exception& e) {
        return make_error<nlohmann::json>(ErrorCode::FILE_IO_ERROR,
                                          "Error reading config file " + file_path.string() + ": " +
                                              e.what(),
                                          "ConfigLoader");
    }
}

void ConfigLoader::merge_json(nlohmann::json& target, const nlohmann::json& source) {
    for (auto it = source.begin(); it != source.end(); ++it) {
        const auto& key = it.key();
        const auto& value = it.value();

        if (target.contains(key) && target[key].is_object() && value.is_object()) {
            merge_json(target[key], value);
        } else {
            target[key] = value;
        }
    }
}

Result<AppConfig> ConfigLoader::extract_config(const nlohmann::json& merged) {
    if (!merged.is_object()) {
        return make_error<AppConfig>(ErrorCode::CONFIGURATION_ERROR,
                                     "Configuration root must be a JSON object", "ConfigLoader");
    }

    AppConfig config;
    const std::vector<std::pair<std::string, ConfigBase*>> sections = {
        {"logging", &config.logging},     {"database", &config.database},
        {"pipeline", &config.pipeline},   {"scheduler", &config.scheduler},
        {"job_queue", &config.job_queue}, {"calendar", &config.calendar},
        {"registry", &config.registry}};

    for (const auto& [key, section] : sections) {
        if (!merged.contains(key)) {
            continue;
        }
        auto loaded = section->load_from_json(merged.at(key));
        if (loaded.is_error()) {
            return make_error<AppConfig>(loaded.error()->code(), loaded.error()->what(),
                                         "ConfigLoader");
        }
    }

    try {
        if (merged.contains("instrument_source")) {
            config.instrument_source = merged.at("instrument_source").get<std::string>();
        }
        if (merged.contains("lease_store")) {
            config.lease_store = merged.at("lease_store").get<std::string>();
        }
    } catch (const nlohmann::json::exception& e) {
        return make_error<AppConfig>(ErrorCode::CONFIGURATION_ERROR,
                                     "Failed to extract config: " + std::string(e.what()),
                                     "ConfigLoader");
    }
    return config;
}

void ConfigLoader::apply_environment(AppConfig& config) {
    const char* url = std::getenv(DB_URL_ENV);
    if (url != nullptr && *url != '\0') {
        config.database.url = url;
    }
}

Result<void> ConfigLoader::validate_config(const AppConfig& config) {
    if (config.instrument_source != "registry" && config.instrument_source != "database") {
        return make_error<void>(ErrorCode::CONFIGURATION_ERROR,
                                "instrument_source must be 'registry' or 'database', got '" +
                                    config.instrument_source + "'",
                                "ConfigLoader");
    }
    if (config.lease_store != "postgres" && config.lease_store != "memory") {
        return make_error<void>(ErrorCode::CONFIGURATION_ERROR,
                                "lease_store must be 'postgres' or 'memory', got '" +
                                    config.lease_store + "'",
                                "ConfigLoader");
    }
    if (config.database.url.empty() &&
        (config.database.host.empty() || config.database.username.empty() ||
         config.database.name.empty())) {
        return make_error<void>(ErrorCode::CONFIGURATION_ERROR,
                                "Missing required database configuration fields (set database.url, "
                                "host/username/name or " +
                                    std::string(DB_URL_ENV) + ")",
                                "ConfigLoader");
    }
    // Sections not present in the file still carry their defaults
    for (const ConfigBase* section :
         {static_cast<const ConfigBase*>(&config.pipeline),
          static_cast<const ConfigBase*>(&config.scheduler),
          static_cast<const ConfigBase*>(&config.job_queue)}) {
        auto valid = section->validate();
        if (valid.is_error()) {
            return valid;
        }
    }

    std::set<std::string> queue_names;
    for (const auto& q : config.job_queue.queues) {
        queue_names.insert(q.name);
    }
    if (queue_names.count(config.scheduler.backfill_queue) == 0) {
        return make_error<void>(ErrorCode::CONFIGURATION_ERROR,
                                "scheduler.backfill_queue '" + config.scheduler.backfill_queue +
                                    "' is not a configured job queue",
                                "ConfigLoader");
    }
    for (const auto& group : config.scheduler.groups) {
        if (queue_names.count(group.queue) == 0) {
            return make_error<void>(ErrorCode::CONFIGURATION_ERROR,
                                    "Venue group '" + group.name + "' routes to unknown queue '" +
                                        group.queue + "'",
                                    "ConfigLoader");
        }
    }
    return Result<void>();
}

void ConfigLoader::log_config_summary(const AppConfig& config) {
    auto& logger = Logger::instance();
    if (!logger.is_initialized()) {
        return;
    }
    INFO("Config summary: db=" << (config.database.url.empty()
                                       ? config.database.host + ":" + config.database.port + "/" +
                                             config.database.name
                                       : std::string("<url>"))
                               << ", instrument_source=" << config.instrument_source
                               << ", lease_store=" << config.lease_store);
    INFO("Config summary: cadence=" << config.scheduler.cadence_seconds
                                    << "s, groups=" << config.scheduler.groups.size()
                                    << ", queues=" << config.job_queue.queues.size()
                                    << ", backfill_days=" << config.pipeline.backfill_days);
    INFO("Config summary: timeframes=" << config.registry.timeframes.size()
                                       << ", policies=" << config.registry.policies.size()
                                       << ", instruments=" << config.registry.instruments.size());
}

Result<AppConfig> ConfigLoader::from_json(const nlohmann::json& j) {
    auto config_result = extract_config(j);
    if (config_result.is_error()) {
        return config_result;
    }
    AppConfig config = config_result.take_value();
    apply_environment(config);

    auto validation_result = validate_config(config);
    if (validation_result.is_error()) {
        return make_error<AppConfig>(validation_result.error()->code(),
                                     validation_result.error()->what(), "ConfigLoader");
    }

    log_config_summary(config);
    return config;
}

Result<AppConfig> ConfigLoader::load(const std::filesystem::path& config_file_path) {
    auto json_result = load_json_file(config_file_path);
    if (json_result.is_error()) {
        return make_error<AppConfig>(json_result.error()->code(),
                                     "Failed to load config: " +
                                         std::string(json_result.error()->what()),
                                     "ConfigLoader");
    }
    return from_json(json_result.value());
}

}  // namespace signal_ngin

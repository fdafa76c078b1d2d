// src/strategy/config_registry.cpp

#include "signal_ngin/strategy/config_registry.hpp"
#include <algorithm>
#include <set>
#include "signal_ngin/core/logger.hpp"

namespace signal_ngin {

nlohmann::json RegistryConfig::to_json() const {
    nlohmann::json j;
    j["timeframes"] = timeframes;
    j["default_policy_id"] = default_policy_id;
    j["include_builtin_policies"] = include_builtin_policies;

    nlohmann::json policy_array = nlohmann::json::array();
    for (const auto& policy : policies) {
        policy_array.push_back(policy.to_json());
    }
    j["policies"] = policy_array;

    nlohmann::json defaults = nlohmann::json::object();
    for (const auto& [tf, pair] : default_thresholds) {
        defaults[tf] = pair.to_json();
    }
    j["default_thresholds"] = defaults;

    nlohmann::json per_instrument = nlohmann::json::object();
    for (const auto& [key, by_tf] : instrument_thresholds) {
        nlohmann::json entry = nlohmann::json::object();
        for (const auto& [tf, pair] : by_tf) {
            entry[tf] = pair.to_json();
        }
        per_instrument[key] = entry;
    }
    j["instrument_thresholds"] = per_instrument;

    nlohmann::json instrument_array = nlohmann::json::array();
    for (const auto& instrument : instruments) {
        instrument_array.push_back(instrument.to_json());
    }
    j["instruments"] = instrument_array;
    return j;
}

void RegistryConfig::from_json(const nlohmann::json& j) {
    read_field(j, "timeframes", timeframes);
    read_field(j, "default_policy_id", default_policy_id);
    read_field(j, "include_builtin_policies", include_builtin_policies);

    if (j.contains("policies")) {
        policies.clear();
        for (const auto& item : j.at("policies")) {
            PolicyDefinition definition;
            definition.from_json(item);
            policies.push_back(definition);
        }
    }

    if (j.contains("default_thresholds")) {
        default_thresholds.clear();
        for (const auto& [tf, value] : j.at("default_thresholds").items()) {
            ThresholdPair pair;
            pair.from_json(value);
            default_thresholds[tf] = pair;
        }
    }

    if (j.contains("instrument_thresholds")) {
        instrument_thresholds.clear();
        for (const auto& [key, by_tf] : j.at("instrument_thresholds").items()) {
            for (const auto& [tf, value] : by_tf.items()) {
                ThresholdPair pair;
                pair.from_json(value);
                instrument_thresholds[key][tf] = pair;
            }
        }
    }

    if (j.contains("instruments")) {
        instruments.clear();
        for (const auto& item : j.at("instruments")) {
            InstrumentEntry entry;
            entry.from_json(item);
            instruments.push_back(entry);
        }
    }
}

Result<std::shared_ptr<const InMemoryConfigRegistry>> InMemoryConfigRegistry::create(
    const RegistryConfig& config) {
    using RegistryPtr = std::shared_ptr<const InMemoryConfigRegistry>;

    auto fail = [](const std::string& message) {
        return make_error<RegistryPtr>(ErrorCode::CONFIGURATION_ERROR, message,
                                       "ConfigRegistry");
    };

    auto registry = std::make_shared<InMemoryConfigRegistry>(Token{});

    // Timeframes
    if (config.timeframes.empty()) {
        return fail("at least one timeframe is required");
    }
    std::set<int64_t> widths;
    for (const auto& label : config.timeframes) {
        auto tf = parse_timeframe(label);
        if (!tf) {
            return fail("malformed timeframe '" + label + "'");
        }
        if (!widths.insert(tf->seconds).second) {
            return fail("duplicate timeframe width for '" + label + "'");
        }
        registry->timeframes_.push_back(*tf);
    }
    std::sort(registry->timeframes_.begin(), registry->timeframes_.end());

    auto is_known = [&](const std::string& label) {
        return std::any_of(registry->timeframes_.begin(), registry->timeframes_.end(),
                           [&](const Timeframe& tf) { return tf.label == label; });
    };

    // Policies: configured definitions replace built-ins with the same id
    std::map<int, PolicyDefinition> definitions;
    if (config.include_builtin_policies) {
        for (const auto& preset : builtin_policy_definitions()) {
            definitions[preset.id] = preset;
        }
    }
    std::set<int> configured_ids;
    for (const auto& definition : config.policies) {
        if (!configured_ids.insert(definition.id).second) {
            return fail("duplicate policy id " + std::to_string(definition.id));
        }
        definitions[definition.id] = definition;
    }

    for (const auto& [id, definition] : definitions) {
        // Built-in presets may mention timeframes this deployment does not run
        PolicyDefinition effective = definition;
        if (configured_ids.count(id) == 0) {
            for (auto it = effective.weights.begin(); it != effective.weights.end();) {
                it = is_known(it->first) ? std::next(it) : effective.weights.erase(it);
            }
            effective.sync_timeframes.erase(
                std::remove_if(effective.sync_timeframes.begin(), effective.sync_timeframes.end(),
                               [&](const std::string& label) { return !is_known(label); }),
                effective.sync_timeframes.end());
            if (effective.sync_timeframes.empty()) {
                effective.require_synchronization = false;
            }
        }

        auto policy = StrategyPolicy::create(effective, registry->timeframes_);
        if (policy.is_error()) {
            return fail(policy.error()->what());
        }
        registry->policies_[id] = policy.value();
    }

    if (registry->policies_.count(config.default_policy_id) == 0) {
        return fail("default policy id " + std::to_string(config.default_policy_id) +
                    " is not defined");
    }
    registry->default_policy_id_ = config.default_policy_id;

    // Thresholds
    // Defaults cover the standard timeframes; ones this deployment does not run are skipped
    for (const auto& [label, pair] : config.default_thresholds) {
        if (!is_known(label)) {
            continue;
        }
        auto thresholds = ThresholdSet::create(pair.fast, pair.signal);
        if (thresholds.is_error()) {
            return fail("default threshold for '" + label + "': " + thresholds.error()->what());
        }
        registry->default_thresholds_[label] = thresholds.value();
    }

    for (const auto& [key, by_tf] : config.instrument_thresholds) {
        for (const auto& [label, pair] : by_tf) {
            if (!is_known(label)) {
                return fail("threshold for " + key + " refers to unknown timeframe '" + label +
                            "'");
            }
            auto thresholds = ThresholdSet::create(pair.fast, pair.signal);
            if (thresholds.is_error()) {
                return fail("threshold for " + key + " " + label + ": " +
                            thresholds.error()->what());
            }
            registry->instrument_thresholds_[key][label] = thresholds.value();
        }
    }

    // Instruments
    std::set<std::string> keys;
    for (const auto& entry : config.instruments) {
        if (entry.ticker.empty() || entry.venue.empty()) {
            return fail("instrument entries need a ticker and a venue");
        }
        Instrument instrument(entry.ticker, entry.venue, entry.active);
        if (!keys.insert(instrument.key()).second) {
            return fail("duplicate instrument " + instrument.key());
        }
        if (entry.policy_id) {
            if (registry->policies_.count(*entry.policy_id) == 0) {
                return fail("instrument " + instrument.key() + " uses unknown policy " +
                            std::to_string(*entry.policy_id));
            }
            registry->instrument_policies_[instrument.key()] = *entry.policy_id;
        }
        registry->instruments_.push_back(instrument);
    }

    Logger::register_component("ConfigRegistry");
    INFO("Config registry loaded: " << registry->timeframes_.size() << " timeframes, "
                                    << registry->policies_.size() << " policies, "
                                    << registry->instruments_.size() << " instruments");

    return Result<RegistryPtr>(RegistryPtr(std::move(registry)));
}

Result<std::shared_ptr<const StrategyPolicy>> InMemoryConfigRegistry::resolve_policy(
    int policy_id) const {
    auto it = policies_.find(policy_id);
    if (it == policies_.end()) {
        return make_error<std::shared_ptr<const StrategyPolicy>>(
            ErrorCode::CONFIGURATION_ERROR, "Unknown policy id " + std::to_string(policy_id),
            "ConfigRegistry");
    }
    return Result<std::shared_ptr<const StrategyPolicy>>(it->second);
}

std::optional<ThresholdSet> InMemoryConfigRegistry::resolve_thresholds(
    const Instrument& instrument, const Timeframe& timeframe) const {
    auto by_instrument = instrument_thresholds_.find(instrument.key());
    if (by_instrument != instrument_thresholds_.end()) {
        auto it = by_instrument->second.find(timeframe.label);
        if (it != by_instrument->second.end()) {
            return it->second;
        }
    }

    auto fallback = default_thresholds_.find(timeframe.label);
    if (fallback != default_thresholds_.end()) {
        return fallback->second;
    }
    return std::nullopt;
}

Result<std::shared_ptr<const StrategyPolicy>> InMemoryConfigRegistry::policy_for(
    const Instrument& instrument) const {
    auto it = instrument_policies_.find(instrument.key());
    return resolve_policy(it == instrument_policies_.end() ? default_policy_id_ : it->second);
}

std::vector<Instrument> InMemoryConfigRegistry::active_instruments() const {
    std::vector<Instrument> active;
    for (const auto& instrument : instruments_) {
        if (instrument.active) {
            active.push_back(instrument);
        }
    }
    return active;
}

std::vector<int> InMemoryConfigRegistry::policy_ids() const {
    std::vector<int> ids;
    for (const auto& [id, _] : policies_) {
        ids.push_back(id);
    }
    return ids;
}

}  // namespace signal_ngin

// include/signal_ngin/strategy/strategy_policy.hpp
#pragma once

#include <map>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "signal_ngin/core/config_base.hpp"
#include "signal_ngin/core/error.hpp"
#include "signal_ngin/core/types.hpp"
#include "signal_ngin/strategy/zone_classifier.hpp"

namespace signal_ngin {

/**
 * @brief Indicator components a policy can enable
 */
enum class PolicyComponent { FMACD, SMACD, BARS_MT, STRUCTURE_3M2, MOMENTUM };

std::string policy_component_to_string(PolicyComponent component);

std::optional<PolicyComponent> policy_component_from_string(const std::string& name);

/**
 * @brief Unvalidated policy description as read from configuration
 */
struct PolicyDefinition : public ConfigBase {
    int id{0};
    std::string name;
    std::string description;
    std::vector<PolicyComponent> components;
    std::map<std::string, double> weights;  // timeframe label -> weight
    int consensus_minimum{2};
    bool require_synchronization{false};
    std::vector<std::string> sync_timeframes;
    nlohmann::json custom_params = nlohmann::json::object();

    nlohmann::json to_json() const override;

    /**
     * @throws std::invalid_argument on an unknown component name
     */
    void from_json(const nlohmann::json& j) override;

    std::string section_name() const override {
        return "policy";
    }
};

/**
 * @brief Immutable, validated aggregation policy
 *
 * Only obtainable through create(); shared read-only between the registry
 * and every pipeline run.
 *
 * Recognised custom parameters:
 *  - mt_threshold (> 0, default 1.0): MACD histogram, in signal-threshold
 *    units, at which BARS_MT and MOMENTUM treat momentum as opposing a zone
 *  - focus_tf (weighted timeframe, default the narrowest weighted one):
 *    timeframe the MOMENTUM gate reads
 *  - structure_uniformity_threshold (in (0, 1], default 0.8): share of
 *    considered timeframes the winning side needs under STRUCTURE_3M2
 *  - confidence_threshold (in [0, 1], default 0): minimum confidence of a
 *    directional signal
 * Other keys are kept and round-tripped but not interpreted.
 */
class StrategyPolicy {
    struct Token {};

public:
    explicit StrategyPolicy(Token) {}

    /**
     * @brief Validate a definition against the known timeframes
     * @return The policy, or CONFIGURATION_ERROR naming the first violation
     */
    static Result<std::shared_ptr<const StrategyPolicy>> create(
        const PolicyDefinition& definition, const std::vector<Timeframe>& known_timeframes);

    int id() const {
        return id_;
    }
    const std::string& name() const {
        return name_;
    }
    const std::string& description() const {
        return description_;
    }
    const std::vector<PolicyComponent>& components() const {
        return components_;
    }
    bool has_component(PolicyComponent component) const;

    /**
     * @brief Lines the zone classifier reads: FMACD alone selects the MACD
     *        line, SMACD alone the signal line, anything else both
     */
    ZoneLines zone_lines() const;

    /**
     * @brief Weights ordered by timeframe width
     */
    const std::map<Timeframe, double>& weights() const {
        return weights_;
    }
    std::optional<double> weight_for(const Timeframe& timeframe) const;

    int consensus_minimum() const {
        return consensus_minimum_;
    }
    bool require_synchronization() const {
        return require_synchronization_;
    }
    const std::vector<Timeframe>& sync_timeframes() const {
        return sync_timeframes_;
    }
    const nlohmann::json& custom_params() const {
        return custom_params_;
    }

    double mt_threshold() const {
        return mt_threshold_;
    }
    const std::optional<Timeframe>& focus_timeframe() const {
        return focus_timeframe_;
    }
    double structure_uniformity_threshold() const {
        return structure_uniformity_threshold_;
    }
    double confidence_threshold() const {
        return confidence_threshold_;
    }

    PolicyDefinition to_definition() const;

private:
    int id_{0};
    std::string name_;
    std::string description_;
    std::vector<PolicyComponent> components_;
    std::map<Timeframe, double> weights_;
    int consensus_minimum_{0};
    bool require_synchronization_{false};
    std::vector<Timeframe> sync_timeframes_;
    nlohmann::json custom_params_;
    double mt_threshold_{1.0};
    std::optional<Timeframe> focus_timeframe_;
    double structure_uniformity_threshold_{0.8};
    double confidence_threshold_{0.0};
};

/**
 * @brief Timeframes the built-in policies are expressed on:
 *        1m, 2m, 5m, 15m, 30m, 1h, 4h
 */
std::vector<Timeframe> standard_timeframes();

/**
 * @brief Built-in presets (ids 1-4): MACD Zone, Trinity, Momentum, Structure
 */
std::vector<PolicyDefinition> builtin_policy_definitions();

}  // namespace signal_ngin

// src/strategy/strategy_policy.cpp

#include "signal_ngin/strategy/strategy_policy.hpp"
#include <algorithm>
#include <cmath>
#include <set>
#include <stdexcept>

namespace signal_ngin {

std::string policy_component_to_string(PolicyComponent component) {
    switch (component) {
        case PolicyComponent::FMACD:
            return "fmacd";
        case PolicyComponent::SMACD:
            return "smacd";
        case PolicyComponent::BARS_MT:
            return "bars_mt";
        case PolicyComponent::STRUCTURE_3M2:
            return "structure_3m2";
        case PolicyComponent::MOMENTUM:
            return "momentum";
    }
    return "unknown";
}

std::optional<PolicyComponent> policy_component_from_string(const std::string& name) {
    static const std::map<std::string, PolicyComponent> lookup = {
        {"fmacd", PolicyComponent::FMACD},
        {"smacd", PolicyComponent::SMACD},
        {"bars_mt", PolicyComponent::BARS_MT},
        {"structure_3m2", PolicyComponent::STRUCTURE_3M2},
        {"momentum", PolicyComponent::MOMENTUM}};

    auto it = lookup.find(name);
    if (it == lookup.end()) {
        return std::nullopt;
    }
    return it->second;
}

nlohmann::json PolicyDefinition::to_json() const {
    nlohmann::json j;
    j["id"] = id;
    j["name"] = name;
    j["description"] = description;

    nlohmann::json component_names = nlohmann::json::array();
    for (const auto& component : components) {
        component_names.push_back(policy_component_to_string(component));
    }
    j["components"] = component_names;

    j["weights"] = weights;
    j["consensus_minimum"] = consensus_minimum;
    j["require_synchronization"] = require_synchronization;
    j["sync_timeframes"] = sync_timeframes;
    j["custom_params"] = custom_params;
    return j;
}

void PolicyDefinition::from_json(const nlohmann::json& j) {
    read_field(j, "id", id);
    read_field(j, "name", name);
    read_field(j, "description", description);
    std::vector<std::string> component_names;
    if (read_field(j, "components", component_names)) {
        components.clear();
        for (const auto& component_name : component_names) {
            auto component = policy_component_from_string(component_name);
            if (!component) {
                throw std::invalid_argument("Unknown policy component: " + component_name);
            }
            components.push_back(*component);
        }
    }
    read_field(j, "weights", weights);
    read_field(j, "consensus_minimum", consensus_minimum);
    read_field(j, "require_synchronization", require_synchronization);
    read_field(j, "sync_timeframes", sync_timeframes);
    if (j.contains("custom_params"))
        custom_params = j.at("custom_params");
}

Result<std::shared_ptr<const StrategyPolicy>> StrategyPolicy::create(
    const PolicyDefinition& definition, const std::vector<Timeframe>& known_timeframes) {
    using PolicyPtr = std::shared_ptr<const StrategyPolicy>;
    const std::string context = "policy " + std::to_string(definition.id) + " ('" +
                                definition.name + "'): ";

    auto fail = [&](const std::string& message) {
        return make_error<PolicyPtr>(ErrorCode::CONFIGURATION_ERROR, context + message,
                                     "StrategyPolicy");
    };

    auto find_known = [&](const std::string& label) -> std::optional<Timeframe> {
        for (const auto& tf : known_timeframes) {
            if (tf.label == label) {
                return tf;
            }
        }
        return std::nullopt;
    };

    if (definition.id <= 0) {
        return fail("id must be positive");
    }
    if (definition.name.empty()) {
        return fail("name must not be empty");
    }

    std::set<PolicyComponent> unique_components(definition.components.begin(),
                                                definition.components.end());
    if (unique_components.size() != definition.components.size()) {
        return fail("components must not repeat");
    }

    std::map<Timeframe, double> weights;
    for (const auto& [label, weight] : definition.weights) {
        auto tf = find_known(label);
        if (!tf) {
            return fail("weight refers to unknown timeframe '" + label + "'");
        }
        if (!std::isfinite(weight) || weight <= 0.0) {
            return fail("weight for '" + label + "' must be greater than zero");
        }
        weights[*tf] = weight;
    }

    if (definition.consensus_minimum < 0) {
        return fail("consensus_minimum must not be negative");
    }
    if (definition.consensus_minimum > static_cast<int>(definition.components.size())) {
        return fail("consensus_minimum " + std::to_string(definition.consensus_minimum) +
                    " exceeds the " + std::to_string(definition.components.size()) +
                    " enabled components");
    }

    std::vector<Timeframe> sync_timeframes;
    for (const auto& label : definition.sync_timeframes) {
        auto tf = find_known(label);
        if (!tf) {
            return fail("sync timeframe '" + label + "' is unknown");
        }
        if (weights.count(*tf) == 0) {
            return fail("sync timeframe '" + label + "' has no weight");
        }
        if (std::find(sync_timeframes.begin(), sync_timeframes.end(), *tf) !=
            sync_timeframes.end()) {
            return fail("sync timeframe '" + label + "' listed twice");
        }
        sync_timeframes.push_back(*tf);
    }
    if (definition.require_synchronization && sync_timeframes.empty()) {
        return fail("require_synchronization needs at least one sync timeframe");
    }

    if (!definition.custom_params.is_object()) {
        return fail("custom_params must be an object");
    }
    const nlohmann::json& params = definition.custom_params;

    auto number_param = [&](const std::string& key, double fallback,
                            double& out) -> std::optional<std::string> {
        out = fallback;
        if (!params.contains(key)) {
            return std::nullopt;
        }
        if (!params.at(key).is_number()) {
            return key + " must be a number";
        }
        out = params.at(key).get<double>();
        if (!std::isfinite(out)) {
            return key + " must be finite";
        }
        return std::nullopt;
    };

    double mt_threshold = 0.0;
    if (auto problem = number_param("mt_threshold", 1.0, mt_threshold)) {
        return fail(*problem);
    }
    if (mt_threshold <= 0.0) {
        return fail("mt_threshold must be greater than zero");
    }

    double uniformity = 0.0;
    if (auto problem = number_param("structure_uniformity_threshold", 0.8, uniformity)) {
        return fail(*problem);
    }
    if (uniformity <= 0.0 || uniformity > 1.0) {
        return fail("structure_uniformity_threshold must be in (0, 1]");
    }

    double min_confidence = 0.0;
    if (auto problem = number_param("confidence_threshold", 0.0, min_confidence)) {
        return fail(*problem);
    }
    if (min_confidence < 0.0 || min_confidence > 1.0) {
        return fail("confidence_threshold must be in [0, 1]");
    }

    std::optional<Timeframe> focus;
    if (params.contains("focus_tf")) {
        if (!params.at("focus_tf").is_string()) {
            return fail("focus_tf must be a timeframe label");
        }
        const auto label = params.at("focus_tf").get<std::string>();
        focus = find_known(label);
        if (!focus || weights.count(*focus) == 0) {
            return fail("focus_tf '" + label + "' is not a weighted timeframe");
        }
    } else if (!weights.empty()) {
        focus = weights.begin()->first;
    }

    std::sort(sync_timeframes.begin(), sync_timeframes.end());

    auto policy = std::make_shared<StrategyPolicy>(Token{});
    policy->id_ = definition.id;
    policy->name_ = definition.name;
    policy->description_ = definition.description;
    policy->components_ = definition.components;
    policy->weights_ = std::move(weights);
    policy->consensus_minimum_ = definition.consensus_minimum;
    policy->require_synchronization_ = definition.require_synchronization;
    policy->sync_timeframes_ = std::move(sync_timeframes);
    policy->custom_params_ = definition.custom_params;
    policy->mt_threshold_ = mt_threshold;
    policy->focus_timeframe_ = focus;
    policy->structure_uniformity_threshold_ = uniformity;
    policy->confidence_threshold_ = min_confidence;

    return Result<PolicyPtr>(PolicyPtr(std::move(policy)));
}

bool StrategyPolicy::has_component(PolicyComponent component) const {
    return std::find(components_.begin(), components_.end(), component) != components_.end();
}

ZoneLines StrategyPolicy::zone_lines() const {
    const bool fast = has_component(PolicyComponent::FMACD);
    const bool slow = has_component(PolicyComponent::SMACD);
    if (fast && !slow) {
        return ZoneLines::FAST_ONLY;
    }
    if (slow && !fast) {
        return ZoneLines::SIGNAL_ONLY;
    }
    return ZoneLines::BOTH;
}

std::optional<double> StrategyPolicy::weight_for(const Timeframe& timeframe) const {
    auto it = weights_.find(timeframe);
    if (it == weights_.end()) {
        return std::nullopt;
    }
    return it->second;
}

PolicyDefinition StrategyPolicy::to_definition() const {
    PolicyDefinition definition;
    definition.id = id_;
    definition.name = name_;
    definition.description = description_;
    definition.components = components_;
    for (const auto& [tf, weight] : weights_) {
        definition.weights[tf.label] = weight;
    }
    definition.consensus_minimum = consensus_minimum_;
    definition.require_synchronization = require_synchronization_;
    for (const auto& tf : sync_timeframes_) {
        definition.sync_timeframes.push_back(tf.label);
    }
    definition.custom_params = custom_params_;
    return definition;
}

std::vector<Timeframe> standard_timeframes() {
    return {Timeframe("1m", 60),    Timeframe("2m", 120),   Timeframe("5m", 300),
            Timeframe("15m", 900),  Timeframe("30m", 1800), Timeframe("1h", 3600),
            Timeframe("4h", 14400)};
}

std::vector<PolicyDefinition> builtin_policy_definitions() {
    const std::map<std::string, double> default_weights = {
        {"4h", 6.0}, {"1h", 5.0}, {"30m", 4.0}, {"15m", 3.0},
        {"5m", 2.0}, {"2m", 1.0}, {"1m", 1.0}};

    std::vector<PolicyDefinition> presets;

    PolicyDefinition macd_zone;
    macd_zone.id = 1;
    macd_zone.name = "MACD Zone Strategy";
    macd_zone.description = "Fast and slow MACD zone agreement across timeframes";
    macd_zone.components = {PolicyComponent::FMACD, PolicyComponent::SMACD};
    macd_zone.weights = default_weights;
    macd_zone.consensus_minimum = 2;
    presets.push_back(macd_zone);

    PolicyDefinition trinity;
    trinity.id = 2;
    trinity.name = "Trinity Strategy";
    trinity.description = "All components with short-timeframe synchronization";
    trinity.components = {PolicyComponent::FMACD, PolicyComponent::SMACD,
                          PolicyComponent::BARS_MT, PolicyComponent::STRUCTURE_3M2,
                          PolicyComponent::MOMENTUM};
    trinity.weights = {{"4h", 8.0}, {"1h", 7.0}, {"30m", 6.0}, {"15m", 5.0},
                       {"5m", 4.0}, {"2m", 3.0}, {"1m", 2.0}};
    trinity.consensus_minimum = 2;
    trinity.require_synchronization = true;
    trinity.sync_timeframes = {"1m", "2m", "5m"};
    presets.push_back(trinity);

    PolicyDefinition momentum;
    momentum.id = 3;
    momentum.name = "Momentum Strategy";
    momentum.description = "MACD zones weighted by bar momentum";
    momentum.components = {PolicyComponent::FMACD, PolicyComponent::SMACD,
                           PolicyComponent::BARS_MT, PolicyComponent::MOMENTUM};
    momentum.weights = default_weights;
    momentum.consensus_minimum = 2;
    momentum.custom_params = {{"mt_threshold", 1.0}, {"focus_tf", "5m"}};
    presets.push_back(momentum);

    PolicyDefinition structure;
    structure.id = 4;
    structure.name = "Structure Strategy";
    structure.description = "MACD zones gated by multi-timeframe structure";
    structure.components = {PolicyComponent::FMACD, PolicyComponent::SMACD,
                            PolicyComponent::STRUCTURE_3M2};
    structure.weights = default_weights;
    structure.consensus_minimum = 2;
    structure.require_synchronization = true;
    structure.sync_timeframes = {"1m", "2m", "5m", "15m"};
    structure.custom_params = {{"structure_uniformity_threshold", 0.8}};
    presets.push_back(structure);

    return presets;
}

}  // namespace signal_ngin

// include/signal_ngin/strategy/config_registry.hpp
#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "signal_ngin/core/config_base.hpp"
#include "signal_ngin/core/error.hpp"
#include "signal_ngin/core/types.hpp"
#include "signal_ngin/strategy/strategy_policy.hpp"
#include "signal_ngin/strategy/zone_classifier.hpp"

namespace signal_ngin {

/**
 * @brief Read-only source of policies, thresholds and the instrument universe
 */
class ConfigRegistry {
public:
    virtual ~ConfigRegistry() = default;

    virtual Result<std::shared_ptr<const StrategyPolicy>> resolve_policy(int policy_id) const = 0;

    /**
     * @brief Thresholds for one instrument and timeframe
     * @return std::nullopt when none are configured (the timeframe is skipped)
     */
    virtual std::optional<ThresholdSet> resolve_thresholds(const Instrument& instrument,
                                                           const Timeframe& timeframe) const = 0;

    /**
     * @brief Policy assigned to an instrument, or the default policy
     */
    virtual Result<std::shared_ptr<const StrategyPolicy>> policy_for(
        const Instrument& instrument) const = 0;

    virtual std::vector<Instrument> active_instruments() const = 0;

    /**
     * @brief Known timeframes in ascending width
     */
    virtual const std::vector<Timeframe>& timeframes() const = 0;
};

/**
 * @brief Fast/signal threshold pair as written in configuration
 * A bare number sets both lines.
 */
struct ThresholdPair {
    double fast{0.33};
    double signal{0.33};

    nlohmann::json to_json() const {
        return nlohmann::json{{"fast", fast}, {"signal", signal}};
    }

    void from_json(const nlohmann::json& j) {
        if (j.is_number()) {
            fast = signal = j.get<double>();
            return;
        }
        if (j.contains("fast"))
            fast = j.at("fast").get<double>();
        if (j.contains("signal"))
            signal = j.at("signal").get<double>();
    }
};

/**
 * @brief Instrument entry of the registry configuration
 */
struct InstrumentEntry {
    std::string ticker;
    std::string venue;
    bool active{true};
    std::optional<int> policy_id;

    nlohmann::json to_json() const {
        nlohmann::json j;
        j["ticker"] = ticker;
        j["venue"] = venue;
        j["active"] = active;
        if (policy_id)
            j["policy_id"] = *policy_id;
        return j;
    }

    void from_json(const nlohmann::json& j) {
        if (j.contains("ticker"))
            ticker = j.at("ticker").get<std::string>();
        if (j.contains("venue"))
            venue = j.at("venue").get<std::string>();
        if (j.contains("active"))
            active = j.at("active").get<bool>();
        if (j.contains("policy_id"))
            policy_id = j.at("policy_id").get<int>();
    }
};

/**
 * @brief Registry configuration: timeframes, policies, thresholds, instruments
 */
struct RegistryConfig : public ConfigBase {
    std::vector<std::string> timeframes{"1m", "2m", "5m", "15m", "30m", "1h", "4h"};
    int default_policy_id{1};
    bool include_builtin_policies{true};
    std::vector<PolicyDefinition> policies;

    // timeframe label -> thresholds used when an instrument has no entry
    std::map<std::string, ThresholdPair> default_thresholds{
        {"1m", {}}, {"2m", {}}, {"5m", {}}, {"15m", {}}, {"30m", {}}, {"1h", {}}};

    // instrument key -> timeframe label -> thresholds
    std::map<std::string, std::map<std::string, ThresholdPair>> instrument_thresholds;

    std::vector<InstrumentEntry> instruments;

    nlohmann::json to_json() const override;

    /**
     * @throws std::invalid_argument or nlohmann::json::exception on malformed input
     */
    void from_json(const nlohmann::json& j) override;

    std::string section_name() const override {
        return "registry";
    }
};

/**
 * @brief Immutable ConfigRegistry built once from a RegistryConfig
 */
class InMemoryConfigRegistry : public ConfigRegistry {
    struct Token {};

public:
    explicit InMemoryConfigRegistry(Token) {}

    /**
     * @brief Validate everything up front
     * @return The registry, or CONFIGURATION_ERROR; never a partial registry
     */
    static Result<std::shared_ptr<const InMemoryConfigRegistry>> create(
        const RegistryConfig& config);

    Result<std::shared_ptr<const StrategyPolicy>> resolve_policy(int policy_id) const override;

    std::optional<ThresholdSet> resolve_thresholds(const Instrument& instrument,
                                                   const Timeframe& timeframe) const override;

    Result<std::shared_ptr<const StrategyPolicy>> policy_for(
        const Instrument& instrument) const override;

    std::vector<Instrument> active_instruments() const override;

    const std::vector<Timeframe>& timeframes() const override {
        return timeframes_;
    }

    std::vector<int> policy_ids() const;

    int default_policy_id() const {
        return default_policy_id_;
    }

private:
    std::vector<Timeframe> timeframes_;
    std::map<int, std::shared_ptr<const StrategyPolicy>> policies_;
    int default_policy_id_{1};
    std::map<std::string, ThresholdSet> default_thresholds_;
    std::map<std::string, std::map<std::string, ThresholdSet>> instrument_thresholds_;
    std::vector<Instrument> instruments_;
    std::map<std::string, int> instrument_policies_;
};

}  // namespace signal_ngin

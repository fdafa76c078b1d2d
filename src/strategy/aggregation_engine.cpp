// src/strategy/aggregation_engine.cpp

#include "signal_ngin/strategy/aggregation_engine.hpp"
#include <algorithm>
#include <optional>
#include "signal_ngin/core/time_utils.hpp"

namespace signal_ngin {

IndicatorResult IndicatorResult::classify(const Timeframe& timeframe, double fast, double signal,
                                          const ThresholdSet& thresholds,
                                          Timestamp candle_time, ZoneLines lines) {
    IndicatorResult result;
    result.timeframe = timeframe;
    result.fast = fast;
    result.signal = signal;
    result.thresholds = thresholds;
    result.zone = ZoneClassifier::classify(fast, signal, thresholds, lines);
    result.candle_time = candle_time;
    return result;
}

nlohmann::json AggregatedSignal::to_json() const {
    nlohmann::json j;
    j["instrument"] = instrument;
    j["signal"] = signal_type_to_string(type);
    j["confidence"] = confidence;
    j["bull_score"] = bull_score;
    j["bear_score"] = bear_score;
    j["total_weight"] = total_weight;
    j["bull_count"] = bull_count;
    j["bear_count"] = bear_count;
    j["neutral_count"] = neutral_count;
    j["vetoed"] = vetoed;
    j["gated_by"] = gated_by;
    j["policy_id"] = policy_id;
    j["timestamp"] = core::to_epoch_seconds(timestamp);

    nlohmann::json breakdown = nlohmann::json::array();
    for (const auto& contribution : contributions) {
        breakdown.push_back({{"timeframe", contribution.timeframe.label},
                             {"zone", zone_to_string(contribution.zone)},
                             {"weight", contribution.weight},
                             {"confidence", contribution.confidence}});
    }
    j["contributions"] = breakdown;
    return j;
}

AggregatedSignal AggregationEngine::aggregate(const std::map<Timeframe, IndicatorResult>& results,
                                              const StrategyPolicy& policy) {
    AggregatedSignal signal;
    signal.policy_id = policy.id();

    // Scores over the timeframes both sides know about
    std::map<Timeframe, Zone> zones;
    for (const auto& [timeframe, result] : results) {
        auto weight = policy.weight_for(timeframe);
        if (!weight) {
            continue;
        }

        const Zone zone = effective_zone(result, policy);
        zones[timeframe] = zone;
        signal.total_weight += *weight;
        switch (zone) {
            case Zone::BULL:
                signal.bull_score += *weight;
                ++signal.bull_count;
                break;
            case Zone::BEAR:
                signal.bear_score += *weight;
                ++signal.bear_count;
                break;
            case Zone::NEUTRAL:
                ++signal.neutral_count;
                break;
        }

        TimeframeContribution contribution;
        contribution.timeframe = timeframe;
        contribution.zone = zone;
        contribution.weight = *weight;
        signal.contributions.push_back(contribution);
    }

    if (signal.total_weight > 0.0) {
        for (auto& contribution : signal.contributions) {
            if (contribution.zone != Zone::NEUTRAL) {
                contribution.confidence = contribution.weight / signal.total_weight;
            }
        }
    }

    if (policy.require_synchronization() && sync_vetoed(zones, policy)) {
        signal.type = SignalType::HOLD;
        signal.confidence = 0.0;
        signal.vetoed = true;
        signal.gated_by = "sync";
        return signal;
    }

    const int consensus = policy.consensus_minimum();
    if (signal.bull_score > signal.bear_score && signal.bull_count >= consensus) {
        signal.type = SignalType::BUY;
    } else if (signal.bear_score > signal.bull_score && signal.bear_count >= consensus) {
        signal.type = SignalType::SELL;
    } else {
        signal.type = SignalType::HOLD;
    }

    if (signal.total_weight > 0.0) {
        signal.confidence = std::clamp(
            std::max(signal.bull_score, signal.bear_score) / signal.total_weight, 0.0, 1.0);
    }

    if (signal.type != SignalType::HOLD) {
        signal.gated_by = gate(signal, results, policy);
        if (!signal.gated_by.empty()) {
            signal.type = SignalType::HOLD;
        }
    }

    return signal;
}

Zone AggregationEngine::effective_zone(const IndicatorResult& result,
                                       const StrategyPolicy& policy) {
    if (!policy.has_component(PolicyComponent::BARS_MT)) {
        return result.zone;
    }
    const double momentum = result.momentum();
    if (result.zone == Zone::BULL && momentum <= -policy.mt_threshold()) {
        return Zone::NEUTRAL;
    }
    if (result.zone == Zone::BEAR && momentum >= policy.mt_threshold()) {
        return Zone::NEUTRAL;
    }
    return result.zone;
}

bool AggregationEngine::sync_vetoed(const std::map<Timeframe, Zone>& zones,
                                    const StrategyPolicy& policy) {
    std::optional<Zone> direction;
    for (const auto& timeframe : policy.sync_timeframes()) {
        auto it = zones.find(timeframe);
        if (it == zones.end() || it->second == Zone::NEUTRAL) {
            return true;
        }
        if (!direction) {
            direction = it->second;
        } else if (*direction != it->second) {
            return true;
        }
    }
    return false;
}

std::string AggregationEngine::gate(const AggregatedSignal& signal,
                                    const std::map<Timeframe, IndicatorResult>& results,
                                    const StrategyPolicy& policy) {
    const bool buying = signal.type == SignalType::BUY;

    if (policy.has_component(PolicyComponent::MOMENTUM) && policy.focus_timeframe()) {
        // A focus timeframe without data does not gate
        auto it = results.find(*policy.focus_timeframe());
        if (it != results.end()) {
            const double momentum = it->second.momentum();
            if ((buying && momentum <= -policy.mt_threshold()) ||
                (!buying && momentum >= policy.mt_threshold())) {
                return "momentum";
            }
        }
    }

    if (policy.has_component(PolicyComponent::STRUCTURE_3M2)) {
        const int considered = signal.bull_count + signal.bear_count + signal.neutral_count;
        const int winning = buying ? signal.bull_count : signal.bear_count;
        if (considered > 0 && static_cast<double>(winning) / considered <
                                  policy.structure_uniformity_threshold()) {
            return "structure";
        }
    }

    if (signal.confidence < policy.confidence_threshold()) {
        return "confidence";
    }
    return {};
}

}  // namespace signal_ngin

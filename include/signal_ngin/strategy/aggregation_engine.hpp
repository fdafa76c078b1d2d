// include/signal_ngin/strategy/aggregation_engine.hpp
#pragma once

#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "signal_ngin/core/types.hpp"
#include "signal_ngin/strategy/strategy_policy.hpp"
#include "signal_ngin/strategy/zone_classifier.hpp"

namespace signal_ngin {

/**
 * @brief One timeframe's computed oscillator values and classification
 */
struct IndicatorResult {
    Timeframe timeframe;
    double fast{0.0};
    double signal{0.0};
    ThresholdSet thresholds;
    Zone zone{Zone::NEUTRAL};
    Timestamp candle_time{};

    /**
     * @brief Classify (fast, signal) under the given thresholds, reading
     *        the lines the policy selects
     */
    static IndicatorResult classify(const Timeframe& timeframe, double fast, double signal,
                                    const ThresholdSet& thresholds, Timestamp candle_time = {},
                                    ZoneLines lines = ZoneLines::BOTH);

    /**
     * @brief MACD histogram (fast - signal) in units of the signal threshold
     */
    double momentum() const {
        return (fast - signal) / thresholds.signal();
    }
};

/**
 * @brief Share of one timeframe in the final decision
 */
struct TimeframeContribution {
    Timeframe timeframe;
    Zone zone{Zone::NEUTRAL};
    double weight{0.0};
    double confidence{0.0};  // weight / total_weight for BULL or BEAR, else 0
};

/**
 * @brief Final decision for one instrument at one point in time
 */
struct AggregatedSignal {
    std::string instrument;
    SignalType type{SignalType::HOLD};
    double confidence{0.0};
    double bull_score{0.0};
    double bear_score{0.0};
    double total_weight{0.0};
    int bull_count{0};
    int bear_count{0};
    int neutral_count{0};
    bool vetoed{false};
    std::string gated_by;  // "sync", "momentum", "structure", "confidence" or empty
    int policy_id{0};
    std::vector<TimeframeContribution> contributions;
    Timestamp timestamp{};

    nlohmann::json to_json() const;
};

/**
 * @brief Weighted multi-timeframe consensus
 *
 * Stateless; aggregate() is a pure function of its inputs and never fails.
 */
class AggregationEngine {
public:
    /**
     * @brief Combine per-timeframe results under a policy
     *
     * Only timeframes present in both results and the policy weights are
     * considered. Under BARS_MT a zone whose momentum opposes it by at least
     * mt_threshold counts as NEUTRAL. With synchronization required, a sync
     * timeframe that is missing, NEUTRAL or disagrees with another forces HOLD
     * at confidence 0. Otherwise BUY needs bull_score > bear_score and at least
     * consensus_minimum BULL timeframes (SELL mirrored). Ties are HOLD.
     *
     * A BUY or SELL is then held back (HOLD, confidence kept, gated_by set)
     * when MOMENTUM is enabled and the focus timeframe's momentum opposes it
     * by at least mt_threshold, when STRUCTURE_3M2 is enabled and the winning
     * side covers less than structure_uniformity_threshold of the considered
     * timeframes, or when confidence is below confidence_threshold.
     *
     * @param results Per-timeframe results (may be empty)
     * @param policy Resolved policy
     * @return The aggregated signal; instrument and timestamp are left for
     *         the caller to fill
     */
    static AggregatedSignal aggregate(const std::map<Timeframe, IndicatorResult>& results,
                                      const StrategyPolicy& policy);

private:
    static Zone effective_zone(const IndicatorResult& result, const StrategyPolicy& policy);

    static bool sync_vetoed(const std::map<Timeframe, Zone>& zones, const StrategyPolicy& policy);

    /**
     * @return Name of the first gate that rejects a directional signal, or
     *         an empty string
     */
    static std::string gate(const AggregatedSignal& signal,
                            const std::map<Timeframe, IndicatorResult>& results,
                            const StrategyPolicy& policy);
};

}  // namespace signal_ngin

#include <gtest/gtest.h>
#include "signal_ngin/strategy/aggregation_engine.hpp"

using namespace signal_ngin;

namespace {

const Timeframe M1("1m", 60);
const Timeframe M2("2m", 120);
const Timeframe M5("5m", 300);
const Timeframe M15("15m", 900);
const Timeframe H1("1h", 3600);

IndicatorResult zoned(const Timeframe& timeframe, Zone zone) {
    IndicatorResult result;
    result.timeframe = timeframe;
    result.zone = zone;
    return result;
}

// Zone plus MACD lines; the default signal threshold is 0.33
IndicatorResult lined(const Timeframe& timeframe, Zone zone, double fast, double signal) {
    IndicatorResult result = zoned(timeframe, zone);
    result.fast = fast;
    result.signal = signal;
    return result;
}

}  // namespace

class AggregationEngineTest : public ::testing::Test {
protected:
    std::shared_ptr<const StrategyPolicy> make_policy(std::map<std::string, double> weights,
                                                      int consensus,
                                                      std::vector<std::string> sync = {}) {
        PolicyDefinition definition;
        definition.id = 3;
        definition.name = "aggregation test";
        definition.components = {PolicyComponent::FMACD, PolicyComponent::SMACD,
                                 PolicyComponent::BARS_MT};
        definition.weights = std::move(weights);
        definition.consensus_minimum = consensus;
        definition.require_synchronization = !sync.empty();
        definition.sync_timeframes = std::move(sync);

        auto policy = StrategyPolicy::create(definition, standard_timeframes());
        EXPECT_TRUE(policy.is_ok()) << policy.error()->what();
        return policy.value();
    }

    std::shared_ptr<const StrategyPolicy> make_component_policy(
        std::vector<PolicyComponent> components, std::map<std::string, double> weights,
        nlohmann::json params = nlohmann::json::object()) {
        PolicyDefinition definition;
        definition.id = 5;
        definition.name = "component test";
        definition.components = std::move(components);
        definition.weights = std::move(weights);
        definition.consensus_minimum = 1;
        definition.custom_params = std::move(params);

        auto policy = StrategyPolicy::create(definition, standard_timeframes());
        EXPECT_TRUE(policy.is_ok()) << policy.error()->what();
        return policy.value();
    }
};

TEST_F(AggregationEngineTest, WeightedConsensusBuy) {
    auto policy = make_policy({{"2m", 2.0}, {"5m", 3.0}, {"15m", 1.0}}, 2);
    std::map<Timeframe, IndicatorResult> results{{M2, zoned(M2, Zone::BULL)},
                                                 {M5, zoned(M5, Zone::BULL)},
                                                 {M15, zoned(M15, Zone::BEAR)}};

    auto signal = AggregationEngine::aggregate(results, *policy);

    EXPECT_EQ(signal.type, SignalType::BUY);
    EXPECT_DOUBLE_EQ(signal.bull_score, 5.0);
    EXPECT_DOUBLE_EQ(signal.bear_score, 1.0);
    EXPECT_DOUBLE_EQ(signal.total_weight, 6.0);
    EXPECT_NEAR(signal.confidence, 5.0 / 6.0, 1e-12);
    EXPECT_EQ(signal.bull_count, 2);
    EXPECT_EQ(signal.bear_count, 1);
    EXPECT_FALSE(signal.vetoed);
    EXPECT_EQ(signal.policy_id, 3);

    ASSERT_EQ(signal.contributions.size(), 3u);
    EXPECT_EQ(signal.contributions[0].timeframe, M2);
    EXPECT_NEAR(signal.contributions[0].confidence, 2.0 / 6.0, 1e-12);
    EXPECT_NEAR(signal.contributions[2].confidence, 1.0 / 6.0, 1e-12);
}

TEST_F(AggregationEngineTest, WeightedConsensusSell) {
    auto policy = make_policy({{"1m", 1.0}, {"5m", 2.0}, {"1h", 4.0}}, 2);
    std::map<Timeframe, IndicatorResult> results{{M1, zoned(M1, Zone::BULL)},
                                                 {M5, zoned(M5, Zone::BEAR)},
                                                 {H1, zoned(H1, Zone::BEAR)}};

    auto signal = AggregationEngine::aggregate(results, *policy);
    EXPECT_EQ(signal.type, SignalType::SELL);
    EXPECT_NEAR(signal.confidence, 6.0 / 7.0, 1e-12);
}

TEST_F(AggregationEngineTest, AllNeutralIsHoldWithZeroConfidence) {
    auto policy = make_policy({{"1m", 1.0}, {"5m", 2.0}}, 1);
    std::map<Timeframe, IndicatorResult> results{{M1, zoned(M1, Zone::NEUTRAL)},
                                                 {M5, zoned(M5, Zone::NEUTRAL)}};

    auto signal = AggregationEngine::aggregate(results, *policy);
    EXPECT_EQ(signal.type, SignalType::HOLD);
    EXPECT_DOUBLE_EQ(signal.confidence, 0.0);
    EXPECT_EQ(signal.neutral_count, 2);
    for (const auto& contribution : signal.contributions) {
        EXPECT_DOUBLE_EQ(contribution.confidence, 0.0);
    }
}

TEST_F(AggregationEngineTest, EmptyResultsAreHold) {
    auto policy = make_policy({{"1m", 1.0}}, 1);
    auto signal = AggregationEngine::aggregate({}, *policy);
    EXPECT_EQ(signal.type, SignalType::HOLD);
    EXPECT_DOUBLE_EQ(signal.confidence, 0.0);
    EXPECT_DOUBLE_EQ(signal.total_weight, 0.0);
    EXPECT_TRUE(signal.contributions.empty());
}

TEST_F(AggregationEngineTest, ConsensusMinimumNotMet) {
    auto policy = make_policy({{"1m", 1.0}, {"5m", 1.0}, {"1h", 5.0}}, 2);
    std::map<Timeframe, IndicatorResult> results{{M1, zoned(M1, Zone::NEUTRAL)},
                                                 {M5, zoned(M5, Zone::BEAR)},
                                                 {H1, zoned(H1, Zone::BULL)}};

    auto signal = AggregationEngine::aggregate(results, *policy);
    EXPECT_EQ(signal.type, SignalType::HOLD);
    // Confidence still reflects the dominant side
    EXPECT_NEAR(signal.confidence, 5.0 / 7.0, 1e-12);
}

TEST_F(AggregationEngineTest, TieIsHold) {
    auto policy = make_policy({{"1m", 2.0}, {"5m", 2.0}}, 1);
    std::map<Timeframe, IndicatorResult> results{{M1, zoned(M1, Zone::BULL)},
                                                 {M5, zoned(M5, Zone::BEAR)}};

    auto signal = AggregationEngine::aggregate(results, *policy);
    EXPECT_EQ(signal.type, SignalType::HOLD);
    EXPECT_DOUBLE_EQ(signal.confidence, 0.5);
}

TEST_F(AggregationEngineTest, UnweightedTimeframesAreIgnored) {
    auto policy = make_policy({{"5m", 1.0}}, 1);
    std::map<Timeframe, IndicatorResult> results{{M1, zoned(M1, Zone::BEAR)},
                                                 {M2, zoned(M2, Zone::BEAR)},
                                                 {M5, zoned(M5, Zone::BULL)}};

    auto signal = AggregationEngine::aggregate(results, *policy);
    EXPECT_EQ(signal.type, SignalType::BUY);
    EXPECT_DOUBLE_EQ(signal.confidence, 1.0);
    EXPECT_EQ(signal.bear_count, 0);
    ASSERT_EQ(signal.contributions.size(), 1u);
}

TEST_F(AggregationEngineTest, ZeroConsensusAllowsSingleTimeframe) {
    auto policy = make_policy({{"1m", 1.0}, {"5m", 1.0}}, 0);
    std::map<Timeframe, IndicatorResult> results{{M1, zoned(M1, Zone::BULL)}};

    auto signal = AggregationEngine::aggregate(results, *policy);
    EXPECT_EQ(signal.type, SignalType::BUY);
}

TEST_F(AggregationEngineTest, SyncAgreementPasses) {
    auto policy = make_policy({{"1m", 1.0}, {"2m", 1.0}, {"1h", 1.0}}, 2, {"1m", "2m"});
    std::map<Timeframe, IndicatorResult> results{{M1, zoned(M1, Zone::BEAR)},
                                                 {M2, zoned(M2, Zone::BEAR)},
                                                 {H1, zoned(H1, Zone::BULL)}};

    auto signal = AggregationEngine::aggregate(results, *policy);
    EXPECT_FALSE(signal.vetoed);
    EXPECT_EQ(signal.type, SignalType::SELL);
}

TEST_F(AggregationEngineTest, SyncDisagreementVetoes) {
    auto policy = make_policy({{"1m", 1.0}, {"2m", 1.0}, {"1h", 5.0}}, 1, {"1m", "2m"});
    std::map<Timeframe, IndicatorResult> results{{M1, zoned(M1, Zone::BULL)},
                                                 {M2, zoned(M2, Zone::BEAR)},
                                                 {H1, zoned(H1, Zone::BULL)}};

    auto signal = AggregationEngine::aggregate(results, *policy);
    EXPECT_TRUE(signal.vetoed);
    EXPECT_EQ(signal.gated_by, "sync");
    EXPECT_EQ(signal.type, SignalType::HOLD);
    EXPECT_DOUBLE_EQ(signal.confidence, 0.0);
    // Scores are still reported
    EXPECT_DOUBLE_EQ(signal.bull_score, 6.0);
}

TEST_F(AggregationEngineTest, SyncNeutralOrMissingVetoes) {
    auto policy = make_policy({{"1m", 1.0}, {"2m", 1.0}, {"1h", 5.0}}, 1, {"1m", "2m"});

    std::map<Timeframe, IndicatorResult> neutral{{M1, zoned(M1, Zone::BULL)},
                                                 {M2, zoned(M2, Zone::NEUTRAL)},
                                                 {H1, zoned(H1, Zone::BULL)}};
    EXPECT_TRUE(AggregationEngine::aggregate(neutral, *policy).vetoed);

    std::map<Timeframe, IndicatorResult> missing{{M1, zoned(M1, Zone::BULL)},
                                                 {H1, zoned(H1, Zone::BULL)}};
    auto signal = AggregationEngine::aggregate(missing, *policy);
    EXPECT_TRUE(signal.vetoed);
    EXPECT_EQ(signal.type, SignalType::HOLD);
}

TEST_F(AggregationEngineTest, ClassifiedResultsFeedAggregation) {
    auto policy = make_policy({{"1m", 1.0}, {"5m", 1.0}}, 2);
    auto thresholds = ThresholdSet::uniform(0.33).value();

    std::map<Timeframe, IndicatorResult> results{
        {M1, IndicatorResult::classify(M1, 0.5, 0.1, thresholds)},
        {M5, IndicatorResult::classify(M5, 0.2, 0.4, thresholds)}};
    EXPECT_EQ(results.at(M1).zone, Zone::BULL);
    EXPECT_EQ(results.at(M5).zone, Zone::BULL);

    auto signal = AggregationEngine::aggregate(results, *policy);
    EXPECT_EQ(signal.type, SignalType::BUY);
    EXPECT_DOUBLE_EQ(signal.confidence, 1.0);

    signal.instrument = "HOSE:VNM";
    auto j = signal.to_json();
    EXPECT_EQ(j["signal"], "BUY");
    EXPECT_EQ(j["contributions"].size(), 2u);
    EXPECT_EQ(j["contributions"][0]["timeframe"], "1m");
}

TEST_F(AggregationEngineTest, FastOnlyPolicyClassifiesOnMacdLine) {
    auto policy = make_component_policy({PolicyComponent::FMACD}, {{"1m", 1.0}, {"5m", 1.0}});
    auto thresholds = ThresholdSet::uniform(0.33).value();

    // The signal line is still below zero on both timeframes
    std::map<Timeframe, IndicatorResult> results{
        {M1, IndicatorResult::classify(M1, 0.5, -0.1, thresholds, {}, policy->zone_lines())},
        {M5, IndicatorResult::classify(M5, 0.4, -0.2, thresholds, {}, policy->zone_lines())}};

    auto signal = AggregationEngine::aggregate(results, *policy);
    EXPECT_EQ(signal.type, SignalType::BUY);
    EXPECT_EQ(signal.bull_count, 2);

    auto both = make_component_policy({PolicyComponent::FMACD, PolicyComponent::SMACD},
                                      {{"1m", 1.0}, {"5m", 1.0}});
    results[M1] = IndicatorResult::classify(M1, 0.5, -0.1, thresholds, {}, both->zone_lines());
    results[M5] = IndicatorResult::classify(M5, 0.4, -0.2, thresholds, {}, both->zone_lines());
    EXPECT_EQ(AggregationEngine::aggregate(results, *both).type, SignalType::HOLD);
}

TEST_F(AggregationEngineTest, BarsMomentumDemotesOpposedZone) {
    std::map<Timeframe, IndicatorResult> results{
        {M1, lined(M1, Zone::BULL, 0.5, 0.4)},
        // Histogram of -0.5 is about -1.5 signal thresholds
        {M5, lined(M5, Zone::BULL, 0.4, 0.9)}};

    auto plain = make_component_policy({PolicyComponent::FMACD, PolicyComponent::SMACD},
                                       {{"1m", 1.0}, {"5m", 2.0}});
    auto signal = AggregationEngine::aggregate(results, *plain);
    EXPECT_EQ(signal.bull_count, 2);
    EXPECT_DOUBLE_EQ(signal.confidence, 1.0);

    auto bars = make_component_policy(
        {PolicyComponent::FMACD, PolicyComponent::SMACD, PolicyComponent::BARS_MT},
        {{"1m", 1.0}, {"5m", 2.0}});
    signal = AggregationEngine::aggregate(results, *bars);
    EXPECT_EQ(signal.type, SignalType::BUY);
    EXPECT_EQ(signal.bull_count, 1);
    EXPECT_EQ(signal.neutral_count, 1);
    EXPECT_NEAR(signal.confidence, 1.0 / 3.0, 1e-12);
    ASSERT_EQ(signal.contributions.size(), 2u);
    EXPECT_EQ(signal.contributions[1].zone, Zone::NEUTRAL);

    // A looser threshold keeps the zone
    auto loose = make_component_policy(
        {PolicyComponent::FMACD, PolicyComponent::SMACD, PolicyComponent::BARS_MT},
        {{"1m", 1.0}, {"5m", 2.0}}, {{"mt_threshold", 2.0}});
    EXPECT_EQ(AggregationEngine::aggregate(results, *loose).bull_count, 2);
}

TEST_F(AggregationEngineTest, MomentumGateHoldsSignalAgainstFocusTimeframe) {
    auto policy = make_component_policy(
        {PolicyComponent::FMACD, PolicyComponent::SMACD, PolicyComponent::MOMENTUM},
        {{"1m", 1.0}, {"5m", 1.0}, {"1h", 3.0}}, {{"focus_tf", "5m"}, {"mt_threshold", 1.0}});

    std::map<Timeframe, IndicatorResult> results{{M1, lined(M1, Zone::BEAR, -0.5, -0.4)},
                                                 {M5, lined(M5, Zone::BEAR, -0.4, -0.9)},
                                                 {H1, lined(H1, Zone::BEAR, -0.6, -0.5)}};
    // 5m histogram of +0.5 opposes the SELL
    auto signal = AggregationEngine::aggregate(results, *policy);
    EXPECT_EQ(signal.type, SignalType::HOLD);
    EXPECT_EQ(signal.gated_by, "momentum");
    EXPECT_FALSE(signal.vetoed);
    EXPECT_DOUBLE_EQ(signal.confidence, 1.0);

    results[M5] = lined(M5, Zone::BEAR, -0.6, -0.5);
    signal = AggregationEngine::aggregate(results, *policy);
    EXPECT_EQ(signal.type, SignalType::SELL);
    EXPECT_TRUE(signal.gated_by.empty());

    // No data on the focus timeframe, no gate
    results.erase(M5);
    EXPECT_EQ(AggregationEngine::aggregate(results, *policy).type, SignalType::SELL);
}

TEST_F(AggregationEngineTest, StructureGateNeedsUniformTimeframes) {
    auto policy = make_component_policy(
        {PolicyComponent::FMACD, PolicyComponent::SMACD, PolicyComponent::STRUCTURE_3M2},
        {{"1m", 1.0}, {"2m", 1.0}, {"5m", 1.0}, {"1h", 5.0}},
        {{"structure_uniformity_threshold", 0.75}});

    std::map<Timeframe, IndicatorResult> results{{M1, zoned(M1, Zone::BULL)},
                                                 {M2, zoned(M2, Zone::BULL)},
                                                 {M5, zoned(M5, Zone::NEUTRAL)},
                                                 {H1, zoned(H1, Zone::BULL)}};
    EXPECT_EQ(AggregationEngine::aggregate(results, *policy).type, SignalType::BUY);

    results[M2] = zoned(M2, Zone::NEUTRAL);
    auto signal = AggregationEngine::aggregate(results, *policy);
    EXPECT_EQ(signal.type, SignalType::HOLD);
    EXPECT_EQ(signal.gated_by, "structure");
    // 1h alone still dominates the weights
    EXPECT_NEAR(signal.confidence, 6.0 / 8.0, 1e-12);
}

TEST_F(AggregationEngineTest, ConfidenceThresholdHoldsWeakSignals) {
    auto policy = make_component_policy({PolicyComponent::FMACD, PolicyComponent::SMACD},
                                        {{"1m", 1.0}, {"5m", 3.0}},
                                        {{"confidence_threshold", 0.8}});
    std::map<Timeframe, IndicatorResult> results{{M1, zoned(M1, Zone::BEAR)},
                                                 {M5, zoned(M5, Zone::BULL)}};

    auto signal = AggregationEngine::aggregate(results, *policy);
    EXPECT_EQ(signal.type, SignalType::HOLD);
    EXPECT_EQ(signal.gated_by, "confidence");
    EXPECT_DOUBLE_EQ(signal.confidence, 0.75);
    EXPECT_EQ(signal.to_json()["gated_by"], "confidence");

    results.erase(M1);
    EXPECT_EQ(AggregationEngine::aggregate(results, *policy).type, SignalType::BUY);
}

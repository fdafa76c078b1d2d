#include <gtest/gtest.h>
#include "signal_ngin/strategy/strategy_policy.hpp"

using namespace signal_ngin;

class StrategyPolicyTest : public ::testing::Test {
protected:
    PolicyDefinition valid_definition() const {
        PolicyDefinition definition;
        definition.id = 7;
        definition.name = "test policy";
        definition.components = {PolicyComponent::FMACD, PolicyComponent::SMACD};
        definition.weights = {{"1m", 1.0}, {"5m", 2.0}, {"1h", 3.0}};
        definition.consensus_minimum = 2;
        return definition;
    }

    std::vector<Timeframe> timeframes_ = standard_timeframes();
};

TEST_F(StrategyPolicyTest, CreateValidPolicy) {
    auto policy = StrategyPolicy::create(valid_definition(), timeframes_);
    ASSERT_TRUE(policy.is_ok()) << policy.error()->what();

    const auto& p = *policy.value();
    EXPECT_EQ(p.id(), 7);
    EXPECT_EQ(p.weights().size(), 3u);
    EXPECT_EQ(p.weights().begin()->first.label, "1m");
    EXPECT_DOUBLE_EQ(*p.weight_for(Timeframe("5m", 300)), 2.0);
    EXPECT_FALSE(p.weight_for(Timeframe("15m", 900)).has_value());
    EXPECT_TRUE(p.has_component(PolicyComponent::SMACD));
    EXPECT_FALSE(p.has_component(PolicyComponent::MOMENTUM));
    EXPECT_EQ(p.zone_lines(), ZoneLines::BOTH);

    // Parameter defaults; the focus falls back to the narrowest weighted timeframe
    EXPECT_DOUBLE_EQ(p.mt_threshold(), 1.0);
    ASSERT_TRUE(p.focus_timeframe().has_value());
    EXPECT_EQ(p.focus_timeframe()->label, "1m");
    EXPECT_DOUBLE_EQ(p.structure_uniformity_threshold(), 0.8);
    EXPECT_DOUBLE_EQ(p.confidence_threshold(), 0.0);
}

TEST_F(StrategyPolicyTest, MacdComponentsSelectZoneLines) {
    auto definition = valid_definition();
    definition.consensus_minimum = 1;

    definition.components = {PolicyComponent::FMACD, PolicyComponent::BARS_MT};
    EXPECT_EQ(StrategyPolicy::create(definition, timeframes_).value()->zone_lines(),
              ZoneLines::FAST_ONLY);

    definition.components = {PolicyComponent::SMACD};
    EXPECT_EQ(StrategyPolicy::create(definition, timeframes_).value()->zone_lines(),
              ZoneLines::SIGNAL_ONLY);

    definition.components = {PolicyComponent::MOMENTUM};
    EXPECT_EQ(StrategyPolicy::create(definition, timeframes_).value()->zone_lines(),
              ZoneLines::BOTH);
}

TEST_F(StrategyPolicyTest, CustomParamsAreParsed) {
    auto definition = valid_definition();
    definition.custom_params = {{"mt_threshold", 0.5},
                                {"focus_tf", "5m"},
                                {"structure_uniformity_threshold", 0.6},
                                {"confidence_threshold", 0.7},
                                {"note", "kept as is"}};
    auto policy = StrategyPolicy::create(definition, timeframes_);
    ASSERT_TRUE(policy.is_ok()) << policy.error()->what();
    EXPECT_DOUBLE_EQ(policy.value()->mt_threshold(), 0.5);
    EXPECT_EQ(policy.value()->focus_timeframe()->label, "5m");
    EXPECT_DOUBLE_EQ(policy.value()->structure_uniformity_threshold(), 0.6);
    EXPECT_DOUBLE_EQ(policy.value()->confidence_threshold(), 0.7);
    EXPECT_EQ(policy.value()->to_definition().custom_params["note"], "kept as is");
}

TEST_F(StrategyPolicyTest, RejectsInvalidCustomParams) {
    auto expect_rejected = [&](nlohmann::json params) {
        auto definition = valid_definition();
        definition.custom_params = params;
        auto policy = StrategyPolicy::create(definition, timeframes_);
        ASSERT_TRUE(policy.is_error()) << params.dump();
        EXPECT_EQ(policy.error()->code(), ErrorCode::CONFIGURATION_ERROR);
    };

    expect_rejected({{"mt_threshold", 0.0}});
    expect_rejected({{"mt_threshold", "high"}});
    expect_rejected({{"focus_tf", "15m"}});  // known but unweighted
    expect_rejected({{"focus_tf", "3m"}});
    expect_rejected({{"focus_tf", 5}});
    expect_rejected({{"structure_uniformity_threshold", 0.0}});
    expect_rejected({{"structure_uniformity_threshold", 1.5}});
    expect_rejected({{"confidence_threshold", -0.1}});
    expect_rejected(nlohmann::json::array());
}

TEST_F(StrategyPolicyTest, RejectsUnknownWeightTimeframe) {
    auto definition = valid_definition();
    definition.weights["3m"] = 1.0;
    auto policy = StrategyPolicy::create(definition, timeframes_);
    ASSERT_TRUE(policy.is_error());
    EXPECT_EQ(policy.error()->code(), ErrorCode::CONFIGURATION_ERROR);
}

TEST_F(StrategyPolicyTest, RejectsNonPositiveWeight) {
    auto definition = valid_definition();
    definition.weights["5m"] = 0.0;
    EXPECT_TRUE(StrategyPolicy::create(definition, timeframes_).is_error());
}

TEST_F(StrategyPolicyTest, RejectsConsensusAboveComponentCount) {
    auto definition = valid_definition();
    definition.consensus_minimum = 3;
    EXPECT_TRUE(StrategyPolicy::create(definition, timeframes_).is_error());

    definition.consensus_minimum = -1;
    EXPECT_TRUE(StrategyPolicy::create(definition, timeframes_).is_error());
}

TEST_F(StrategyPolicyTest, SyncTimeframesMustBeWeighted) {
    auto definition = valid_definition();
    definition.require_synchronization = true;
    EXPECT_TRUE(StrategyPolicy::create(definition, timeframes_).is_error());

    definition.sync_timeframes = {"15m"};
    EXPECT_TRUE(StrategyPolicy::create(definition, timeframes_).is_error());

    definition.sync_timeframes = {"5m", "1m"};
    auto policy = StrategyPolicy::create(definition, timeframes_);
    ASSERT_TRUE(policy.is_ok());
    ASSERT_EQ(policy.value()->sync_timeframes().size(), 2u);
    EXPECT_EQ(policy.value()->sync_timeframes()[0].label, "1m");
}

TEST_F(StrategyPolicyTest, RejectsRepeatedComponentsAndBadIdentity) {
    auto definition = valid_definition();
    definition.components.push_back(PolicyComponent::FMACD);
    EXPECT_TRUE(StrategyPolicy::create(definition, timeframes_).is_error());

    definition = valid_definition();
    definition.id = 0;
    EXPECT_TRUE(StrategyPolicy::create(definition, timeframes_).is_error());

    definition = valid_definition();
    definition.name.clear();
    EXPECT_TRUE(StrategyPolicy::create(definition, timeframes_).is_error());
}

TEST_F(StrategyPolicyTest, BuiltinPresetsAreValid) {
    auto presets = builtin_policy_definitions();
    ASSERT_EQ(presets.size(), 4u);
    for (const auto& preset : presets) {
        auto policy = StrategyPolicy::create(preset, timeframes_);
        EXPECT_TRUE(policy.is_ok()) << preset.name << ": " << policy.error()->what();
    }

    auto trinity = StrategyPolicy::create(presets[1], timeframes_);
    ASSERT_TRUE(trinity.is_ok());
    EXPECT_TRUE(trinity.value()->require_synchronization());
    EXPECT_EQ(trinity.value()->sync_timeframes().size(), 3u);
    EXPECT_DOUBLE_EQ(*trinity.value()->weight_for(Timeframe("4h", 14400)), 8.0);

    auto momentum = StrategyPolicy::create(presets[2], timeframes_);
    ASSERT_TRUE(momentum.is_ok());
    EXPECT_EQ(momentum.value()->focus_timeframe()->label, "5m");
    EXPECT_DOUBLE_EQ(momentum.value()->mt_threshold(), 1.0);

    auto structure = StrategyPolicy::create(presets[3], timeframes_);
    ASSERT_TRUE(structure.is_ok());
    EXPECT_DOUBLE_EQ(structure.value()->structure_uniformity_threshold(), 0.8);
}

TEST_F(StrategyPolicyTest, DefinitionJson) {
    nlohmann::json j = {{"id", 12},
                        {"name", "json policy"},
                        {"components", {"fmacd", "momentum"}},
                        {"weights", {{"15m", 2.5}}},
                        {"consensus_minimum", 1}};
    PolicyDefinition definition;
    definition.from_json(j);
    EXPECT_EQ(definition.id, 12);
    ASSERT_EQ(definition.components.size(), 2u);
    EXPECT_EQ(definition.components[1], PolicyComponent::MOMENTUM);

    auto policy = StrategyPolicy::create(definition, timeframes_);
    ASSERT_TRUE(policy.is_ok());
    EXPECT_EQ(policy.value()->to_definition().weights.at("15m"), 2.5);

    PolicyDefinition bad;
    EXPECT_THROW(bad.from_json({{"components", {"rsi"}}}), std::invalid_argument);
}

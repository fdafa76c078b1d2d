#include <gtest/gtest.h>
#include <limits>
#include "signal_ngin/strategy/zone_classifier.hpp"

using namespace signal_ngin;

class ZoneClassifierTest : public ::testing::Test {};

TEST_F(ZoneClassifierTest, BullNeedsBothLinesPositive) {
    EXPECT_EQ(ZoneClassifier::classify(0.5, 0.1, 0.33), Zone::BULL);
    EXPECT_EQ(ZoneClassifier::classify(0.1, 0.33, 0.33), Zone::BULL);
    EXPECT_EQ(ZoneClassifier::classify(0.5, -0.1, 0.33), Zone::NEUTRAL);
    EXPECT_EQ(ZoneClassifier::classify(0.5, 0.0, 0.33), Zone::NEUTRAL);
}

TEST_F(ZoneClassifierTest, BearNeedsBothLinesNegative) {
    EXPECT_EQ(ZoneClassifier::classify(-0.5, -0.1, 0.33), Zone::BEAR);
    EXPECT_EQ(ZoneClassifier::classify(-0.1, -0.33, 0.33), Zone::BEAR);
    EXPECT_EQ(ZoneClassifier::classify(-0.5, 0.1, 0.33), Zone::NEUTRAL);
}

TEST_F(ZoneClassifierTest, InsideBandIsNeutral) {
    EXPECT_EQ(ZoneClassifier::classify(0.2, 0.2, 0.33), Zone::NEUTRAL);
    EXPECT_EQ(ZoneClassifier::classify(-0.2, -0.32, 0.33), Zone::NEUTRAL);
    EXPECT_EQ(ZoneClassifier::classify(0.0, 0.0, 0.33), Zone::NEUTRAL);
}

TEST_F(ZoneClassifierTest, SymmetricUnderNegation) {
    const double samples[] = {-1.0, -0.4, -0.33, -0.1, 0.0, 0.1, 0.33, 0.4, 1.0};
    for (double fast : samples) {
        for (double signal : samples) {
            Zone up = ZoneClassifier::classify(fast, signal, 0.33);
            Zone down = ZoneClassifier::classify(-fast, -signal, 0.33);
            if (up == Zone::BULL) {
                EXPECT_EQ(down, Zone::BEAR) << fast << "," << signal;
            } else if (up == Zone::BEAR) {
                EXPECT_EQ(down, Zone::BULL) << fast << "," << signal;
            } else {
                EXPECT_EQ(down, Zone::NEUTRAL) << fast << "," << signal;
            }
        }
    }
}

TEST_F(ZoneClassifierTest, PerLineThresholds) {
    auto thresholds = ThresholdSet::create(1.0, 0.2);
    ASSERT_TRUE(thresholds.is_ok());

    // fast below its bound, signal above its own
    EXPECT_EQ(ZoneClassifier::classify(0.5, 0.25, thresholds.value()), Zone::BULL);
    EXPECT_EQ(ZoneClassifier::classify(0.5, 0.15, thresholds.value()), Zone::NEUTRAL);
    EXPECT_EQ(ZoneClassifier::classify(-1.0, -0.1, thresholds.value()), Zone::BEAR);
}

TEST_F(ZoneClassifierTest, UniformSetMatchesScalarRule) {
    auto thresholds = ThresholdSet::uniform(0.33);
    ASSERT_TRUE(thresholds.is_ok());
    const double samples[] = {-0.5, -0.33, -0.2, 0.0, 0.2, 0.33, 0.5};
    for (double fast : samples) {
        for (double signal : samples) {
            EXPECT_EQ(ZoneClassifier::classify(fast, signal, thresholds.value()),
                      ZoneClassifier::classify(fast, signal, 0.33));
        }
    }
}

TEST_F(ZoneClassifierTest, InvalidThresholdsRejected) {
    EXPECT_TRUE(ThresholdSet::create(0.0, 0.33).is_error());
    EXPECT_TRUE(ThresholdSet::create(0.33, -1.0).is_error());
    EXPECT_TRUE(ThresholdSet::create(std::numeric_limits<double>::quiet_NaN(), 0.33).is_error());
    EXPECT_TRUE(ThresholdSet::uniform(std::numeric_limits<double>::infinity()).is_error());

    auto error = ThresholdSet::create(0.0, 0.0);
    EXPECT_EQ(error.error()->code(), ErrorCode::CONFIGURATION_ERROR);
}

TEST_F(ZoneClassifierTest, SingleLineClassification) {
    auto thresholds = ThresholdSet::create(0.5, 0.2);
    ASSERT_TRUE(thresholds.is_ok());

    // Signal line below zero blocks BULL only when both lines are read
    EXPECT_EQ(ZoneClassifier::classify(0.6, -0.1, thresholds.value(), ZoneLines::BOTH),
              Zone::NEUTRAL);
    EXPECT_EQ(ZoneClassifier::classify(0.6, -0.1, thresholds.value(), ZoneLines::FAST_ONLY),
              Zone::BULL);
    EXPECT_EQ(ZoneClassifier::classify(0.6, -0.1, thresholds.value(), ZoneLines::SIGNAL_ONLY),
              Zone::NEUTRAL);

    EXPECT_EQ(ZoneClassifier::classify(0.1, -0.2, thresholds.value(), ZoneLines::SIGNAL_ONLY),
              Zone::BEAR);
    EXPECT_EQ(ZoneClassifier::classify(0.1, -0.2, thresholds.value(), ZoneLines::FAST_ONLY),
              Zone::NEUTRAL);
    EXPECT_EQ(ZoneClassifier::classify(-0.5, 0.0, thresholds.value(), ZoneLines::FAST_ONLY),
              Zone::BEAR);
}

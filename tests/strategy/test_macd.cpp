#include <gtest/gtest.h>
#include "signal_ngin/core/time_utils.hpp"
#include "signal_ngin/strategy/macd.hpp"

using namespace signal_ngin;

class MacdTest : public ::testing::Test {
protected:
    static Candle candle(int64_t minute, double close) {
        return Candle(core::from_epoch_seconds(minute * 60), close, close, close, close, 1.0,
                      "HOSE:VNM", "1m");
    }

    MacdParams params_{3, 6, 4};
};

TEST_F(MacdTest, FirstCandleSeedsEmas) {
    MacdCalculator calc(params_);
    MacdState state;
    EXPECT_FALSE(state.initialized());

    ASSERT_TRUE(calc.update(state, candle(1, 100.0)));
    EXPECT_TRUE(state.initialized());
    EXPECT_DOUBLE_EQ(state.ema_fast, 100.0);
    EXPECT_DOUBLE_EQ(state.ema_slow, 100.0);
    EXPECT_DOUBLE_EQ(state.macd(), 0.0);
    EXPECT_DOUBLE_EQ(state.signal(), 0.0);
}

TEST_F(MacdTest, UpdateFollowsEmaRecurrence) {
    MacdCalculator calc(params_);
    MacdState state;
    calc.update(state, candle(1, 100.0));
    calc.update(state, candle(2, 110.0));

    const double fast = 100.0 + (2.0 / 4.0) * 10.0;
    const double slow = 100.0 + (2.0 / 7.0) * 10.0;
    EXPECT_DOUBLE_EQ(state.ema_fast, fast);
    EXPECT_DOUBLE_EQ(state.ema_slow, slow);
    EXPECT_DOUBLE_EQ(state.signal(), (2.0 / 5.0) * (fast - slow));
    EXPECT_EQ(state.bars, 2);
}

TEST_F(MacdTest, RisingSeriesIsPositive) {
    MacdCalculator calc(params_);
    std::vector<Candle> candles;
    for (int i = 0; i < 50; ++i) {
        candles.push_back(candle(i, 100.0 + i));
    }
    MacdState state = calc.seed(candles);
    EXPECT_GT(state.macd(), 0.0);
    EXPECT_GT(state.signal(), 0.0);
    EXPECT_EQ(state.bars, 50);
}

TEST_F(MacdTest, StaleCandlesAreIgnored) {
    MacdCalculator calc(params_);
    MacdState state;
    calc.update(state, candle(5, 100.0));
    MacdState before = state;

    EXPECT_FALSE(calc.update(state, candle(5, 200.0)));
    EXPECT_FALSE(calc.update(state, candle(4, 200.0)));
    EXPECT_DOUBLE_EQ(state.ema_fast, before.ema_fast);
    EXPECT_EQ(state.bars, 1);
}

TEST_F(MacdTest, IncrementalMatchesSeed) {
    MacdCalculator calc(params_);
    std::vector<Candle> candles;
    for (int i = 0; i < 20; ++i) {
        candles.push_back(candle(i, 100.0 + (i % 3) - (i % 5)));
    }

    MacdState seeded = calc.seed(std::vector<Candle>(candles.begin(), candles.begin() + 15));
    for (size_t i = 15; i < candles.size(); ++i) {
        calc.update(seeded, candles[i]);
    }
    MacdState full = calc.seed(candles);

    EXPECT_DOUBLE_EQ(seeded.macd(), full.macd());
    EXPECT_DOUBLE_EQ(seeded.signal(), full.signal());
}

TEST_F(MacdTest, InvalidParams) {
    EXPECT_TRUE(MacdCalculator::validate({0, 6, 4}).is_error());
    EXPECT_TRUE(MacdCalculator::validate({6, 6, 4}).is_error());
    EXPECT_TRUE(MacdCalculator::validate({3, 6, -1}).is_error());
    EXPECT_THROW(MacdCalculator(MacdParams{8, 4, 2}), std::invalid_argument);
    EXPECT_EQ(MacdParams().lookback_bars(), 144 * 3);
}

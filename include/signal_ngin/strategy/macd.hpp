// include/signal_ngin/strategy/macd.hpp
#pragma once

#include <cstdint>
#include <vector>
#include "signal_ngin/core/error.hpp"
#include "signal_ngin/core/types.hpp"

namespace signal_ngin {

/**
 * @brief EMA periods of the fast/slow/signal oscillator
 */
struct MacdParams {
    int fast_period{7};
    int slow_period{72};
    int signal_period{144};

    /**
     * @brief Bars needed before the signal line is meaningful
     */
    int lookback_bars() const {
        return (slow_period > signal_period ? slow_period : signal_period) * 3;
    }
};

/**
 * @brief Incremental oscillator state for one instrument and timeframe
 */
struct MacdState {
    double ema_fast{0.0};
    double ema_slow{0.0};
    double ema_signal{0.0};
    int64_t bars{0};
    Timestamp last_candle_time{};

    bool initialized() const {
        return bars > 0;
    }

    // MACD line: fast EMA minus slow EMA
    double macd() const {
        return ema_fast - ema_slow;
    }

    double signal() const {
        return ema_signal;
    }
};

/**
 * @brief Folds closes into a MacdState
 *
 * EMAs use alpha = 2 / (period + 1) and are seeded with the first close.
 * The signal line is the EMA of the MACD line.
 */
class MacdCalculator {
public:
    /**
     * @throws std::invalid_argument if any period is not positive or
     *         fast_period >= slow_period
     */
    explicit MacdCalculator(MacdParams params);

    static Result<void> validate(const MacdParams& params);

    /**
     * @brief Advance the state by one closed candle
     * Candles not newer than state.last_candle_time are ignored.
     * @return true if the state advanced
     */
    bool update(MacdState& state, const Candle& candle) const;

    /**
     * @brief Build a fresh state from candles in ascending time order
     */
    MacdState seed(const std::vector<Candle>& candles) const;

    const MacdParams& params() const {
        return params_;
    }

private:
    MacdParams params_;
    double alpha_fast_;
    double alpha_slow_;
    double alpha_signal_;
};

}  // namespace signal_ngin

// src/strategy/macd.cpp

#include "signal_ngin/strategy/macd.hpp"
#include <stdexcept>

namespace signal_ngin {

MacdCalculator::MacdCalculator(MacdParams params) : params_(params) {
    auto valid = validate(params_);
    if (valid.is_error()) {
        throw std::invalid_argument(valid.error()->what());
    }
    alpha_fast_ = 2.0 / (params_.fast_period + 1.0);
    alpha_slow_ = 2.0 / (params_.slow_period + 1.0);
    alpha_signal_ = 2.0 / (params_.signal_period + 1.0);
}

Result<void> MacdCalculator::validate(const MacdParams& params) {
    if (params.fast_period <= 0 || params.slow_period <= 0 || params.signal_period <= 0) {
        return make_error<void>(ErrorCode::CONFIGURATION_ERROR, "MACD periods must be positive",
                                "MacdCalculator");
    }
    if (params.fast_period >= params.slow_period) {
        return make_error<void>(ErrorCode::CONFIGURATION_ERROR,
                                "MACD fast period must be shorter than slow period",
                                "MacdCalculator");
    }
    return Result<void>();
}

bool MacdCalculator::update(MacdState& state, const Candle& candle) const {
    if (state.initialized() && candle.timestamp <= state.last_candle_time) {
        return false;
    }

    const double close = candle.close;
    if (!state.initialized()) {
        state.ema_fast = close;
        state.ema_slow = close;
        state.ema_signal = 0.0;
    } else {
        state.ema_fast += alpha_fast_ * (close - state.ema_fast);
        state.ema_slow += alpha_slow_ * (close - state.ema_slow);
        state.ema_signal += alpha_signal_ * (state.macd() - state.ema_signal);
    }

    state.bars++;
    state.last_candle_time = candle.timestamp;
    return true;
}

MacdState MacdCalculator::seed(const std::vector<Candle>& candles) const {
    MacdState state;
    for (const auto& candle : candles) {
        update(state, candle);
    }
    return state;
}

}  // namespace signal_ngin

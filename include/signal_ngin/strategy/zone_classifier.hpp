// include/signal_ngin/strategy/zone_classifier.hpp
#pragma once

#include <cmath>
#include "signal_ngin/core/error.hpp"
#include "signal_ngin/core/types.hpp"

namespace signal_ngin {

/**
 * @brief Validated per-instrument, per-timeframe zone bounds
 *
 * fast applies to the MACD line, signal to its signal line. Both are
 * strictly positive and finite.
 */
class ThresholdSet {
public:
    static Result<ThresholdSet> create(double fast, double signal);

    static Result<ThresholdSet> uniform(double threshold) {
        return create(threshold, threshold);
    }

    ThresholdSet() = default;

    double fast() const {
        return fast_;
    }
    double signal() const {
        return signal_;
    }

    bool operator==(const ThresholdSet& other) const {
        return fast_ == other.fast_ && signal_ == other.signal_;
    }

private:
    ThresholdSet(double fast, double signal) : fast_(fast), signal_(signal) {}

    double fast_{0.33};
    double signal_{0.33};
};

/**
 * @brief MACD lines a classification reads
 */
enum class ZoneLines { BOTH, FAST_ONLY, SIGNAL_ONLY };

/**
 * @brief Maps one timeframe's oscillator values to BULL/BEAR/NEUTRAL
 *
 * BULL when (fast >= t or signal >= t) and both lines are above zero;
 * BEAR when (fast <= -t or signal <= -t) and both lines are below zero;
 * NEUTRAL otherwise.
 */
class ZoneClassifier {
public:
    static Zone classify(double fast, double signal, double threshold) {
        if ((fast >= threshold || signal >= threshold) && fast > 0 && signal > 0) {
            return Zone::BULL;
        }
        if ((fast <= -threshold || signal <= -threshold) && fast < 0 && signal < 0) {
            return Zone::BEAR;
        }
        return Zone::NEUTRAL;
    }

    /**
     * @brief Per-line thresholds; identical to the scalar rule when
     *        thresholds.fast() == thresholds.signal()
     */
    static Zone classify(double fast, double signal, const ThresholdSet& thresholds) {
        const double tf = thresholds.fast();
        const double ts = thresholds.signal();
        if ((fast >= tf || signal >= ts) && fast > 0 && signal > 0) {
            return Zone::BULL;
        }
        if ((fast <= -tf || signal <= -ts) && fast < 0 && signal < 0) {
            return Zone::BEAR;
        }
        return Zone::NEUTRAL;
    }

    /**
     * @brief Restrict the rule to one line: with FAST_ONLY, BULL when
     *        fast >= thresholds.fast() and BEAR when fast <= -thresholds.fast()
     *        (SIGNAL_ONLY mirrors it on the signal line)
     */
    static Zone classify(double fast, double signal, const ThresholdSet& thresholds,
                         ZoneLines lines) {
        switch (lines) {
            case ZoneLines::BOTH:
                return classify(fast, signal, thresholds);
            case ZoneLines::FAST_ONLY:
                return classify_line(fast, thresholds.fast());
            case ZoneLines::SIGNAL_ONLY:
                return classify_line(signal, thresholds.signal());
        }
        return Zone::NEUTRAL;
    }

private:
    static Zone classify_line(double value, double threshold) {
        if (value >= threshold) {
            return Zone::BULL;
        }
        if (value <= -threshold) {
            return Zone::BEAR;
        }
        return Zone::NEUTRAL;
    }
};

inline Result<ThresholdSet> ThresholdSet::create(double fast, double signal) {
    if (!std::isfinite(fast) || !std::isfinite(signal) || fast <= 0.0 || signal <= 0.0) {
        return make_error<ThresholdSet>(ErrorCode::CONFIGURATION_ERROR,
                                        "Thresholds must be finite and greater than zero (fast=" +
                                            std::to_string(fast) +
                                            ", signal=" + std::to_string(signal) + ")",
                                        "ThresholdSet");
    }
    return Result<ThresholdSet>(ThresholdSet(fast, signal));
}

}  // namespace signal_ngin

// include/signal_ngin/core/types.hpp

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace signal_ngin {

/**
 * @brief Timestamp type for consistent time representation
 * Uses std::chrono for type-safe time handling
 */
using Timestamp = std::chrono::system_clock::time_point;

/**
 * @brief Price type with double precision
 */
using Price = double;

/**
 * @brief A sampling interval such as "2m" or "1h"
 * Ordered by its width in seconds
 */
struct Timeframe {
    std::string label;
    int64_t seconds{0};

    Timeframe() = default;
    Timeframe(std::string l, int64_t s) : label(std::move(l)), seconds(s) {}

    bool operator<(const Timeframe& other) const {
        if (seconds != other.seconds)
            return seconds < other.seconds;
        return label < other.label;
    }
    bool operator==(const Timeframe& other) const {
        return seconds == other.seconds && label == other.label;
    }
    bool operator!=(const Timeframe& other) const {
        return !(*this == other);
    }
};

/**
 * @brief Parse a timeframe label ("30s", "5m", "1h", "1d")
 * @return The timeframe, or std::nullopt if the label is malformed
 */
inline std::optional<Timeframe> parse_timeframe(const std::string& label) {
    if (label.size() < 2)
        return std::nullopt;

    int64_t multiplier = 0;
    switch (label.back()) {
        case 's':
            multiplier = 1;
            break;
        case 'm':
            multiplier = 60;
            break;
        case 'h':
            multiplier = 3600;
            break;
        case 'd':
            multiplier = 86400;
            break;
        default:
            return std::nullopt;
    }

    int64_t count = 0;
    for (size_t i = 0; i + 1 < label.size(); ++i) {
        char c = label[i];
        if (c < '0' || c > '9')
            return std::nullopt;
        count = count * 10 + (c - '0');
        if (count > 1000000)
            return std::nullopt;
    }
    if (count <= 0)
        return std::nullopt;

    return Timeframe(label, count * multiplier);
}

/**
 * @brief A tradable symbol on a venue
 */
struct Instrument {
    std::string ticker;
    std::string venue;
    bool active{true};

    Instrument() = default;
    Instrument(std::string t, std::string v, bool a = true)
        : ticker(std::move(t)), venue(std::move(v)), active(a) {}

    // Unique across venues, e.g. "HOSE:VCB"
    std::string key() const {
        return venue + ":" + ticker;
    }

    bool operator==(const Instrument& other) const {
        return ticker == other.ticker && venue == other.venue;
    }
    bool operator<(const Instrument& other) const {
        return key() < other.key();
    }
};

/**
 * @brief One price tick from a quote stream
 */
struct Tick {
    Timestamp timestamp;
    Price bid{0.0};
    Price ask{0.0};
    double volume{0.0};

    Price mid() const {
        return (bid + ask) / 2.0;
    }
};

/**
 * @brief One OHLCV bar for an instrument and timeframe
 * timestamp is the bucket start, aligned to the timeframe width
 */
struct Candle {
    Timestamp timestamp;
    Price open{0.0};
    Price high{0.0};
    Price low{0.0};
    Price close{0.0};
    double volume{0.0};
    std::string instrument;
    std::string timeframe;

    Candle() = default;
    Candle(Timestamp ts, Price o, Price h, Price l, Price c, double v, std::string inst,
           std::string tf)
        : timestamp(ts),
          open(o),
          high(h),
          low(l),
          close(c),
          volume(v),
          instrument(std::move(inst)),
          timeframe(std::move(tf)) {}
};

/**
 * @brief Inclusive time window [start, end]
 */
struct TimeWindow {
    Timestamp start;
    Timestamp end;
};

/**
 * @brief Exclusivity marker held by at most one owner per workflow class
 */
struct ActiveWorkflowMarker {
    std::string workflow_class;
    std::string owner;
    Timestamp acquired_at;
    Timestamp expires_at;
};

/**
 * @brief Per-timeframe classification
 */
enum class Zone { BULL, BEAR, NEUTRAL };

/**
 * @brief Final aggregated decision
 */
enum class SignalType { BUY, SELL, HOLD };

/**
 * @brief Pipeline run mode
 */
enum class RunMode { BACKFILL, REALTIME };

inline std::string zone_to_string(Zone zone) {
    switch (zone) {
        case Zone::BULL:
            return "BULL";
        case Zone::BEAR:
            return "BEAR";
        case Zone::NEUTRAL:
            return "NEUTRAL";
    }
    return "UNKNOWN";
}

inline std::string signal_type_to_string(SignalType type) {
    switch (type) {
        case SignalType::BUY:
            return "BUY";
        case SignalType::SELL:
            return "SELL";
        case SignalType::HOLD:
            return "HOLD";
    }
    return "UNKNOWN";
}

inline std::string run_mode_to_string(RunMode mode) {
    switch (mode) {
        case RunMode::BACKFILL:
            return "BACKFILL";
        case RunMode::REALTIME:
            return "REALTIME";
    }
    return "UNKNOWN";
}

}  // namespace signal_ngin

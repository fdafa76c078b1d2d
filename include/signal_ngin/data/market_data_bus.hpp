// include/signal_ngin/data/market_data_bus.hpp
#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include "signal_ngin/core/error.hpp"
#include "signal_ngin/core/types.hpp"

namespace signal_ngin {

/**
 * @brief Type of market data event
 */
enum class MarketDataEventType {
    TICK,
    CANDLE_CLOSED,
    SIGNAL
};

/**
 * @brief Market data event structure
 * symbol carries the instrument key ("VENUE:TICKER")
 */
struct MarketDataEvent {
    MarketDataEventType type;
    std::string symbol;
    Timestamp timestamp;
    std::unordered_map<std::string, double> numeric_fields;
    std::unordered_map<std::string, std::string> string_fields;
};

using MarketDataCallback = std::function<void(const MarketDataEvent&)>;

struct SubscriberInfo {
    std::string id;
    std::vector<MarketDataEventType> event_types;
    std::vector<std::string> symbols;  // empty means all symbols
    MarketDataCallback callback;
};

/**
 * @brief Event bus distributing closed candles and emitted signals
 */
class MarketDataBus {
public:
    /**
     * @brief Subscribe to market data events
     * @param subscriber_info Subscriber configuration
     * @return Result indicating success or failure
     */
    Result<void> subscribe(const SubscriberInfo& subscriber_info);

    /**
     * @brief Unsubscribe from market data events
     * @param subscriber_id Subscriber identifier
     * @return Result indicating success or failure
     */
    Result<void> unsubscribe(const std::string& subscriber_id);

    /**
     * @brief Publish an event to every matching active subscriber
     * Subscriber exceptions are logged and never reach the publisher.
     */
    void publish(const MarketDataEvent& event);

    void set_publish_enabled(bool enabled) {
        publish_enabled_.store(enabled);
    }

    static MarketDataBus& instance() {
        static MarketDataBus instance;
        return instance;
    }

private:
    MarketDataBus() = default;

    struct Subscription {
        std::vector<MarketDataEventType> event_types;
        std::vector<std::string> symbols;
        MarketDataCallback callback;
        bool active{true};
    };

    std::unordered_map<std::string, Subscription> subscriptions_;
    mutable std::mutex mutex_;
    std::atomic<bool> publish_enabled_{true};

    bool should_notify(const Subscription& sub, const MarketDataEvent& event) const;
};

}  // namespace signal_ngin

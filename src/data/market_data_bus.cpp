// src/data/market_data_bus.cpp

#include "signal_ngin/data/market_data_bus.hpp"
#include <algorithm>
#include "signal_ngin/core/logger.hpp"

namespace signal_ngin {

Result<void> MarketDataBus::subscribe(const SubscriberInfo& subscriber_info) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (subscriber_info.id.empty()) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "Subscriber ID cannot be empty",
                                "MarketDataBus");
    }

    if (subscriber_info.event_types.empty()) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Must subscribe to at least one event type", "MarketDataBus");
    }

    if (!subscriber_info.callback) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "Callback function cannot be null",
                                "MarketDataBus");
    }

    subscriptions_[subscriber_info.id] = Subscription{
        subscriber_info.event_types, subscriber_info.symbols, subscriber_info.callback, true};

    DEBUG("Added subscription for " << subscriber_info.id << " with "
                                    << subscriber_info.event_types.size() << " event types and "
                                    << subscriber_info.symbols.size() << " symbols");

    return Result<void>();
}

Result<void> MarketDataBus::unsubscribe(const std::string& subscriber_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = subscriptions_.find(subscriber_id);
    if (it == subscriptions_.end()) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Subscriber ID not found: " + subscriber_id, "MarketDataBus");
    }

    it->second.active = false;
    DEBUG("Deactivated subscription for " << subscriber_id);

    return Result<void>();
}

void MarketDataBus::publish(const MarketDataEvent& event) {
    if (!publish_enabled_.load()) {
        return;
    }

    // Callbacks run outside the lock so a subscriber may publish or unsubscribe
    std::vector<std::pair<std::string, MarketDataCallback>> targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, sub] : subscriptions_) {
            if (sub.active && should_notify(sub, event)) {
                targets.emplace_back(id, sub.callback);
            }
        }
    }

    for (const auto& [id, callback] : targets) {
        try {
            callback(event);
        } catch (const std::exception& e) {
            ERROR("Error in subscriber callback for " << id << ": " << e.what());
        }
    }
}

bool MarketDataBus::should_notify(const Subscription& sub, const MarketDataEvent& event) const {
    if (std::find(sub.event_types.begin(), sub.event_types.end(), event.type) ==
        sub.event_types.end()) {
        return false;
    }

    if (sub.symbols.empty()) {
        return true;
    }

    return std::find(sub.symbols.begin(), sub.symbols.end(), event.symbol) != sub.symbols.end();
}

}  // namespace signal_ngin

// include/signal_ngin/scheduler/dedupe_window.hpp
#pragma once

#include <chrono>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include "signal_ngin/core/types.hpp"

namespace signal_ngin {

/**
 * @brief TTL-bounded set of admitted dedupe keys
 *
 * A key admitted at t blocks the same key until t + ttl. Expired keys are
 * evicted on every access, so the set never outgrows the keys admitted
 * within one window.
 */
class DedupeWindow {
public:
    using Clock = std::function<Timestamp()>;

    explicit DedupeWindow(Clock clock = nullptr);

    /**
     * @brief Admit key unless it was admitted within its window
     * @return true if admitted
     */
    bool try_admit(const std::string& key, std::chrono::seconds ttl);

    bool contains(const std::string& key);

    /**
     * @brief Drop a key early, e.g. when its job could not be enqueued
     */
    void forget(const std::string& key);

    size_t size();

private:
    void evict_expired_locked(Timestamp now);

    Clock clock_;
    std::mutex mutex_;
    std::unordered_map<std::string, Timestamp> expiry_;
};

}  // namespace signal_ngin

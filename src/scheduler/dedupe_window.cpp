// src/scheduler/dedupe_window.cpp

#include "signal_ngin/scheduler/dedupe_window.hpp"

namespace signal_ngin {

DedupeWindow::DedupeWindow(Clock clock) : clock_(std::move(clock)) {
    if (!clock_) {
        clock_ = [] { return std::chrono::system_clock::now(); };
    }
}

bool DedupeWindow::try_admit(const std::string& key, std::chrono::seconds ttl) {
    std::lock_guard<std::mutex> lock(mutex_);
    const Timestamp now = clock_();
    evict_expired_locked(now);

    if (expiry_.count(key) > 0) {
        return false;
    }
    expiry_[key] = now + ttl;
    return true;
}

bool DedupeWindow::contains(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    evict_expired_locked(clock_());
    return expiry_.count(key) > 0;
}

void DedupeWindow::forget(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    expiry_.erase(key);
}

size_t DedupeWindow::size() {
    std::lock_guard<std::mutex> lock(mutex_);
    evict_expired_locked(clock_());
    return expiry_.size();
}

void DedupeWindow::evict_expired_locked(Timestamp now) {
    for (auto it = expiry_.begin(); it != expiry_.end();) {
        if (it->second <= now) {
            it = expiry_.erase(it);
        } else {
            ++it;
        }
    }
}

}  // namespace signal_ngin

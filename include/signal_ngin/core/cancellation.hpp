// include/signal_ngin/core/cancellation.hpp
#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

namespace signal_ngin {

/**
 * @brief Shared cancellation flag with an interruptible wait
 * Copies observe the same flag.
 */
class CancellationToken {
public:
    CancellationToken() : state_(std::make_shared<State>()) {}

    void cancel() {
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            state_->cancelled = true;
        }
        state_->cv.notify_all();
    }

    bool is_cancelled() const {
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->cancelled;
    }

    /**
     * @brief Sleep for up to timeout, waking early on cancellation
     * @return true if the token was cancelled
     */
    template <typename Rep, typename Period>
    bool wait_for(const std::chrono::duration<Rep, Period>& timeout) const {
        std::unique_lock<std::mutex> lock(state_->mutex);
        return state_->cv.wait_for(lock, timeout, [this] { return state_->cancelled; });
    }

private:
    struct State {
        std::mutex mutex;
        std::condition_variable cv;
        bool cancelled{false};
    };

    std::shared_ptr<State> state_;
};

}  // namespace signal_ngin

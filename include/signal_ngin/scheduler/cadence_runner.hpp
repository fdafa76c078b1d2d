// include/signal_ngin/scheduler/cadence_runner.hpp
#pragma once

#include <chrono>
#include <functional>
#include <string>
#include "signal_ngin/core/cancellation.hpp"
#include "signal_ngin/core/error.hpp"

namespace signal_ngin {

/**
 * @brief Retry policy after a failed iteration
 */
struct BackoffPolicy {
    std::chrono::milliseconds initial_backoff{1000};
    std::chrono::milliseconds max_backoff{60000};
    int max_consecutive_failures{10};

    /**
     * @brief initial_backoff * 2^(failures - 1), capped at max_backoff
     */
    std::chrono::milliseconds delay_after(int consecutive_failures) const;
};

/**
 * @brief Runs a task on a fixed interval until cancelled
 *
 * The wait between iterations is the only suspension point and wakes
 * immediately on cancellation.
 */
class CadenceRunner {
public:
    using Task = std::function<Result<void>()>;

    /**
     * @throws std::invalid_argument on an empty task or non-positive interval
     */
    CadenceRunner(std::string name, std::chrono::milliseconds interval, Task task,
                  BackoffPolicy backoff = BackoffPolicy());

    /**
     * @brief Loop until the token is cancelled
     * @return Success on cancellation, or the last task error once
     *         max_consecutive_failures is reached
     */
    Result<void> run(const CancellationToken& cancel);

    size_t iterations() const {
        return iterations_;
    }

private:
    std::string name_;
    std::chrono::milliseconds interval_;
    Task task_;
    BackoffPolicy backoff_;
    size_t iterations_{0};
};

}  // namespace signal_ngin

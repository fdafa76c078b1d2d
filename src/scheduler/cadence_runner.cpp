// src/scheduler/cadence_runner.cpp

#include "signal_ngin/scheduler/cadence_runner.hpp"
#include <algorithm>
#include <stdexcept>
#include "signal_ngin/core/logger.hpp"

namespace signal_ngin {

std::chrono::milliseconds BackoffPolicy::delay_after(int consecutive_failures) const {
    if (consecutive_failures <= 0) {
        return std::chrono::milliseconds(0);
    }
    auto delay = initial_backoff;
    for (int i = 1; i < consecutive_failures && delay < max_backoff; ++i) {
        delay *= 2;
    }
    return std::min(delay, max_backoff);
}

CadenceRunner::CadenceRunner(std::string name, std::chrono::milliseconds interval, Task task,
                             BackoffPolicy backoff)
    : name_(std::move(name)), interval_(interval), task_(std::move(task)), backoff_(backoff) {
    if (!task_) {
        throw std::invalid_argument("CadenceRunner requires a task");
    }
    if (interval_.count() <= 0) {
        throw std::invalid_argument("CadenceRunner interval must be positive");
    }
    if (backoff_.initial_backoff.count() <= 0 || backoff_.max_consecutive_failures <= 0) {
        throw std::invalid_argument("CadenceRunner backoff must be positive");
    }
}

Result<void> CadenceRunner::run(const CancellationToken& cancel) {
    Logger::register_component("CadenceRunner");
    INFO(name_ << " cadence started, interval " << interval_.count() << "ms");

    int failures = 0;
    while (!cancel.is_cancelled()) {
        ++iterations_;
        auto result = task_();

        std::chrono::milliseconds wait = interval_;
        if (result.is_error()) {
            ++failures;
            if (failures >= backoff_.max_consecutive_failures) {
                ERROR(name_ << " failed " << failures << " times in a row, stopping: "
                            << result.error()->what());
                return make_error<void>(result.error()->code(), result.error()->what(),
                                        "CadenceRunner");
            }
            wait = backoff_.delay_after(failures);
            WARN(name_ << " iteration failed (" << failures << " consecutive): "
                       << result.error()->what() << "; retrying in " << wait.count() << "ms");
        } else {
            failures = 0;
        }

        if (cancel.wait_for(wait)) {
            break;
        }
    }

    INFO(name_ << " cadence stopped after " << iterations_ << " iterations");
    return Result<void>();
}

}  // namespace signal_ngin

// src/scheduler/conflict_arbiter.cpp

#include "signal_ngin/scheduler/conflict_arbiter.hpp"
#include <unistd.h>
#include <stdexcept>
#include "signal_ngin/core/logger.hpp"

namespace signal_ngin {

LeaseGuard::LeaseGuard(std::shared_ptr<LeaseStore> store, std::string workflow_class,
                       std::string owner)
    : store_(std::move(store)),
      workflow_class_(std::move(workflow_class)),
      owner_(std::move(owner)) {}

LeaseGuard::~LeaseGuard() {
    if (store_) {
        auto result = release();
        if (result.is_error()) {
            ERROR("Failed to release lease " << workflow_class_ << " held by " << owner_ << ": "
                                             << result.error()->what());
        }
    }
}

LeaseGuard::LeaseGuard(LeaseGuard&& other) noexcept
    : store_(std::move(other.store_)),
      workflow_class_(std::move(other.workflow_class_)),
      owner_(std::move(other.owner_)) {
    other.store_.reset();
}

LeaseGuard& LeaseGuard::operator=(LeaseGuard&& other) noexcept {
    if (this != &other) {
        if (store_) {
            auto result = release();
            if (result.is_error()) {
                ERROR("Failed to release lease " << workflow_class_ << ": "
                                                 << result.error()->what());
            }
        }
        store_ = std::move(other.store_);
        workflow_class_ = std::move(other.workflow_class_);
        owner_ = std::move(other.owner_);
        other.store_.reset();
    }
    return *this;
}

Result<void> LeaseGuard::release() {
    if (!store_) {
        return Result<void>();
    }
    auto store = std::move(store_);
    store_.reset();

    auto released = store->release(workflow_class_, owner_);
    if (released.is_error()) {
        return make_error<void>(released.error()->code(), released.error()->what(),
                                "LeaseGuard");
    }
    if (!released.value()) {
        WARN("Lease " << workflow_class_ << " was no longer held by " << owner_
                      << " at release (expired and reclaimed)");
    } else {
        DEBUG("Released lease " << workflow_class_ << " (" << owner_ << ")");
    }
    return Result<void>();
}

ConflictArbiter::ConflictArbiter(std::shared_ptr<LeaseStore> lease_store,
                                 std::shared_ptr<WorkerControl> workers,
                                 std::string high_priority_class,
                                 std::string competing_worker_class, std::string owner_prefix)
    : lease_store_(std::move(lease_store)),
      workers_(std::move(workers)),
      high_priority_class_(std::move(high_priority_class)),
      competing_worker_class_(std::move(competing_worker_class)),
      owner_prefix_(std::move(owner_prefix)) {
    if (!lease_store_ || !workers_) {
        throw std::invalid_argument("ConflictArbiter requires a lease store and worker control");
    }
    if (high_priority_class_.empty() || competing_worker_class_.empty()) {
        throw std::invalid_argument("ConflictArbiter: class names must not be empty");
    }
    if (owner_prefix_.empty()) {
        owner_prefix_ = default_lease_owner_prefix();
    }
    paused_ = workers_->is_paused(competing_worker_class_);
    Logger::register_component("ConflictArbiter");
}

Result<ArbiterDecision> ConflictArbiter::tick() {
    std::lock_guard<std::mutex> lock(tick_mutex_);

    auto held = lease_store_->is_held(high_priority_class_);
    if (held.is_error()) {
        ERROR("Cannot read lease " << high_priority_class_ << ": " << held.error()->what());
        return make_error<ArbiterDecision>(held.error()->code(), held.error()->what(),
                                           "ConflictArbiter");
    }

    ArbiterDecision decision;
    decision.high_priority_active = held.value();

    if (decision.high_priority_active) {
        if (!paused_) {
            workers_->pause(competing_worker_class_);
            paused_ = true;
            decision.changed = true;
            INFO(high_priority_class_ << " active, pausing worker class "
                                      << competing_worker_class_);
        }
    } else if (paused_) {
        workers_->resume(competing_worker_class_);
        paused_ = false;
        decision.changed = true;
        INFO(high_priority_class_ << " inactive, resuming worker class "
                                  << competing_worker_class_);
    }

    decision.competing_paused = paused_;
    return Result<ArbiterDecision>(decision);
}

Result<LeaseGuard> ConflictArbiter::acquire_exclusive(const std::string& workflow_class,
                                                      std::chrono::seconds ttl) {
    std::string owner = next_owner();
    auto acquired = lease_store_->try_acquire(workflow_class, owner, ttl);
    if (acquired.is_error()) {
        return make_error<LeaseGuard>(acquired.error()->code(), acquired.error()->what(),
                                      "ConflictArbiter");
    }
    if (!acquired.value()) {
        return make_error<LeaseGuard>(ErrorCode::LEASE_HELD,
                                      "Lease " + workflow_class + " is held by another owner",
                                      "ConflictArbiter");
    }

    INFO("Acquired lease " << workflow_class << " as " << owner << " for " << ttl.count()
                           << "s");
    return Result<LeaseGuard>(LeaseGuard(lease_store_, workflow_class, owner));
}

std::string ConflictArbiter::next_owner() {
    return owner_prefix_ + ":" + std::to_string(++owner_counter_);
}

std::string default_lease_owner_prefix() {
    char hostname[256] = {0};
    if (gethostname(hostname, sizeof(hostname) - 1) != 0) {
        hostname[0] = '\0';
    }
    std::string host = hostname[0] != '\0' ? std::string(hostname) : std::string("localhost");
    return host + ":" + std::to_string(static_cast<long>(getpid()));
}

}  // namespace signal_ngin

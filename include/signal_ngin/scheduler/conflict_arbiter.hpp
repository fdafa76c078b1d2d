// include/signal_ngin/scheduler/conflict_arbiter.hpp
#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include "signal_ngin/core/error.hpp"
#include "signal_ngin/scheduler/job_queue.hpp"
#include "signal_ngin/scheduler/lease_store.hpp"

namespace signal_ngin {

/**
 * @brief Scoped ownership of a workflow lease
 *
 * Releases (release-if-owner) on destruction unless released or moved from.
 */
class LeaseGuard {
public:
    LeaseGuard() = default;
    LeaseGuard(std::shared_ptr<LeaseStore> store, std::string workflow_class, std::string owner);
    ~LeaseGuard();

    LeaseGuard(LeaseGuard&& other) noexcept;
    LeaseGuard& operator=(LeaseGuard&& other) noexcept;

    LeaseGuard(const LeaseGuard&) = delete;
    LeaseGuard& operator=(const LeaseGuard&) = delete;

    /**
     * @return Error from the store; the guard is disarmed either way
     */
    Result<void> release();

    bool owns_lease() const {
        return store_ != nullptr;
    }
    const std::string& workflow_class() const {
        return workflow_class_;
    }
    const std::string& owner() const {
        return owner_;
    }

private:
    std::shared_ptr<LeaseStore> store_;
    std::string workflow_class_;
    std::string owner_;
};

/**
 * @brief Outcome of one arbiter tick
 */
struct ArbiterDecision {
    bool high_priority_active{false};
    bool competing_paused{false};
    bool changed{false};
};

/**
 * @brief Keeps a competing worker class off the queue while a
 *        high-priority workflow class holds its lease
 */
class ConflictArbiter {
public:
    /**
     * @param lease_store Shared lease storage
     * @param workers Control over worker classes
     * @param high_priority_class Workflow class whose lease pauses the competitor
     * @param competing_worker_class Worker class paused while that lease is held
     * @param owner_prefix Prefix of the owner tokens this arbiter issues
     */
    ConflictArbiter(std::shared_ptr<LeaseStore> lease_store,
                    std::shared_ptr<WorkerControl> workers, std::string high_priority_class,
                    std::string competing_worker_class, std::string owner_prefix = "");

    /**
     * @brief Read the marker and pause or resume the competing class
     * On a store error the previous decision stands and the error is returned.
     */
    Result<ArbiterDecision> tick();

    /**
     * @brief Acquire a workflow lease for ttl
     * @return The guard, or LEASE_HELD if another owner holds it
     */
    Result<LeaseGuard> acquire_exclusive(const std::string& workflow_class,
                                         std::chrono::seconds ttl);

    const std::string& high_priority_class() const {
        return high_priority_class_;
    }
    const std::string& competing_worker_class() const {
        return competing_worker_class_;
    }

private:
    std::string next_owner();

    std::shared_ptr<LeaseStore> lease_store_;
    std::shared_ptr<WorkerControl> workers_;
    std::string high_priority_class_;
    std::string competing_worker_class_;
    std::string owner_prefix_;
    std::atomic<uint64_t> owner_counter_{0};

    std::mutex tick_mutex_;
    bool paused_{false};
};

/**
 * @brief Owner prefix unique to this process: "hostname:pid"
 */
std::string default_lease_owner_prefix();

}  // namespace signal_ngin

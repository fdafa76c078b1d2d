// include/signal_ngin/scheduler/lease_store.hpp
#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include "signal_ngin/core/error.hpp"
#include "signal_ngin/core/types.hpp"
#include "signal_ngin/data/database_interface.hpp"

namespace signal_ngin {

/**
 * @brief Storage for ActiveWorkflowMarkers
 *
 * Every call is a single atomic compare-and-set: acquire succeeds only when
 * the class is free or its lease has expired, release only removes a lease
 * held by the same owner.
 */
class LeaseStore {
public:
    virtual ~LeaseStore() = default;

    /**
     * @return true if the caller now holds the lease; false if someone
     *         (including the same owner) holds an unexpired one
     */
    virtual Result<bool> try_acquire(const std::string& workflow_class, const std::string& owner,
                                     std::chrono::seconds ttl) = 0;

    /**
     * @return true if a lease held by owner was removed
     */
    virtual Result<bool> release(const std::string& workflow_class, const std::string& owner) = 0;

    virtual Result<bool> is_held(const std::string& workflow_class) = 0;

    /**
     * @brief Current unexpired marker, if any
     */
    virtual Result<std::optional<ActiveWorkflowMarker>> holder(
        const std::string& workflow_class) = 0;
};

/**
 * @brief Process-local LeaseStore guarded by one mutex
 */
class InMemoryLeaseStore : public LeaseStore {
public:
    using Clock = std::function<Timestamp()>;

    explicit InMemoryLeaseStore(Clock clock = nullptr);

    Result<bool> try_acquire(const std::string& workflow_class, const std::string& owner,
                             std::chrono::seconds ttl) override;
    Result<bool> release(const std::string& workflow_class, const std::string& owner) override;
    Result<bool> is_held(const std::string& workflow_class) override;
    Result<std::optional<ActiveWorkflowMarker>> holder(const std::string& workflow_class) override;

private:
    Clock clock_;
    std::mutex mutex_;
    std::map<std::string, ActiveWorkflowMarker> leases_;
};

/**
 * @brief LeaseStore on the workflow leases table, shared across processes
 */
class PostgresLeaseStore : public LeaseStore {
public:
    explicit PostgresLeaseStore(std::shared_ptr<DatabaseInterface> db,
                                std::string table_name = "ops.workflow_leases");

    Result<bool> try_acquire(const std::string& workflow_class, const std::string& owner,
                             std::chrono::seconds ttl) override;
    Result<bool> release(const std::string& workflow_class, const std::string& owner) override;
    Result<bool> is_held(const std::string& workflow_class) override;
    Result<std::optional<ActiveWorkflowMarker>> holder(const std::string& workflow_class) override;

private:
    std::shared_ptr<DatabaseInterface> db_;
    std::string table_name_;
};

}  // namespace signal_ngin

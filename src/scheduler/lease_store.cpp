// src/scheduler/lease_store.cpp

#include "signal_ngin/scheduler/lease_store.hpp"
#include <stdexcept>

namespace signal_ngin {

InMemoryLeaseStore::InMemoryLeaseStore(Clock clock) : clock_(std::move(clock)) {
    if (!clock_) {
        clock_ = [] { return std::chrono::system_clock::now(); };
    }
}

Result<bool> InMemoryLeaseStore::try_acquire(const std::string& workflow_class,
                                             const std::string& owner,
                                             std::chrono::seconds ttl) {
    if (workflow_class.empty() || owner.empty()) {
        return make_error<bool>(ErrorCode::INVALID_ARGUMENT,
                                "Workflow class and owner must not be empty", "LeaseStore");
    }
    if (ttl.count() <= 0) {
        return make_error<bool>(ErrorCode::INVALID_ARGUMENT, "Lease TTL must be positive",
                                "LeaseStore");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    const Timestamp now = clock_();

    auto it = leases_.find(workflow_class);
    if (it != leases_.end() && it->second.expires_at > now) {
        return Result<bool>(false);
    }

    leases_[workflow_class] = ActiveWorkflowMarker{workflow_class, owner, now, now + ttl};
    return Result<bool>(true);
}

Result<bool> InMemoryLeaseStore::release(const std::string& workflow_class,
                                         const std::string& owner) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = leases_.find(workflow_class);
    if (it == leases_.end() || it->second.owner != owner) {
        return Result<bool>(false);
    }
    leases_.erase(it);
    return Result<bool>(true);
}

Result<bool> InMemoryLeaseStore::is_held(const std::string& workflow_class) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = leases_.find(workflow_class);
    return Result<bool>(it != leases_.end() && it->second.expires_at > clock_());
}

Result<std::optional<ActiveWorkflowMarker>> InMemoryLeaseStore::holder(
    const std::string& workflow_class) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = leases_.find(workflow_class);
    if (it == leases_.end() || it->second.expires_at <= clock_()) {
        return Result<std::optional<ActiveWorkflowMarker>>(std::nullopt);
    }
    return Result<std::optional<ActiveWorkflowMarker>>(it->second);
}

PostgresLeaseStore::PostgresLeaseStore(std::shared_ptr<DatabaseInterface> db,
                                       std::string table_name)
    : db_(std::move(db)), table_name_(std::move(table_name)) {
    if (!db_) {
        throw std::invalid_argument("PostgresLeaseStore: null database");
    }
}

Result<bool> PostgresLeaseStore::try_acquire(const std::string& workflow_class,
                                             const std::string& owner,
                                             std::chrono::seconds ttl) {
    if (ttl.count() <= 0) {
        return make_error<bool>(ErrorCode::INVALID_ARGUMENT, "Lease TTL must be positive",
                                "LeaseStore");
    }
    return db_->try_acquire_lease(workflow_class, owner, ttl.count(), table_name_);
}

Result<bool> PostgresLeaseStore::release(const std::string& workflow_class,
                                         const std::string& owner) {
    return db_->release_lease(workflow_class, owner, table_name_);
}

Result<bool> PostgresLeaseStore::is_held(const std::string& workflow_class) {
    auto marker = db_->get_lease(workflow_class, table_name_);
    if (marker.is_error()) {
        return make_error<bool>(marker.error()->code(), marker.error()->what(), "LeaseStore");
    }
    return Result<bool>(marker.value().has_value());
}

Result<std::optional<ActiveWorkflowMarker>> PostgresLeaseStore::holder(
    const std::string& workflow_class) {
    return db_->get_lease(workflow_class, table_name_);
}

}  // namespace signal_ngin

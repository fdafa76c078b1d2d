// include/signal_ngin/scheduler/worker_pool_job_queue.hpp
#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <queue>
#include <set>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>
#include "signal_ngin/core/cancellation.hpp"
#include "signal_ngin/core/config_base.hpp"
#include "signal_ngin/core/state_manager.hpp"
#include "signal_ngin/scheduler/job_queue.hpp"

namespace signal_ngin {

/**
 * @brief One named queue and the workers that drain it
 */
struct QueueSpec {
    std::string name;
    std::string worker_class;
    int workers{1};
};

/**
 * @brief Configuration for the worker pool
 */
struct JobQueueConfig : public ConfigBase {
    std::vector<QueueSpec> queues{{"vn", "vn", 1}, {"us", "us", 1}, {"backfill", "backfill", 1}};
    int result_ttl_seconds{3600};

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
    Result<void> validate() const override;

    std::string section_name() const override {
        return "job_queue";
    }
};

/**
 * @brief Handler invoked on a worker thread for each job
 * The token is tripped when the job times out or the queue stops.
 */
using JobHandler = std::function<Result<RunSummary>(const Job&, const CancellationToken&)>;

/**
 * @brief In-process JobQueue served by a fixed pool of worker threads
 *
 * Each queue is ordered by priority class, then FIFO. Workers of a paused
 * class leave their queue untouched. A job that runs past its timeout is
 * cancelled and reports TIMEOUT_ERROR while still RUNNING; it becomes
 * FAILED, and its id admittable again, only once the handler has returned.
 * The worker waits for that before taking the next job.
 */
class WorkerPoolJobQueue : public JobQueue, public WorkerControl {
public:
    using Clock = std::function<Timestamp()>;

    /**
     * @throws std::invalid_argument on a null handler, an empty or repeated
     *         queue name, or a non-positive worker count
     */
    WorkerPoolJobQueue(JobQueueConfig config, JobHandler handler, Clock clock = nullptr);
    ~WorkerPoolJobQueue() override;

    WorkerPoolJobQueue(const WorkerPoolJobQueue&) = delete;
    WorkerPoolJobQueue& operator=(const WorkerPoolJobQueue&) = delete;

    Result<void> start();
    void stop();

    bool is_running() const {
        return running_.load();
    }

    Result<JobHandle> enqueue(Job job) override;
    Result<JobStatus> status(const JobHandle& handle) const override;
    Result<JobResult> result(const JobHandle& handle) const override;

    /**
     * @brief Block until the job finishes or the timeout passes
     * @return The final record, or TIMEOUT_ERROR if still unfinished
     */
    Result<JobResult> wait(const JobHandle& handle, std::chrono::milliseconds timeout) const;

    /**
     * @brief Block until no job is queued or running
     * @return false if the timeout passed first
     */
    bool wait_idle(std::chrono::milliseconds timeout) const;

    void pause(const std::string& worker_class) override;
    void resume(const std::string& worker_class) override;
    bool is_paused(const std::string& worker_class) const override;

    size_t pending(const std::string& queue) const;

    const std::string& component_id() const {
        return component_id_;
    }

private:
    struct QueuedJob {
        Job job;
        uint64_t sequence;
    };

    struct QueuedJobOrder {
        bool operator()(const QueuedJob& a, const QueuedJob& b) const {
            if (a.job.priority != b.job.priority)
                return static_cast<int>(a.job.priority) > static_cast<int>(b.job.priority);
            return a.sequence > b.sequence;
        }
    };

    struct QueueState {
        QueueSpec spec;
        std::priority_queue<QueuedJob, std::vector<QueuedJob>, QueuedJobOrder> jobs;
    };

    void worker_loop(const std::string& queue_name);
    void execute(Job job);
    void finish(const std::string& id, JobStatus status, RunSummary summary, ErrorCode code,
                const std::string& message);
    void evict_expired_locked() const;
    void set_component_state(const std::string& id, ComponentState state);
    std::string worker_component_id(const std::string& worker_class) const {
        return component_id_ + ":" + worker_class;
    }

    JobQueueConfig config_;
    JobHandler handler_;
    Clock clock_;

    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    std::map<std::string, QueueState> queues_;
    mutable std::unordered_map<std::string, JobResult> records_;
    std::set<std::string> paused_;
    std::unordered_map<uint64_t, CancellationToken> running_tokens_;  // by execution
    std::vector<std::thread> workers_;
    std::atomic<bool> running_{false};
    uint64_t sequence_{0};
    uint64_t next_id_{0};
    uint64_t next_execution_{0};

    std::string component_id_;
    std::set<std::string> registered_ids_;
};

}  // namespace signal_ngin

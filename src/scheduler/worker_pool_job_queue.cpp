// src/scheduler/worker_pool_job_queue.cpp

#include "signal_ngin/scheduler/worker_pool_job_queue.hpp"
#include <future>
#include <set>
#include <stdexcept>
#include <system_error>
#include "signal_ngin/core/logger.hpp"

namespace signal_ngin {

namespace {
std::atomic<uint64_t> queue_counter{0};
}

nlohmann::json JobQueueConfig::to_json() const {
    nlohmann::json j;
    nlohmann::json queue_array = nlohmann::json::array();
    for (const auto& spec : queues) {
        queue_array.push_back(
            {{"name", spec.name}, {"worker_class", spec.worker_class}, {"workers", spec.workers}});
    }
    j["queues"] = queue_array;
    j["result_ttl_seconds"] = result_ttl_seconds;
    return j;
}

void JobQueueConfig::from_json(const nlohmann::json& j) {
    if (j.contains("queues")) {
        queues.clear();
        for (const auto& item : j.at("queues")) {
            QueueSpec spec;
            if (!read_field(item, "name", spec.name)) {
                throw std::invalid_argument("queue entry without a name");
            }
            spec.worker_class = spec.name;
            read_field(item, "worker_class", spec.worker_class);
            read_field(item, "workers", spec.workers);
            queues.push_back(spec);
        }
    }
    read_field(j, "result_ttl_seconds", result_ttl_seconds);
}

Result<void> JobQueueConfig::validate() const {
    std::set<std::string> names;
    for (const auto& spec : queues) {
        if (spec.name.empty() || spec.worker_class.empty()) {
            return invalid("queue name and worker class must not be empty");
        }
        if (spec.workers <= 0) {
            return invalid("queue '" + spec.name + "' needs at least one worker");
        }
        if (!names.insert(spec.name).second) {
            return invalid("queue '" + spec.name + "' defined twice");
        }
    }
    if (result_ttl_seconds < 0) {
        return invalid("result_ttl_seconds must not be negative");
    }
    return Result<void>();
}

WorkerPoolJobQueue::WorkerPoolJobQueue(JobQueueConfig config, JobHandler handler, Clock clock)
    : config_(std::move(config)), handler_(std::move(handler)), clock_(std::move(clock)) {
    if (!handler_) {
        throw std::invalid_argument("WorkerPoolJobQueue requires a job handler");
    }
    if (!clock_) {
        clock_ = [] { return std::chrono::system_clock::now(); };
    }
    auto valid = config_.validate();
    if (valid.is_error()) {
        throw std::invalid_argument(valid.error()->what());
    }
    for (const auto& spec : config_.queues) {
        queues_[spec.name].spec = spec;
    }

    Logger::register_component("JobQueue");

    component_id_ = "JOB_QUEUE_" + std::to_string(++queue_counter);

    std::vector<std::pair<std::string, ComponentType>> components{
        {component_id_, ComponentType::JOB_QUEUE}};
    std::set<std::string> classes;
    for (const auto& spec : config_.queues) {
        if (classes.insert(spec.worker_class).second) {
            components.emplace_back(worker_component_id(spec.worker_class),
                                    ComponentType::WORKER_CLASS);
        }
    }

    for (const auto& [id, type] : components) {
        ComponentInfo info{type, ComponentState::INITIALIZED, id, "",
                           std::chrono::system_clock::now(), {}};
        auto registered = StateManager::instance().register_component(info);
        if (registered.is_error()) {
            WARN("Failed to register " << id << " with state manager: "
                                       << registered.error()->what());
        } else {
            registered_ids_.insert(id);
        }
    }
}

WorkerPoolJobQueue::~WorkerPoolJobQueue() {
    stop();
    for (const auto& id : registered_ids_) {
        auto result = StateManager::instance().unregister_component(id);
        if (result.is_error()) {
            DEBUG("Unregister of " << id << " failed: " << result.error()->what());
        }
    }
}

Result<void> WorkerPoolJobQueue::start() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (running_.load()) {
            return Result<void>();
        }
        running_.store(true);
    }

    try {
        for (const auto& spec : config_.queues) {
            for (int i = 0; i < spec.workers; ++i) {
                workers_.emplace_back(&WorkerPoolJobQueue::worker_loop, this, spec.name);
            }
        }
    } catch (const std::system_error& e) {
        stop();
        return make_error<void>(ErrorCode::UNKNOWN_ERROR,
                                std::string("Failed to start worker threads: ") + e.what(),
                                "WorkerPoolJobQueue");
    }

    set_component_state(component_id_, ComponentState::RUNNING);
    std::set<std::string> paused;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        paused = paused_;
    }
    for (const auto& spec : config_.queues) {
        set_component_state(worker_component_id(spec.worker_class), ComponentState::RUNNING);
        if (paused.count(spec.worker_class) > 0) {
            set_component_state(worker_component_id(spec.worker_class), ComponentState::PAUSED);
        }
    }

    INFO("Job queue started with " << workers_.size() << " workers over " << queues_.size()
                                   << " queues");
    return Result<void>();
}

void WorkerPoolJobQueue::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_.load()) {
            return;
        }
        running_.store(false);
        for (auto& [id, token] : running_tokens_) {
            token.cancel();
        }
    }
    cv_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();

    set_component_state(component_id_, ComponentState::STOPPED);
    INFO("Job queue stopped");
}

Result<JobHandle> WorkerPoolJobQueue::enqueue(Job job) {
    std::lock_guard<std::mutex> lock(mutex_);
    evict_expired_locked();

    auto queue = queues_.find(job.queue);
    if (queue == queues_.end()) {
        return make_error<JobHandle>(ErrorCode::INVALID_ARGUMENT,
                                     "Unknown queue '" + job.queue + "'", "WorkerPoolJobQueue");
    }
    if (job.timeout.count() <= 0) {
        return make_error<JobHandle>(ErrorCode::INVALID_ARGUMENT,
                                     "Job timeout must be positive", "WorkerPoolJobQueue");
    }
    if (job.id.empty()) {
        job.id = "job-" + std::to_string(++next_id_);
    }

    auto existing = records_.find(job.id);
    if (existing != records_.end() && (existing->second.status == JobStatus::QUEUED ||
                                       existing->second.status == JobStatus::RUNNING)) {
        return make_error<JobHandle>(ErrorCode::DUPLICATE_JOB,
                                     "Job " + job.id + " is already " +
                                         job_status_to_string(existing->second.status),
                                     "WorkerPoolJobQueue");
    }

    JobResult record;
    record.status = JobStatus::QUEUED;
    record.summary.mode = job.mode;
    record.enqueued_at = clock_();
    records_[job.id] = std::move(record);

    JobHandle handle{job.id, job.queue};
    DEBUG("Enqueued " << job.id << " on " << job.queue << " ("
                      << job_priority_to_string(job.priority) << ", "
                      << job.instruments.size() << " instruments)");
    queue->second.jobs.push({std::move(job), sequence_++});

    cv_.notify_all();
    return Result<JobHandle>(handle);
}

Result<JobStatus> WorkerPoolJobQueue::status(const JobHandle& handle) const {
    std::lock_guard<std::mutex> lock(mutex_);
    evict_expired_locked();
    auto it = records_.find(handle.id);
    if (it == records_.end()) {
        return make_error<JobStatus>(ErrorCode::DATA_NOT_FOUND, "Unknown job " + handle.id,
                                     "WorkerPoolJobQueue");
    }
    return Result<JobStatus>(it->second.status);
}

Result<JobResult> WorkerPoolJobQueue::result(const JobHandle& handle) const {
    std::lock_guard<std::mutex> lock(mutex_);
    evict_expired_locked();
    auto it = records_.find(handle.id);
    if (it == records_.end()) {
        return make_error<JobResult>(ErrorCode::DATA_NOT_FOUND, "Unknown job " + handle.id,
                                     "WorkerPoolJobQueue");
    }
    return Result<JobResult>(it->second);
}

Result<JobResult> WorkerPoolJobQueue::wait(const JobHandle& handle,
                                           std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(mutex_);
    bool finished = cv_.wait_for(lock, timeout, [&] {
        auto it = records_.find(handle.id);
        return it == records_.end() || it->second.status == JobStatus::DONE ||
               it->second.status == JobStatus::FAILED;
    });

    auto it = records_.find(handle.id);
    if (it == records_.end()) {
        return make_error<JobResult>(ErrorCode::DATA_NOT_FOUND, "Unknown job " + handle.id,
                                     "WorkerPoolJobQueue");
    }
    if (!finished) {
        return make_error<JobResult>(ErrorCode::TIMEOUT_ERROR,
                                     "Job " + handle.id + " still " +
                                         job_status_to_string(it->second.status),
                                     "WorkerPoolJobQueue");
    }
    return Result<JobResult>(it->second);
}

bool WorkerPoolJobQueue::wait_idle(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [&] {
        for (const auto& [id, record] : records_) {
            if (record.status == JobStatus::QUEUED || record.status == JobStatus::RUNNING) {
                return false;
            }
        }
        return true;
    });
}

void WorkerPoolJobQueue::pause(const std::string& worker_class) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!paused_.insert(worker_class).second) {
            return;
        }
    }
    INFO("Worker class '" << worker_class << "' paused");
    if (running_.load()) {
        set_component_state(worker_component_id(worker_class), ComponentState::PAUSED);
    }
}

void WorkerPoolJobQueue::resume(const std::string& worker_class) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (paused_.erase(worker_class) == 0) {
            return;
        }
    }
    cv_.notify_all();
    INFO("Worker class '" << worker_class << "' resumed");
    if (running_.load()) {
        set_component_state(worker_component_id(worker_class), ComponentState::RUNNING);
    }
}

bool WorkerPoolJobQueue::is_paused(const std::string& worker_class) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return paused_.count(worker_class) > 0;
}

size_t WorkerPoolJobQueue::pending(const std::string& queue) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = queues_.find(queue);
    return it == queues_.end() ? 0 : it->second.jobs.size();
}

void WorkerPoolJobQueue::worker_loop(const std::string& queue_name) {
    Logger::register_component("JobQueue");
    QueueState& state = queues_.at(queue_name);

    while (true) {
        Job job;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [&] {
                return !running_.load() ||
                       (!state.jobs.empty() && paused_.count(state.spec.worker_class) == 0);
            });
            if (!running_.load()) {
                return;
            }

            job = state.jobs.top().job;
            state.jobs.pop();

            auto& record = records_[job.id];
            record.status = JobStatus::RUNNING;
            record.started_at = clock_();
        }

        execute(std::move(job));
    }
}

void WorkerPoolJobQueue::execute(Job job) {
    ScopedLogContext context("job=" + job.id);
    CancellationToken token;
    uint64_t execution = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        execution = ++next_execution_;
        running_tokens_[execution] = token;
        if (!running_.load()) {
            token.cancel();
        }
    }

    INFO("Running job " << job.id << " (" << run_mode_to_string(job.mode) << ", "
                        << job.instruments.size() << " instruments, timeout "
                        << job.timeout.count() << "s)");

    auto future = std::async(std::launch::async, [this, &job, token]() -> Result<RunSummary> {
        Logger::register_component("JobQueue");
        ScopedLogContext handler_context("job=" + job.id);
        try {
            return handler_(job, token);
        } catch (const std::exception& e) {
            return make_error<RunSummary>(ErrorCode::UNKNOWN_ERROR,
                                          std::string("Job handler threw: ") + e.what(),
                                          "WorkerPoolJobQueue");
        }
    });

    if (future.wait_for(job.timeout) == std::future_status::timeout) {
        token.cancel();
        WARN("Job " << job.id << " exceeded its " << job.timeout.count()
                    << "s timeout, cancelling");
        const std::string message =
            "Job exceeded timeout of " + std::to_string(job.timeout.count()) + "s";
        {
            // Stays RUNNING, and so not admittable, until the handler returns
            std::lock_guard<std::mutex> lock(mutex_);
            auto& record = records_[job.id];
            record.error_code = ErrorCode::TIMEOUT_ERROR;
            record.error_message = message;
        }

        auto late = future.get();
        if (late.is_error()) {
            DEBUG("Timed out job " << job.id << " ended with: " << late.error()->what());
        }
        finish(job.id, JobStatus::FAILED, RunSummary{}, ErrorCode::TIMEOUT_ERROR, message);
    } else {
        auto outcome = future.get();
        if (outcome.is_error()) {
            ERROR("Job " << job.id << " failed: " << outcome.error()->what());
            finish(job.id, JobStatus::FAILED, RunSummary{}, outcome.error()->code(),
                   outcome.error()->what());
        } else {
            finish(job.id, JobStatus::DONE, outcome.take_value(), ErrorCode::NONE, "");
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    running_tokens_.erase(execution);
}

void WorkerPoolJobQueue::finish(const std::string& id, JobStatus status, RunSummary summary,
                                ErrorCode code, const std::string& message) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& record = records_[id];
        record.status = status;
        record.summary = std::move(summary);
        record.error_code = code;
        record.error_message = message;
        record.finished_at = clock_();
    }
    cv_.notify_all();
}

void WorkerPoolJobQueue::evict_expired_locked() const {
    const Timestamp now = clock_();
    const auto ttl = std::chrono::seconds(config_.result_ttl_seconds);
    for (auto it = records_.begin(); it != records_.end();) {
        bool finished = it->second.status == JobStatus::DONE ||
                        it->second.status == JobStatus::FAILED;
        if (finished && it->second.finished_at + ttl <= now) {
            it = records_.erase(it);
        } else {
            ++it;
        }
    }
}

void WorkerPoolJobQueue::set_component_state(const std::string& id, ComponentState state) {
    if (registered_ids_.count(id) == 0) {
        return;
    }
    auto& manager = StateManager::instance();
    auto current = manager.get_state(id);
    if (current.is_error() || current.value().state == state) {
        return;
    }
    if (current.value().state == ComponentState::STOPPED && state != ComponentState::STOPPED) {
        auto reset = manager.update_state(id, ComponentState::INITIALIZED);
        if (reset.is_error()) {
            DEBUG("State reset for " << id << " failed: " << reset.error()->what());
            return;
        }
    }
    auto updated = manager.update_state(id, state);
    if (updated.is_error()) {
        DEBUG("State update for " << id << " failed: " << updated.error()->what());
    }
}

}  // namespace signal_ngin

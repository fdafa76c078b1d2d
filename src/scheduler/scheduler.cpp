// src/scheduler/scheduler.cpp

#include "signal_ngin/scheduler/scheduler.hpp"
#include <algorithm>
#include <atomic>
#include <cctype>
#include <map>
#include <stdexcept>
#include "signal_ngin/core/logger.hpp"
#include "signal_ngin/core/state_manager.hpp"
#include "signal_ngin/core/time_utils.hpp"

namespace signal_ngin {

namespace {

std::atomic<uint64_t> scheduler_counter{0};

std::string to_upper(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return text;
}

}  // namespace

nlohmann::json SchedulerConfig::to_json() const {
    nlohmann::json j;
    j["cadence_seconds"] = cadence_seconds;
    j["stagger_seconds"] = stagger_seconds;
    j["realtime_timeout_seconds"] = realtime_timeout_seconds;
    j["backfill_timeout_seconds"] = backfill_timeout_seconds;
    j["dedupe_window_seconds"] = dedupe_window_seconds;
    j["backfill_queue"] = backfill_queue;
    j["only_instruments"] = only_instruments;

    nlohmann::json group_array = nlohmann::json::array();
    for (const auto& group : groups) {
        group_array.push_back({{"name", group.name},
                               {"queue", group.queue},
                               {"venues", group.venues},
                               {"priority", job_priority_to_string(group.priority)},
                               {"workflow_class", group.workflow_class}});
    }
    j["groups"] = group_array;
    j["high_priority_class"] = high_priority_class;
    j["competing_worker_class"] = competing_worker_class;
    return j;
}

void SchedulerConfig::from_json(const nlohmann::json& j) {
    read_field(j, "cadence_seconds", cadence_seconds);
    read_field(j, "stagger_seconds", stagger_seconds);
    read_field(j, "realtime_timeout_seconds", realtime_timeout_seconds);
    read_field(j, "backfill_timeout_seconds", backfill_timeout_seconds);
    read_field(j, "dedupe_window_seconds", dedupe_window_seconds);
    read_field(j, "backfill_queue", backfill_queue);
    read_field(j, "only_instruments", only_instruments);
    if (j.contains("groups")) {
        groups.clear();
        for (const auto& item : j.at("groups")) {
            VenueGroup group;
            if (!read_field(item, "name", group.name) ||
                !read_field(item, "venues", group.venues)) {
                throw std::invalid_argument("venue group needs a name and venues");
            }
            group.queue = group.name;
            read_field(item, "queue", group.queue);
            std::string priority_name;
            if (read_field(item, "priority", priority_name)) {
                auto priority = job_priority_from_string(priority_name);
                if (!priority) {
                    throw std::invalid_argument("Unknown job priority: " + priority_name);
                }
                group.priority = *priority;
            }
            read_field(item, "workflow_class", group.workflow_class);
            groups.push_back(group);
        }
    }
    read_field(j, "high_priority_class", high_priority_class);
    read_field(j, "competing_worker_class", competing_worker_class);
}

Result<void> SchedulerConfig::validate() const {
    if (cadence_seconds <= 0 || realtime_timeout_seconds <= 0 || backfill_timeout_seconds <= 0) {
        return invalid("cadence and timeouts must be positive");
    }
    if (stagger_seconds < 0.0) {
        return invalid("stagger_seconds must not be negative");
    }
    if (dedupe_window_seconds < 0) {
        return invalid("dedupe_window_seconds must not be negative");
    }
    for (const auto& group : groups) {
        if (group.venues.empty()) {
            return invalid("venue group '" + group.name + "' has no venues");
        }
    }
    return Result<void>();
}

Scheduler::Scheduler(SchedulerConfig config, std::shared_ptr<JobQueue> queue,
                     std::shared_ptr<ConflictArbiter> arbiter,
                     std::shared_ptr<InstrumentProvider> instruments,
                     std::shared_ptr<const MarketCalendar> calendar, Clock clock,
                     CancellationToken cancel)
    : config_(std::move(config)),
      queue_(std::move(queue)),
      arbiter_(std::move(arbiter)),
      instruments_(std::move(instruments)),
      calendar_(std::move(calendar)),
      clock_(clock ? std::move(clock) : Clock([] { return std::chrono::system_clock::now(); })),
      cancel_(std::move(cancel)),
      dedupe_(clock_) {
    if (!queue_ || !arbiter_ || !instruments_ || !calendar_) {
        throw std::invalid_argument(
            "Scheduler requires a queue, arbiter, instrument provider and calendar");
    }
    auto valid = config_.validate();
    if (valid.is_error()) {
        throw std::invalid_argument(valid.error()->what());
    }

    Logger::register_component("Scheduler");

    component_id_ = "SCHEDULER_" + std::to_string(++scheduler_counter);
    ComponentInfo info{ComponentType::SCHEDULER,
                       ComponentState::INITIALIZED,
                       component_id_,
                       "",
                       std::chrono::system_clock::now(),
                       {}};
    auto registered = StateManager::instance().register_component(info);
    if (registered.is_error()) {
        ERROR("Failed to register scheduler with state manager: " << registered.error()->what());
    } else {
        registered_ = true;
    }
}

Scheduler::~Scheduler() {
    if (registered_) {
        auto result = StateManager::instance().unregister_component(component_id_);
        if (result.is_error()) {
            DEBUG("Scheduler unregister: " << result.error()->what());
        }
    }
}

Result<DispatchOutcome> Scheduler::dispatch(const JobRequest& request) {
    const auto window = config_.dedupe_window_seconds > 0
                            ? std::chrono::seconds(config_.dedupe_window_seconds)
                            : request.timeout;

    if (!request.dedupe_key.empty() && !dedupe_.try_admit(request.dedupe_key, window)) {
        INFO("skip: duplicate " << request.dedupe_key);
        return Result<DispatchOutcome>(
            DispatchOutcome{DispatchOutcome::Kind::SKIPPED_DUPLICATE, std::nullopt});
    }

    Job job;
    job.id = request.dedupe_key;
    job.queue = request.queue;
    job.instruments = request.instruments;
    job.mode = request.mode;
    job.dedupe_key = request.dedupe_key;
    job.timeout = request.timeout;
    job.priority = request.priority;
    job.workflow_class = request.workflow_class;

    auto handle = queue_->enqueue(std::move(job));
    if (handle.is_error()) {
        if (handle.error()->code() == ErrorCode::DUPLICATE_JOB) {
            INFO("skip: duplicate " << request.dedupe_key << " (still queued or running)");
            return Result<DispatchOutcome>(
                DispatchOutcome{DispatchOutcome::Kind::SKIPPED_DUPLICATE, std::nullopt});
        }
        if (!request.dedupe_key.empty()) {
            dedupe_.forget(request.dedupe_key);
        }
        return make_error<DispatchOutcome>(handle.error()->code(), handle.error()->what(),
                                           "Scheduler");
    }

    return Result<DispatchOutcome>(
        DispatchOutcome{DispatchOutcome::Kind::ADMITTED, handle.take_value()});
}

Result<SchedulerCycleReport> Scheduler::tick() {
    std::lock_guard<std::mutex> lock(tick_mutex_);
    Logger::register_component("Scheduler");
    mark_running();

    SchedulerCycleReport report;
    report.cycle = ++cycle_;
    const Timestamp now = clock_();

    // 1. Arbitration
    auto decision = arbiter_->tick();
    if (decision.is_error()) {
        report.arbiter_ok = false;
        WARN("Arbiter tick failed: " << decision.error()->what());
    } else {
        report.arbiter = decision.value();
    }

    // 2. Active universe
    auto active = instruments_->active_instruments();
    if (active.is_error()) {
        ERROR("Cannot read active instruments: " << active.error()->what());
        return make_error<SchedulerCycleReport>(active.error()->code(), active.error()->what(),
                                                "Scheduler");
    }
    std::vector<Instrument> instruments = filter_instruments(active.take_value());
    report.active_instruments = instruments.size();

    // 3. Backfill instruments not seen last cycle
    std::set<std::string> current;
    for (const auto& instrument : instruments) {
        current.insert(instrument.key());
        if (seen_.count(instrument.key()) > 0) {
            continue;
        }
        ++report.new_instruments;
        INFO("New instrument " << instrument.key() << ", dispatching backfill");

        JobRequest request;
        request.queue = config_.backfill_queue;
        request.instruments = {instrument};
        request.mode = RunMode::BACKFILL;
        request.dedupe_key = "bf:" + instrument.key();
        request.timeout = std::chrono::seconds(config_.backfill_timeout_seconds);
        request.priority = JobPriority::LOW;
        if (!record(report, dispatch(request), report.backfill_admitted, request.dedupe_key)) {
            // Retried as new next cycle
            current.erase(instrument.key());
        }
    }
    seen_ = std::move(current);

    // 4. Realtime, one job per open venue
    std::map<std::string, std::vector<Instrument>> by_venue;
    for (const auto& instrument : instruments) {
        by_venue[instrument.venue].push_back(instrument);
    }

    const int64_t bucket = core::to_epoch_seconds(now) / config_.cadence_seconds;
    const auto stagger =
        std::chrono::milliseconds(static_cast<int64_t>(config_.stagger_seconds * 1000.0));
    bool first_dispatch = true;

    for (const auto& [venue, members] : by_venue) {
        const VenueGroup* group = group_for(venue);
        if (group == nullptr) {
            DEBUG("Venue " << venue << " is not routed to any queue");
            report.unrouted_venues.push_back(venue);
            continue;
        }
        if (!calendar_->is_open(venue, now)) {
            report.closed_venues.push_back(venue);
            continue;
        }

        if (!first_dispatch && stagger.count() > 0 && cancel_.wait_for(stagger)) {
            INFO("Scheduler cycle cancelled during stagger");
            break;
        }
        first_dispatch = false;

        JobRequest request;
        request.queue = group->queue;
        request.instruments = members;
        request.mode = RunMode::REALTIME;
        request.dedupe_key = "rt:" + venue + ":" + std::to_string(bucket);
        request.timeout = std::chrono::seconds(config_.realtime_timeout_seconds);
        request.priority = group->priority;
        request.workflow_class = group->workflow_class;
        record(report, dispatch(request), report.realtime_admitted, request.dedupe_key);
    }

    INFO("Cycle " << report.cycle << ": active=" << report.active_instruments
                  << " new=" << report.new_instruments
                  << " backfill=" << report.backfill_admitted
                  << " realtime=" << report.realtime_admitted
                  << " duplicates=" << report.duplicates_skipped
                  << " errors=" << report.dispatch_errors
                  << (report.arbiter.competing_paused ? " (competing workers paused)" : ""));

    if (registered_) {
        auto metrics = StateManager::instance().update_metrics(
            component_id_,
            {{"cycle", static_cast<double>(report.cycle)},
             {"active_instruments", static_cast<double>(report.active_instruments)},
             {"dispatch_errors", static_cast<double>(report.dispatch_errors)}});
        if (metrics.is_error()) {
            DEBUG("Scheduler metrics update failed: " << metrics.error()->what());
        }
    }

    return Result<SchedulerCycleReport>(std::move(report));
}

Result<DispatchOutcome> Scheduler::dispatch_full_backfill() {
    auto active = instruments_->active_instruments();
    if (active.is_error()) {
        return make_error<DispatchOutcome>(active.error()->code(), active.error()->what(),
                                           "Scheduler");
    }

    JobRequest request;
    request.queue = config_.backfill_queue;
    request.instruments = filter_instruments(active.take_value());
    request.mode = RunMode::BACKFILL;
    request.dedupe_key = "bf:all";
    request.timeout = std::chrono::seconds(config_.backfill_timeout_seconds);
    request.priority = JobPriority::LOW;
    return dispatch(request);
}

std::vector<Instrument> Scheduler::filter_instruments(std::vector<Instrument> instruments) const {
    if (config_.only_instruments.empty()) {
        return instruments;
    }

    std::set<std::string> allowed;
    for (const auto& name : config_.only_instruments) {
        allowed.insert(to_upper(name));
    }

    instruments.erase(std::remove_if(instruments.begin(), instruments.end(),
                                     [&](const Instrument& instrument) {
                                         return allowed.count(to_upper(instrument.ticker)) == 0 &&
                                                allowed.count(to_upper(instrument.key())) == 0;
                                     }),
                      instruments.end());
    return instruments;
}

const VenueGroup* Scheduler::group_for(const std::string& venue) const {
    for (const auto& group : config_.groups) {
        if (std::find(group.venues.begin(), group.venues.end(), venue) != group.venues.end()) {
            return &group;
        }
    }
    return nullptr;
}

bool Scheduler::record(SchedulerCycleReport& report, const Result<DispatchOutcome>& outcome,
                       size_t& admitted_counter, const std::string& what) {
    if (outcome.is_error()) {
        ++report.dispatch_errors;
        ERROR("Dispatch of " << what << " failed: " << outcome.error()->what());
        return false;
    }
    if (outcome.value().kind == DispatchOutcome::Kind::SKIPPED_DUPLICATE) {
        ++report.duplicates_skipped;
    } else {
        ++admitted_counter;
    }
    return true;
}

void Scheduler::mark_running() {
    if (!registered_) {
        return;
    }
    auto state = StateManager::instance().get_state(component_id_);
    if (state.is_ok() && state.value().state == ComponentState::INITIALIZED) {
        auto updated =
            StateManager::instance().update_state(component_id_, ComponentState::RUNNING);
        if (updated.is_error()) {
            WARN("Scheduler state update failed: " << updated.error()->what());
        }
    }
}

JobHandler make_batch_handler(std::shared_ptr<PipelineExecutor> executor,
                              std::shared_ptr<ConflictArbiter> arbiter) {
    if (!executor || !arbiter) {
        throw std::invalid_argument("make_batch_handler requires an executor and an arbiter");
    }

    return [executor, arbiter](const Job& job,
                               const CancellationToken& cancel) -> Result<RunSummary> {
        LeaseGuard lease;
        if (!job.workflow_class.empty()) {
            auto acquired = arbiter->acquire_exclusive(job.workflow_class, job.timeout);
            if (acquired.is_error()) {
                if (acquired.error()->code() == ErrorCode::LEASE_HELD) {
                    INFO("Job " << job.id << " skipped: " << acquired.error()->what());
                    RunSummary summary;
                    summary.mode = job.mode;
                    summary.skipped = job.instruments.size();
                    return Result<RunSummary>(std::move(summary));
                }
                return make_error<RunSummary>(acquired.error()->code(),
                                              acquired.error()->what(), "BatchHandler");
            }
            lease = acquired.take_value();
        }

        RunSummary summary = executor->run_batch(job.instruments, job.mode, cancel);

        auto released = lease.release();
        if (released.is_error()) {
            WARN("Lease release after job " << job.id << " failed: "
                                            << released.error()->what());
        }
        return Result<RunSummary>(std::move(summary));
    };
}

}  // namespace signal_ngin

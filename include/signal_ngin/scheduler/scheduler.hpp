// include/signal_ngin/scheduler/scheduler.hpp
#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include "signal_ngin/core/cancellation.hpp"
#include "signal_ngin/core/config_base.hpp"
#include "signal_ngin/core/error.hpp"
#include "signal_ngin/pipeline/pipeline_executor.hpp"
#include "signal_ngin/scheduler/conflict_arbiter.hpp"
#include "signal_ngin/scheduler/dedupe_window.hpp"
#include "signal_ngin/scheduler/instrument_provider.hpp"
#include "signal_ngin/scheduler/job_queue.hpp"
#include "signal_ngin/scheduler/market_calendar.hpp"
#include "signal_ngin/scheduler/worker_pool_job_queue.hpp"

namespace signal_ngin {

/**
 * @brief Venues routed to one realtime queue
 * A non-empty workflow_class makes the group's jobs high priority lease holders.
 */
struct VenueGroup {
    std::string name;
    std::string queue;
    std::vector<std::string> venues;
    JobPriority priority{JobPriority::NORMAL};
    std::string workflow_class;
};

/**
 * @brief Configuration for the scheduler cycle
 */
struct SchedulerConfig : public ConfigBase {
    int cadence_seconds{60};
    double stagger_seconds{2.0};
    int realtime_timeout_seconds{300};
    int backfill_timeout_seconds{1800};
    int dedupe_window_seconds{0};  // 0 uses each job's timeout
    std::string backfill_queue{"backfill"};
    std::vector<std::string> only_instruments;  // tickers or "VENUE:TICKER" keys
    std::vector<VenueGroup> groups{
        {"vn", "vn", {"HOSE", "HNX", "UPCOM"}, JobPriority::HIGH, "mtf_batch"},
        {"us", "us", {"NASDAQ", "NYSE"}, JobPriority::NORMAL, ""}};
    std::string high_priority_class{"mtf_batch"};
    std::string competing_worker_class{"us"};

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
    Result<void> validate() const override;

    std::string section_name() const override {
        return "scheduler";
    }
};

/**
 * @brief A request to run a pipeline batch
 */
struct JobRequest {
    std::string queue;
    std::vector<Instrument> instruments;
    RunMode mode{RunMode::REALTIME};
    std::string dedupe_key;
    std::chrono::seconds timeout{300};
    JobPriority priority{JobPriority::NORMAL};
    std::string workflow_class;
};

struct DispatchOutcome {
    enum class Kind { ADMITTED, SKIPPED_DUPLICATE };

    Kind kind{Kind::ADMITTED};
    std::optional<JobHandle> handle;
};

/**
 * @brief What one scheduler cycle did
 */
struct SchedulerCycleReport {
    uint64_t cycle{0};
    bool arbiter_ok{true};
    ArbiterDecision arbiter;
    size_t active_instruments{0};
    size_t new_instruments{0};
    size_t backfill_admitted{0};
    size_t realtime_admitted{0};
    size_t duplicates_skipped{0};
    size_t dispatch_errors{0};
    std::vector<std::string> closed_venues;
    std::vector<std::string> unrouted_venues;
};

/**
 * @brief Cadence-driven dispatcher of backfill and realtime jobs
 *
 * Each tick runs the arbiter, backfills instruments that were not active in
 * the previous cycle and dispatches one realtime job per open venue.
 * Duplicate requests within the dedupe window are dropped silently. An
 * instrument whose backfill could not be enqueued counts as new again on
 * the next cycle.
 */
class Scheduler {
public:
    using Clock = std::function<Timestamp()>;

    /**
     * @throws std::invalid_argument on a null collaborator or a non-positive
     *         cadence or timeout
     */
    Scheduler(SchedulerConfig config, std::shared_ptr<JobQueue> queue,
              std::shared_ptr<ConflictArbiter> arbiter,
              std::shared_ptr<InstrumentProvider> instruments,
              std::shared_ptr<const MarketCalendar> calendar, Clock clock = nullptr,
              CancellationToken cancel = CancellationToken());

    ~Scheduler();

    Result<DispatchOutcome> dispatch(const JobRequest& request);

    Result<SchedulerCycleReport> tick();

    /**
     * @brief Dispatch one backfill job over the whole active universe
     */
    Result<DispatchOutcome> dispatch_full_backfill();

    const SchedulerConfig& config() const {
        return config_;
    }

    size_t dedupe_size() {
        return dedupe_.size();
    }

private:
    std::vector<Instrument> filter_instruments(std::vector<Instrument> instruments) const;
    const VenueGroup* group_for(const std::string& venue) const;
    bool record(SchedulerCycleReport& report, const Result<DispatchOutcome>& outcome,
                size_t& admitted_counter, const std::string& what);
    void mark_running();

    SchedulerConfig config_;
    std::shared_ptr<JobQueue> queue_;
    std::shared_ptr<ConflictArbiter> arbiter_;
    std::shared_ptr<InstrumentProvider> instruments_;
    std::shared_ptr<const MarketCalendar> calendar_;
    Clock clock_;
    CancellationToken cancel_;

    DedupeWindow dedupe_;
    std::mutex tick_mutex_;
    std::set<std::string> seen_;
    uint64_t cycle_{0};

    std::string component_id_;
    bool registered_{false};
};

/**
 * @brief Job handler running PipelineExecutor batches
 *
 * Jobs with a workflow class hold that lease (TTL = job timeout) for the
 * duration of the batch. If another owner holds it the job completes with
 * every instrument skipped.
 */
JobHandler make_batch_handler(std::shared_ptr<PipelineExecutor> executor,
                              std::shared_ptr<ConflictArbiter> arbiter);

}  // namespace signal_ngin

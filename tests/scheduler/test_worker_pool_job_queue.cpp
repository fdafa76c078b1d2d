#include <gtest/gtest.h>
#include <atomic>
#include <mutex>
#include <thread>
#include <vector>
#include "../core/test_base.hpp"
#include "signal_ngin/scheduler/worker_pool_job_queue.hpp"

using namespace signal_ngin;
using namespace signal_ngin::testing;

namespace {

Job make_job(const std::string& id, const std::string& queue,
             JobPriority priority = JobPriority::NORMAL) {
    Job job;
    job.id = id;
    job.queue = queue;
    job.dedupe_key = id;
    job.priority = priority;
    job.mode = RunMode::REALTIME;
    job.instruments = {Instrument("VNM", "HOSE")};
    job.timeout = std::chrono::seconds(5);
    return job;
}

}  // namespace

class WorkerPoolJobQueueTest : public TestBase {
protected:
    void SetUp() override {
        TestBase::SetUp();
        config_.queues = {{"vn", "vn", 1}, {"us", "us", 1}};
    }

    JobHandler recording_handler() {
        return [this](const Job& job, const CancellationToken&) -> Result<RunSummary> {
            {
                std::lock_guard<std::mutex> lock(order_mutex_);
                order_.push_back(job.id);
            }
            RunSummary summary;
            summary.mode = job.mode;
            summary.processed = job.instruments.size();
            return summary;
        };
    }

    std::vector<std::string> order() {
        std::lock_guard<std::mutex> lock(order_mutex_);
        return order_;
    }

    JobQueueConfig config_;
    std::mutex order_mutex_;
    std::vector<std::string> order_;
};

TEST_F(WorkerPoolJobQueueTest, RunsJobAndKeepsSummary) {
    WorkerPoolJobQueue queue(config_, recording_handler());
    ASSERT_TRUE(queue.start().is_ok());

    auto handle = queue.enqueue(make_job("rt:HOSE:1", "vn"));
    ASSERT_TRUE(handle.is_ok());

    auto result = queue.wait(handle.value(), std::chrono::seconds(5));
    ASSERT_TRUE(result.is_ok()) << result.error()->what();
    EXPECT_EQ(result.value().status, JobStatus::DONE);
    EXPECT_EQ(result.value().summary.processed, 1u);
    EXPECT_EQ(result.value().error_code, ErrorCode::NONE);
    EXPECT_EQ(queue.status(handle.value()).value(), JobStatus::DONE);

    queue.stop();
    EXPECT_FALSE(queue.is_running());
}

TEST_F(WorkerPoolJobQueueTest, DuplicateIdRejectedUntilFinished) {
    WorkerPoolJobQueue queue(config_, recording_handler());

    ASSERT_TRUE(queue.enqueue(make_job("backfill:HOSE:VNM", "vn")).is_ok());
    auto duplicate = queue.enqueue(make_job("backfill:HOSE:VNM", "vn"));
    ASSERT_TRUE(duplicate.is_error());
    EXPECT_EQ(duplicate.error()->code(), ErrorCode::DUPLICATE_JOB);
    EXPECT_EQ(queue.pending("vn"), 1u);

    ASSERT_TRUE(queue.start().is_ok());
    ASSERT_TRUE(queue.wait_idle(std::chrono::seconds(5)));

    // A finished id may be reused
    EXPECT_TRUE(queue.enqueue(make_job("backfill:HOSE:VNM", "vn")).is_ok());
    ASSERT_TRUE(queue.wait_idle(std::chrono::seconds(5)));
    EXPECT_EQ(order().size(), 2u);
}

TEST_F(WorkerPoolJobQueueTest, RejectsUnknownQueueAndBadTimeout) {
    WorkerPoolJobQueue queue(config_, recording_handler());

    auto unknown = queue.enqueue(make_job("a", "eu"));
    ASSERT_TRUE(unknown.is_error());
    EXPECT_EQ(unknown.error()->code(), ErrorCode::INVALID_ARGUMENT);

    auto job = make_job("b", "vn");
    job.timeout = std::chrono::seconds(0);
    EXPECT_TRUE(queue.enqueue(job).is_error());

    auto missing = queue.status(JobHandle{"never", "vn"});
    ASSERT_TRUE(missing.is_error());
    EXPECT_EQ(missing.error()->code(), ErrorCode::DATA_NOT_FOUND);
}

TEST_F(WorkerPoolJobQueueTest, AssignsIdWhenMissing) {
    WorkerPoolJobQueue queue(config_, recording_handler());
    auto handle = queue.enqueue(make_job("", "us"));
    ASSERT_TRUE(handle.is_ok());
    EXPECT_FALSE(handle.value().id.empty());
    EXPECT_EQ(handle.value().queue, "us");
}

TEST_F(WorkerPoolJobQueueTest, HigherPriorityRunsFirstThenFifo) {
    WorkerPoolJobQueue queue(config_, recording_handler());

    ASSERT_TRUE(queue.enqueue(make_job("low", "vn", JobPriority::LOW)).is_ok());
    ASSERT_TRUE(queue.enqueue(make_job("normal-1", "vn", JobPriority::NORMAL)).is_ok());
    ASSERT_TRUE(queue.enqueue(make_job("high", "vn", JobPriority::HIGH)).is_ok());
    ASSERT_TRUE(queue.enqueue(make_job("normal-2", "vn", JobPriority::NORMAL)).is_ok());

    ASSERT_TRUE(queue.start().is_ok());
    ASSERT_TRUE(queue.wait_idle(std::chrono::seconds(5)));

    EXPECT_EQ(order(), (std::vector<std::string>{"high", "normal-1", "normal-2", "low"}));
}

TEST_F(WorkerPoolJobQueueTest, PausedClassIsNotServed) {
    WorkerPoolJobQueue queue(config_, recording_handler());
    queue.pause("us");
    EXPECT_TRUE(queue.is_paused("us"));
    ASSERT_TRUE(queue.start().is_ok());

    auto us_job = queue.enqueue(make_job("us-job", "us"));
    auto vn_job = queue.enqueue(make_job("vn-job", "vn"));
    ASSERT_TRUE(us_job.is_ok());
    ASSERT_TRUE(vn_job.is_ok());

    ASSERT_TRUE(queue.wait(vn_job.value(), std::chrono::seconds(5)).is_ok());
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    EXPECT_EQ(queue.status(us_job.value()).value(), JobStatus::QUEUED);
    EXPECT_EQ(queue.pending("us"), 1u);
    EXPECT_FALSE(queue.wait_idle(std::chrono::milliseconds(50)));

    auto& state_manager = StateManager::instance();
    EXPECT_EQ(state_manager.get_state(queue.component_id() + ":us").value().state,
              ComponentState::PAUSED);

    queue.resume("us");
    EXPECT_FALSE(queue.is_paused("us"));
    auto done = queue.wait(us_job.value(), std::chrono::seconds(5));
    ASSERT_TRUE(done.is_ok());
    EXPECT_EQ(done.value().status, JobStatus::DONE);
    EXPECT_EQ(state_manager.get_state(queue.component_id() + ":us").value().state,
              ComponentState::RUNNING);
}

TEST_F(WorkerPoolJobQueueTest, TimeoutFailsJobAndCancelsToken) {
    std::atomic<bool> saw_cancel{false};
    WorkerPoolJobQueue queue(config_, [&](const Job&, const CancellationToken& cancel)
                                          -> Result<RunSummary> {
        if (cancel.wait_for(std::chrono::seconds(10))) {
            saw_cancel = true;
        }
        return RunSummary{};
    });
    ASSERT_TRUE(queue.start().is_ok());

    auto job = make_job("slow", "vn");
    job.timeout = std::chrono::seconds(1);
    auto handle = queue.enqueue(job);
    ASSERT_TRUE(handle.is_ok());

    auto result = queue.wait(handle.value(), std::chrono::seconds(5));
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().status, JobStatus::FAILED);
    EXPECT_EQ(result.value().error_code, ErrorCode::TIMEOUT_ERROR);

    queue.stop();
    EXPECT_TRUE(saw_cancel.load());
}

TEST_F(WorkerPoolJobQueueTest, TimedOutJobIdStaysBusyUntilHandlerReturns) {
    config_.queues = {{"vn", "vn", 2}};
    std::atomic<int> active{0};
    std::atomic<int> max_active{0};
    std::atomic<int> runs{0};
    WorkerPoolJobQueue queue(config_, [&](const Job&, const CancellationToken&)
                                          -> Result<RunSummary> {
        const int now_active = ++active;
        int seen = max_active.load();
        while (now_active > seen && !max_active.compare_exchange_weak(seen, now_active)) {
        }
        ++runs;
        // Ignores the token
        std::this_thread::sleep_for(std::chrono::milliseconds(2500));
        --active;
        return RunSummary{};
    });
    ASSERT_TRUE(queue.start().is_ok());

    auto job = make_job("bf:HOSE:VNM", "vn");
    job.timeout = std::chrono::seconds(1);
    auto handle = queue.enqueue(job);
    ASSERT_TRUE(handle.is_ok());

    // Past the timeout the record reports the timeout but still holds the id
    std::this_thread::sleep_for(std::chrono::milliseconds(1500));
    auto in_flight = queue.result(handle.value());
    ASSERT_TRUE(in_flight.is_ok());
    EXPECT_EQ(in_flight.value().status, JobStatus::RUNNING);
    EXPECT_EQ(in_flight.value().error_code, ErrorCode::TIMEOUT_ERROR);
    EXPECT_FALSE(queue.wait_idle(std::chrono::milliseconds(10)));

    auto again = queue.enqueue(job);
    ASSERT_TRUE(again.is_error());
    EXPECT_EQ(again.error()->code(), ErrorCode::DUPLICATE_JOB);

    auto finished = queue.wait(handle.value(), std::chrono::seconds(5));
    ASSERT_TRUE(finished.is_ok());
    EXPECT_EQ(finished.value().status, JobStatus::FAILED);
    EXPECT_EQ(finished.value().error_code, ErrorCode::TIMEOUT_ERROR);

    // Once the handler has returned the id is admitted again
    auto rerun = queue.enqueue(job);
    ASSERT_TRUE(rerun.is_ok());
    EXPECT_TRUE(queue.wait(rerun.value(), std::chrono::seconds(5)).is_ok());

    queue.stop();
    EXPECT_EQ(runs.load(), 2);
    EXPECT_EQ(max_active.load(), 1);
}

TEST_F(WorkerPoolJobQueueTest, HandlerFailuresAreRecorded) {
    WorkerPoolJobQueue queue(config_, [](const Job& job, const CancellationToken&)
                                          -> Result<RunSummary> {
        if (job.id == "throws") {
            throw std::runtime_error("boom");
        }
        return make_error<RunSummary>(ErrorCode::LEASE_HELD, "lease busy", "test");
    });
    ASSERT_TRUE(queue.start().is_ok());

    auto failing = queue.enqueue(make_job("fails", "vn"));
    auto throwing = queue.enqueue(make_job("throws", "us"));

    auto failed = queue.wait(failing.value(), std::chrono::seconds(5));
    ASSERT_TRUE(failed.is_ok());
    EXPECT_EQ(failed.value().status, JobStatus::FAILED);
    EXPECT_EQ(failed.value().error_code, ErrorCode::LEASE_HELD);

    auto thrown = queue.wait(throwing.value(), std::chrono::seconds(5));
    ASSERT_TRUE(thrown.is_ok());
    EXPECT_EQ(thrown.value().status, JobStatus::FAILED);
    EXPECT_NE(thrown.value().error_message.find("boom"), std::string::npos);
}

TEST_F(WorkerPoolJobQueueTest, StopCancelsRunningJob) {
    std::atomic<bool> started{false};
    std::atomic<bool> cancelled{false};
    WorkerPoolJobQueue queue(config_, [&](const Job&, const CancellationToken& cancel)
                                          -> Result<RunSummary> {
        started = true;
        cancelled = cancel.wait_for(std::chrono::seconds(10));
        return RunSummary{};
    });
    ASSERT_TRUE(queue.start().is_ok());
    ASSERT_TRUE(queue.enqueue(make_job("long", "vn")).is_ok());

    for (int i = 0; i < 100 && !started.load(); ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    ASSERT_TRUE(started.load());

    queue.stop();
    EXPECT_TRUE(cancelled.load());
}

TEST_F(WorkerPoolJobQueueTest, ConstructorValidation) {
    EXPECT_THROW(WorkerPoolJobQueue(config_, nullptr), std::invalid_argument);

    JobQueueConfig repeated;
    repeated.queues = {{"vn", "vn", 1}, {"vn", "vn", 2}};
    EXPECT_THROW(WorkerPoolJobQueue(repeated, recording_handler()), std::invalid_argument);

    JobQueueConfig no_workers;
    no_workers.queues = {{"vn", "vn", 0}};
    EXPECT_THROW(WorkerPoolJobQueue(no_workers, recording_handler()), std::invalid_argument);
}

TEST_F(WorkerPoolJobQueueTest, ConfigJson) {
    JobQueueConfig config;
    config.from_json({{"queues", {{{"name", "eu"}, {"workers", 3}}}}, {"result_ttl_seconds", 60}});
    ASSERT_EQ(config.queues.size(), 1u);
    EXPECT_EQ(config.queues[0].worker_class, "eu");
    EXPECT_EQ(config.queues[0].workers, 3);
    EXPECT_EQ(config.to_json()["result_ttl_seconds"], 60);
}

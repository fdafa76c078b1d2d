// include/signal_ngin/scheduler/job_queue.hpp
#pragma once

#include <string>
#include "signal_ngin/core/error.hpp"
#include "signal_ngin/scheduler/job.hpp"

namespace signal_ngin {

/**
 * @brief Named priority queues of jobs
 *
 * At most one worker processes a given job id at a time. The queue does not
 * stop two different jobs from touching the same instrument; that is the
 * ConflictArbiter's concern.
 */
class JobQueue {
public:
    virtual ~JobQueue() = default;

    /**
     * @return The handle, or DUPLICATE_JOB if the id is queued or running
     */
    virtual Result<JobHandle> enqueue(Job job) = 0;

    virtual Result<JobStatus> status(const JobHandle& handle) const = 0;

    /**
     * @return The job record; summary is only meaningful once DONE
     */
    virtual Result<JobResult> result(const JobHandle& handle) const = 0;
};

/**
 * @brief Pause and resume the workers of one class
 * A paused class is not handed new jobs; running jobs are not interrupted.
 */
class WorkerControl {
public:
    virtual ~WorkerControl() = default;

    virtual void pause(const std::string& worker_class) = 0;
    virtual void resume(const std::string& worker_class) = 0;
    virtual bool is_paused(const std::string& worker_class) const = 0;
};

}  // namespace signal_ngin

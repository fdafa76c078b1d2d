// include/signal_ngin/scheduler/job.hpp
#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>
#include "signal_ngin/core/error.hpp"
#include "signal_ngin/core/types.hpp"
#include "signal_ngin/pipeline/pipeline_executor.hpp"

namespace signal_ngin {

/**
 * @brief Priority class; lower value runs first
 */
enum class JobPriority { HIGH = 0, NORMAL = 1, LOW = 2 };

enum class JobStatus { QUEUED, RUNNING, DONE, FAILED };

inline std::string job_priority_to_string(JobPriority priority) {
    switch (priority) {
        case JobPriority::HIGH:
            return "HIGH";
        case JobPriority::NORMAL:
            return "NORMAL";
        case JobPriority::LOW:
            return "LOW";
    }
    return "UNKNOWN";
}

inline std::optional<JobPriority> job_priority_from_string(const std::string& name) {
    if (name == "HIGH" || name == "high")
        return JobPriority::HIGH;
    if (name == "NORMAL" || name == "normal")
        return JobPriority::NORMAL;
    if (name == "LOW" || name == "low")
        return JobPriority::LOW;
    return std::nullopt;
}

inline std::string job_status_to_string(JobStatus status) {
    switch (status) {
        case JobStatus::QUEUED:
            return "QUEUED";
        case JobStatus::RUNNING:
            return "RUNNING";
        case JobStatus::DONE:
            return "DONE";
        case JobStatus::FAILED:
            return "FAILED";
    }
    return "UNKNOWN";
}

/**
 * @brief One unit of schedulable work: a pipeline batch over an
 *        instrument group in one mode
 *
 * workflow_class is empty for ordinary jobs. When set, the handler must hold
 * the lease for that class while running.
 */
struct Job {
    std::string id;
    std::string queue;
    std::vector<Instrument> instruments;
    RunMode mode{RunMode::REALTIME};
    std::string dedupe_key;
    std::chrono::seconds timeout{300};
    JobPriority priority{JobPriority::NORMAL};
    std::string workflow_class;
};

struct JobHandle {
    std::string id;
    std::string queue;
};

/**
 * @brief Final or in-flight state of a job
 */
struct JobResult {
    JobStatus status{JobStatus::QUEUED};
    RunSummary summary;
    ErrorCode error_code{ErrorCode::NONE};
    std::string error_message;
    Timestamp enqueued_at{};
    Timestamp started_at{};
    Timestamp finished_at{};
};

}  // namespace signal_ngin

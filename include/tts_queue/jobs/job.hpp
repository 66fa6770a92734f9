#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include "tts_queue/jobs/request.hpp"

namespace tts_queue {

using JobId = std::string;
using TimePoint = std::chrono::system_clock::time_point;

enum class JobStatus {
    Queued,
    Processing,
    Completed,
    Failed,
};

const char* to_string(JobStatus status);
bool is_terminal(JobStatus status);

// Allowed moves: Queued -> Processing -> Completed | Failed.
bool is_valid_transition(JobStatus from, JobStatus to);

struct JobRecord {
    JobId id;
    // Submission order within this process.
    std::uint64_t sequence = 0;
    TtsRequest request;
    JobStatus status = JobStatus::Queued;
    TimePoint created_at;
    std::optional<TimePoint> started_at;
    std::optional<TimePoint> finished_at;
    std::string error;
};

}

#pragma once

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "tts_queue/jobs/job.hpp"

namespace tts_queue {

class ArtifactStore;
class SynthesisEngine;

class CapacityExceeded : public std::runtime_error {
public:
    CapacityExceeded(std::size_t queue_size, std::size_t limit)
        : std::runtime_error("Server is currently at capacity. Please try again later."),
          queue_size_(queue_size),
          limit_(limit) {}

    std::size_t queue_size() const { return queue_size_; }
    std::size_t limit() const { return limit_; }

private:
    std::size_t queue_size_;
    std::size_t limit_;
};

struct JobManagerOptions {
    int max_concurrent = 4;
    // Submissions are refused while queue_size() > max_concurrent * admission_factor.
    int admission_factor = 2;
};

// Owns the pending queue, the worker pool and the in-memory job table. All
// shared state sits behind one mutex; workers hold it only to claim a job and
// to record its outcome, never while synthesizing.
//
// A record stays in memory after it reaches a terminal state until cleanup()
// is called for it.
class JobManager {
public:
    JobManager(JobManagerOptions options, ArtifactStore& store, SynthesisEngine& engine);
    ~JobManager();

    JobManager(const JobManager&) = delete;
    JobManager& operator=(const JobManager&) = delete;

    void start();
    // Lets claimed jobs run to completion; queued jobs stay queued.
    void stop();
    bool is_running() const;

    // Never waits for a worker. Throws CapacityExceeded when admission control
    // refuses the job, in which case nothing is enqueued.
    JobId submit(TtsRequest request);

    // Jobs not yet completed or failed.
    std::size_t queue_size() const;
    std::size_t capacity_limit() const;
    int max_concurrent() const { return options_.max_concurrent; }

    // In-memory status only.
    std::optional<JobStatus> job_status(const JobId& job_id) const;
    // Artifact store first, then memory: a finished artifact means completed
    // whatever the record says.
    std::optional<JobStatus> resolve_status(const JobId& job_id) const;
    std::optional<JobRecord> job_info(const JobId& job_id) const;
    bool contains(const JobId& job_id) const;

    // Drops the in-memory record. Idempotent.
    void cleanup(const JobId& job_id);

    // Every in-memory record, in submission order.
    std::vector<JobRecord> active_jobs() const;
    std::size_t memory_jobs_count() const;

private:
    struct Claim {
        JobId job_id;
        TtsRequest request;
        TimePoint created_at;
    };

    void worker_loop(int worker_index, std::uint64_t generation);
    void process(const Claim& claim, int worker_index);
    void finish(const JobId& job_id, JobStatus status, const std::string& error);
    static JobId make_job_id();

    JobManagerOptions options_;
    ArtifactStore& store_;
    SynthesisEngine& engine_;

    mutable std::mutex mutex_;
    std::condition_variable job_available_;
    std::deque<JobId> pending_;
    std::unordered_map<JobId, JobRecord> jobs_;
    std::size_t active_count_ = 0;
    std::uint64_t next_sequence_ = 0;
    bool running_ = false;
    // Bumped by start() and stop(); a worker exits once it no longer matches.
    std::uint64_t generation_ = 0;
    std::vector<std::thread> workers_;
};

}

#include "tts_queue/jobs/job_manager.hpp"

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <random>
#include <utility>

#include "tts_queue/engine/synthesis_engine.hpp"
#include "tts_queue/logging.hpp"
#include "tts_queue/metrics.hpp"
#include "tts_queue/storage/artifact_store.hpp"
#include "tts_queue/utils/text.hpp"

namespace tts_queue {

JobManager::JobManager(JobManagerOptions options, ArtifactStore& store, SynthesisEngine& engine)
    : options_(options),
      store_(store),
      engine_(engine) {
    if (options_.max_concurrent <= 0) {
        throw std::invalid_argument("max_concurrent must be positive");
    }
    if (options_.admission_factor <= 0) {
        throw std::invalid_argument("admission_factor must be positive");
    }
}

JobManager::~JobManager() {
    stop();
}

void JobManager::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_) {
        return;
    }
    running_ = true;
    const auto generation = ++generation_;
    workers_.reserve(static_cast<size_t>(options_.max_concurrent));
    for (int i = 0; i < options_.max_concurrent; ++i) {
        workers_.emplace_back([this, i, generation]() { worker_loop(i, generation); });
    }
    logging::info(
        "Job manager started",
        {kv("workers", options_.max_concurrent),
         kv("capacity_limit", capacity_limit()),
         kv("queued", pending_.size())});
}

void JobManager::stop() {
    std::vector<std::thread> workers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) {
            return;
        }
        // Retires the current workers even if start() spawns new ones before
        // they are joined.
        ++generation_;
        running_ = false;
        workers.swap(workers_);
    }
    job_available_.notify_all();
    for (auto& worker : workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    logging::info(
        "Job manager stopped",
        {kv("queue_size", queue_size())});
}

bool JobManager::is_running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_;
}

JobId JobManager::submit(TtsRequest request) {
    if (request.text.empty()) {
        throw ValidationError("Text is required");
    }

    JobRecord record;
    record.id = make_job_id();
    record.status = JobStatus::Queued;
    record.created_at = std::chrono::system_clock::now();
    record.request = std::move(request);
    const auto job_id = record.id;
    const auto text_length = utils::utf8_length(record.request.text);

    std::size_t queue_size = 0;
    bool rejected = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        queue_size = active_count_;
        if (active_count_ > capacity_limit()) {
            rejected = true;
        } else {
            record.sequence = next_sequence_++;
            jobs_.emplace(job_id, std::move(record));
            pending_.push_back(job_id);
            queue_size = ++active_count_;
        }
    }

    if (rejected) {
        Metrics::instance().increment(metric::kJobsRejected);
        logging::warn(
            "Job rejected: at capacity",
            {kv("queue_size", queue_size),
             kv("capacity_limit", capacity_limit())});
        throw CapacityExceeded(queue_size, capacity_limit());
    }

    job_available_.notify_one();
    Metrics::instance().increment(metric::kJobsSubmitted);
    logging::info(
        "Job queued",
        {kv("job_id", job_id),
         kv("text_length", text_length),
         kv("queue_size", queue_size)});
    return job_id;
}

std::size_t JobManager::queue_size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_count_;
}

std::size_t JobManager::capacity_limit() const {
    return static_cast<std::size_t>(options_.max_concurrent) *
           static_cast<std::size_t>(options_.admission_factor);
}

std::optional<JobStatus> JobManager::job_status(const JobId& job_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = jobs_.find(job_id);
    if (it == jobs_.end()) {
        return std::nullopt;
    }
    return it->second.status;
}

std::optional<JobStatus> JobManager::resolve_status(const JobId& job_id) const {
    if (store_.exists(job_id)) {
        return JobStatus::Completed;
    }
    return job_status(job_id);
}

std::optional<JobRecord> JobManager::job_info(const JobId& job_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = jobs_.find(job_id);
    if (it == jobs_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool JobManager::contains(const JobId& job_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return jobs_.count(job_id) > 0;
}

void JobManager::cleanup(const JobId& job_id) {
    std::optional<JobStatus> removed_status;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = jobs_.find(job_id);
        if (it == jobs_.end()) {
            return;
        }
        removed_status = it->second.status;
        // A queued id left in pending_ is skipped when a worker reaches it; a
        // running worker finds no record and leaves the table alone.
        if (!is_terminal(it->second.status) && active_count_ > 0) {
            --active_count_;
        }
        jobs_.erase(it);
    }
    logging::debug(
        "Job record cleaned up",
        {kv("job_id", job_id),
         kv("status", *removed_status)});
}

std::vector<JobRecord> JobManager::active_jobs() const {
    std::vector<JobRecord> records;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        records.reserve(jobs_.size());
        for (const auto& item : jobs_) {
            records.push_back(item.second);
        }
    }
    std::sort(records.begin(), records.end(), [](const JobRecord& a, const JobRecord& b) {
        return a.sequence < b.sequence;
    });
    return records;
}

std::size_t JobManager::memory_jobs_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return jobs_.size();
}

void JobManager::worker_loop(int worker_index, std::uint64_t generation) {
    logging::debug(
        "Worker started",
        {kv("worker", worker_index)});
    while (true) {
        Claim claim;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            job_available_.wait(lock, [this, generation]() {
                return generation_ != generation || !pending_.empty();
            });
            if (generation_ != generation) {
                break;
            }
            auto job_id = std::move(pending_.front());
            pending_.pop_front();
            const auto it = jobs_.find(job_id);
            if (it == jobs_.end() || it->second.status != JobStatus::Queued) {
                continue;
            }
            it->second.status = JobStatus::Processing;
            it->second.started_at = std::chrono::system_clock::now();
            claim.job_id = std::move(job_id);
            claim.request = it->second.request;
            claim.created_at = it->second.created_at;
        }
        process(claim, worker_index);
    }
    logging::debug(
        "Worker stopped",
        {kv("worker", worker_index)});
}

void JobManager::process(const Claim& claim, int worker_index) {
    logging::debug(
        "Job processing",
        {kv("job_id", claim.job_id),
         kv("worker", worker_index),
         kv("voice", claim.request.voice)});
    const auto synth_start = std::chrono::steady_clock::now();
    try {
        const auto audio = engine_.synthesize(claim.request);
        const std::chrono::duration<double> synth_elapsed =
            std::chrono::steady_clock::now() - synth_start;
        Metrics::instance().observe_synthesis_time(synth_elapsed.count());
        if (audio.empty()) {
            throw SynthesisError("synthesis produced no audio");
        }
        store_.save(claim.job_id, claim.request, claim.created_at, audio);
        finish(claim.job_id, JobStatus::Completed, "");
        logging::info(
            "Job completed",
            {kv("job_id", claim.job_id),
             kv("bytes", audio.size()),
             kv("elapsed", synth_elapsed)});
    } catch (const std::exception& ex) {
        logging::error(
            "Job failed",
            {kv("job_id", claim.job_id),
             kv("worker", worker_index),
             kv("error", ex.what())});
        finish(claim.job_id, JobStatus::Failed, ex.what());
    }
}

void JobManager::finish(const JobId& job_id, JobStatus status, const std::string& error) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = jobs_.find(job_id);
        if (it == jobs_.end()) {
            logging::debug(
                "Finished job no longer in memory",
                {kv("job_id", job_id),
                 kv("status", status)});
            return;
        }
        auto& record = it->second;
        if (!is_valid_transition(record.status, status)) {
            logging::warn(
                "Ignoring invalid job transition",
                {kv("job_id", job_id),
                 kv("from", record.status),
                 kv("to", status)});
            return;
        }
        record.status = status;
        record.finished_at = std::chrono::system_clock::now();
        record.error = error;
        if (active_count_ > 0) {
            --active_count_;
        }
    }
    Metrics::instance().increment(status == JobStatus::Completed ? metric::kJobsCompleted
                                                                 : metric::kJobsFailed);
}

JobId JobManager::make_job_id() {
    thread_local std::mt19937_64 generator{std::random_device{}()};
    std::uniform_int_distribution<std::uint64_t> distribution;
    std::uint64_t high = distribution(generator);
    std::uint64_t low = distribution(generator);
    // RFC 4122 version 4, variant 1.
    high = (high & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    low = (low & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    char buffer[37];
    std::snprintf(buffer, sizeof(buffer), "%08x-%04x-%04x-%04x-%012llx",
                  static_cast<unsigned>(high >> 32),
                  static_cast<unsigned>((high >> 16) & 0xFFFF),
                  static_cast<unsigned>(high & 0xFFFF),
                  static_cast<unsigned>(low >> 48),
                  static_cast<unsigned long long>(low & 0xFFFFFFFFFFFFULL));
    return JobId(buffer);
}

}

#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "tts_queue/jobs/job.hpp"

namespace tts_queue {

class ArtifactStore;
class JobManager;

struct JobSummary {
    JobId job_id;
    JobStatus status = JobStatus::Queued;
    TimePoint created_at;
    bool audio_exists = false;
    std::string text;
};

nlohmann::json to_json(const JobSummary& summary);

// Merged view of finished artifacts and in-memory jobs, newest first.
class JobLister {
public:
    static constexpr std::size_t kDefaultLimit = 50;
    static constexpr std::size_t kDefaultPreviewLength = 100;

    JobLister(const ArtifactStore& store,
              const JobManager& manager,
              std::size_t preview_length = kDefaultPreviewLength);

    std::vector<JobSummary> list(std::size_t limit = kDefaultLimit) const;

private:
    const ArtifactStore& store_;
    const JobManager& manager_;
    std::size_t preview_length_;
};

}

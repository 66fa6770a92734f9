#include "tts_queue/jobs/job_lister.hpp"

#include <algorithm>
#include <unordered_set>
#include <utility>

#include "tts_queue/jobs/job_manager.hpp"
#include "tts_queue/storage/artifact_store.hpp"
#include "tts_queue/utils/text.hpp"
#include "tts_queue/utils/time.hpp"

namespace tts_queue {

nlohmann::json to_json(const JobSummary& summary) {
    return nlohmann::json{
        {"job_id", summary.job_id},
        {"status", to_string(summary.status)},
        {"created_at", utils::to_iso8601(summary.created_at)},
        {"audio_exists", summary.audio_exists},
        {"text", summary.text},
    };
}

JobLister::JobLister(const ArtifactStore& store,
                     const JobManager& manager,
                     std::size_t preview_length)
    : store_(store),
      manager_(manager),
      preview_length_(preview_length) {}

std::vector<JobSummary> JobLister::list(std::size_t limit) const {
    std::vector<JobSummary> summaries;
    std::unordered_set<JobId> completed_ids;

    for (const auto& info : store_.list_completed()) {
        JobSummary summary;
        summary.job_id = info.job_id;
        summary.status = JobStatus::Completed;
        summary.created_at = info.created_at;
        summary.audio_exists = true;
        summary.text = utils::preview(info.text, preview_length_);
        completed_ids.insert(info.job_id);
        summaries.push_back(std::move(summary));
    }

    for (const auto& record : manager_.active_jobs()) {
        if (completed_ids.count(record.id) > 0 || store_.exists(record.id)) {
            continue;
        }
        JobSummary summary;
        summary.job_id = record.id;
        summary.status = record.status;
        summary.created_at = record.created_at;
        summary.audio_exists = false;
        summary.text = utils::preview(record.request.text, preview_length_);
        summaries.push_back(std::move(summary));
    }

    std::stable_sort(summaries.begin(), summaries.end(),
                     [](const JobSummary& a, const JobSummary& b) {
                         return a.created_at > b.created_at;
                     });
    if (summaries.size() > limit) {
        summaries.resize(limit);
    }
    return summaries;
}

}

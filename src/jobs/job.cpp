#include "tts_queue/jobs/job.hpp"

namespace tts_queue {

const char* to_string(JobStatus status) {
    switch (status) {
        case JobStatus::Queued:
            return "queued";
        case JobStatus::Processing:
            return "processing";
        case JobStatus::Completed:
            return "completed";
        case JobStatus::Failed:
            return "failed";
    }
    return "unknown";
}

bool is_terminal(JobStatus status) {
    return status == JobStatus::Completed || status == JobStatus::Failed;
}

bool is_valid_transition(JobStatus from, JobStatus to) {
    switch (from) {
        case JobStatus::Queued:
            return to == JobStatus::Processing;
        case JobStatus::Processing:
            return to == JobStatus::Completed || to == JobStatus::Failed;
        case JobStatus::Completed:
        case JobStatus::Failed:
            return false;
    }
    return false;
}

}

#pragma once

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

#include "tts_queue/jobs/job.hpp"

namespace tts_queue {

class ArtifactError : public std::runtime_error {
public:
    explicit ArtifactError(const std::string& message) : std::runtime_error(message) {}
};

// Completion metadata kept next to each artifact as <job_id>.json.
struct ArtifactInfo {
    JobId job_id;
    std::string text;
    std::string voice;
    TimePoint created_at;
    TimePoint completed_at;
    std::uintmax_t size = 0;
};

enum class FetchOutcome {
    Ok,
    NotFound,
    Incomplete,
};

struct FetchResult {
    FetchOutcome outcome = FetchOutcome::NotFound;
    std::string data;
    std::string etag;
};

// Directory of finished audio keyed by job id. An artifact file is only ever
// created by rename from a temporary file, so its presence means the write
// finished.
class ArtifactStore {
public:
    static constexpr const char* kAudioExtension = ".mp3";
    static constexpr const char* kMetaExtension = ".json";
    static constexpr const char* kTempExtension = ".tmp";

    explicit ArtifactStore(std::filesystem::path directory);

    ArtifactStore(const ArtifactStore&) = delete;
    ArtifactStore& operator=(const ArtifactStore&) = delete;

    // Creates the directory if needed, drops leftover temp files and rebuilds
    // the index from what is on disk. Returns the number of artifacts found.
    std::size_t reload();

    void save(const JobId& job_id,
              const TtsRequest& request,
              TimePoint created_at,
              const std::string& audio);

    bool exists(const JobId& job_id) const;
    FetchResult fetch(const JobId& job_id, std::size_t min_bytes) const;
    bool remove(const JobId& job_id);
    std::size_t count() const;
    std::vector<ArtifactInfo> list_completed() const;

    std::filesystem::path artifact_path(const JobId& job_id) const;
    const std::filesystem::path& directory() const { return directory_; }

    static bool is_valid_job_id(const std::string& job_id);
    static std::string etag_for(const JobId& job_id);

private:
    std::filesystem::path meta_path(const JobId& job_id) const;
    ArtifactInfo load_info(const JobId& job_id, const std::filesystem::path& audio_path) const;

    std::filesystem::path directory_;
    mutable std::mutex mutex_;
    std::unordered_map<JobId, ArtifactInfo> index_;
};

}

#pragma once

#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "tts_queue/config.hpp"

namespace tts_queue {

class ArtifactStore;
class JobLister;
class JobManager;
namespace utils {
class TaskQueue;
}

struct RestResponse {
    int status = 200;
    nlohmann::json body;
};

struct AudioResponse {
    int status = 200;
    std::string data;
    std::string content_type;
    std::vector<std::pair<std::string, std::string>> headers;
    // Set instead of data when status is not 200.
    nlohmann::json error;
};

struct ClientInfo {
    std::string remote_addr = "unknown";
    std::string user_agent = "unknown";
};

// Request handling for the HTTP routes, free of any transport so it can be
// driven directly. Every method answers; internal errors come back as 500.
class TtsService {
public:
    TtsService(const Config& config,
               JobManager& manager,
               ArtifactStore& store,
               const JobLister& lister,
               utils::TaskQueue& background);

    RestResponse submit(const std::string& body, const ClientInfo& client);
    RestResponse list_jobs() const;
    RestResponse job_status(const std::string& job_id) const;
    AudioResponse fetch_audio(const std::string& job_id) const;
    RestResponse delete_audio(const std::string& job_id);
    RestResponse health() const;

    static nlohmann::json error_body(const std::string& message,
                                     nlohmann::json extra = nlohmann::json::object());

private:
    const Config& config_;
    JobManager& manager_;
    ArtifactStore& store_;
    const JobLister& lister_;
    utils::TaskQueue& background_;
};

}

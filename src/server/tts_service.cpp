#include "tts_queue/server/tts_service.hpp"

#include <utility>

#include "tts_queue/jobs/job_lister.hpp"
#include "tts_queue/jobs/job_manager.hpp"
#include "tts_queue/jobs/request.hpp"
#include "tts_queue/logging.hpp"
#include "tts_queue/storage/artifact_store.hpp"
#include "tts_queue/utils/async.hpp"

namespace tts_queue {

namespace {

constexpr const char* kAudioContentType = "audio/mpeg";

RestResponse error_response(int status, const std::string& message,
                            nlohmann::json extra = nlohmann::json::object()) {
    return {status, TtsService::error_body(message, std::move(extra))};
}

RestResponse internal_error(const std::string& message, const std::exception& ex) {
    return error_response(500, message + ": " + ex.what(), {{"error", ex.what()}});
}

std::string status_message(JobStatus status, const std::string& error) {
    switch (status) {
        case JobStatus::Queued:
            return "Audio is queued";
        case JobStatus::Processing:
            return "Audio is being processed";
        case JobStatus::Completed:
            return "Audio is ready";
        case JobStatus::Failed:
            return error.empty() ? "Synthesis failed" : "Synthesis failed: " + error;
    }
    return "";
}

}

TtsService::TtsService(const Config& config,
                       JobManager& manager,
                       ArtifactStore& store,
                       const JobLister& lister,
                       utils::TaskQueue& background)
    : config_(config),
      manager_(manager),
      store_(store),
      lister_(lister),
      background_(background) {}

nlohmann::json TtsService::error_body(const std::string& message, nlohmann::json extra) {
    nlohmann::json detail = extra.is_object() ? std::move(extra) : nlohmann::json::object();
    detail["message"] = message;
    return nlohmann::json{{"detail", detail}};
}

RestResponse TtsService::submit(const std::string& body, const ClientInfo& client) {
    nlohmann::json payload;
    try {
        payload = nlohmann::json::parse(body);
    } catch (const std::exception& ex) {
        logging::warn(
            "Failed to parse /tts request",
            {kv("error", ex.what())});
        return error_response(400, "invalid request body");
    }

    try {
        auto request = parse_tts_request(payload, config_.default_voice);
        logging::info(
            "TTS request",
            {kv("client", client.remote_addr),
             kv("user_agent", client.user_agent),
             kv("content_length", request.text.size())});
        const auto job_id = manager_.submit(std::move(request));
        return {200, nlohmann::json{{"job_id", job_id}}};
    } catch (const ValidationError& ex) {
        return error_response(400, ex.what());
    } catch (const CapacityExceeded& ex) {
        return error_response(503, ex.what(), {{"queue_size", ex.queue_size()}});
    } catch (const std::exception& ex) {
        logging::error(
            "Error in /tts endpoint",
            {kv("error", ex.what())});
        return internal_error("Internal server error", ex);
    }
}

RestResponse TtsService::list_jobs() const {
    try {
        auto items = nlohmann::json::array();
        for (const auto& summary : lister_.list(static_cast<std::size_t>(config_.list_limit))) {
            items.push_back(to_json(summary));
        }
        return {200, items};
    } catch (const std::exception& ex) {
        logging::error(
            "Error getting jobs",
            {kv("error", ex.what())});
        return internal_error("Error getting jobs", ex);
    }
}

RestResponse TtsService::job_status(const std::string& job_id) const {
    try {
        const auto status = manager_.resolve_status(job_id);
        if (!status) {
            return error_response(404, "Job " + job_id + " not found", {{"job_id", job_id}});
        }
        std::string error;
        if (*status == JobStatus::Failed) {
            if (const auto info = manager_.job_info(job_id)) {
                error = info->error;
            }
        }
        return {200, nlohmann::json{{"job_id", job_id},
                                    {"status", to_string(*status)},
                                    {"message", status_message(*status, error)}}};
    } catch (const std::exception& ex) {
        logging::error(
            "Error checking job status",
            {kv("job_id", job_id),
             kv("error", ex.what())});
        return internal_error("Error checking job status", ex);
    }
}

AudioResponse TtsService::fetch_audio(const std::string& job_id) const {
    AudioResponse response;
    try {
        auto result = store_.fetch(job_id, static_cast<std::size_t>(config_.min_artifact_bytes));
        switch (result.outcome) {
            case FetchOutcome::NotFound:
                response.status = 404;
                response.error = error_body(
                    "Audio for job " + job_id + " not found or not ready yet",
                    {{"job_id", job_id}});
                return response;
            case FetchOutcome::Incomplete:
                logging::warn(
                    "Incomplete audio artifact",
                    {kv("job_id", job_id)});
                response.status = 422;
                response.error = error_body(
                    "Audio file appears to be incomplete for job " + job_id,
                    {{"job_id", job_id}});
                return response;
            case FetchOutcome::Ok:
                break;
        }
        response.status = 200;
        response.data = std::move(result.data);
        response.content_type = kAudioContentType;
        response.headers.emplace_back(
            "Cache-Control", "public, max-age=" + std::to_string(config_.cache_max_age_sec));
        response.headers.emplace_back("ETag", result.etag);
        return response;
    } catch (const std::exception& ex) {
        logging::error(
            "Error reading audio file",
            {kv("job_id", job_id),
             kv("error", ex.what())});
        response.status = 500;
        response.error = internal_error("Error reading audio file", ex).body;
        return response;
    }
}

RestResponse TtsService::delete_audio(const std::string& job_id) {
    try {
        if (!store_.remove(job_id)) {
            return error_response(404, "Audio for job " + job_id + " not found",
                                  {{"job_id", job_id}});
        }
        if (manager_.contains(job_id)) {
            auto& manager = manager_;
            if (!background_.post([&manager, job_id]() { manager.cleanup(job_id); })) {
                manager.cleanup(job_id);
            }
        }
        logging::info(
            "Audio deleted",
            {kv("job_id", job_id)});
        return {200, nlohmann::json{
                         {"message", "Audio for job " + job_id + " deleted successfully"}}};
    } catch (const std::exception& ex) {
        logging::error(
            "Failed to delete audio",
            {kv("job_id", job_id),
             kv("error", ex.what())});
        return internal_error("Failed to delete audio", ex);
    }
}

RestResponse TtsService::health() const {
    try {
        const auto audio_files_count = store_.count();
        const auto active_jobs_size = manager_.queue_size();
        const auto memory_jobs_count = manager_.memory_jobs_count();
        return {200, nlohmann::json{{"status", "healthy"},
                                    {"audio_files_count", audio_files_count},
                                    {"active_jobs_size", active_jobs_size},
                                    {"memory_jobs_count", memory_jobs_count},
                                    {"message", "System is operational"}}};
    } catch (const std::exception& ex) {
        logging::error(
            "Health check error",
            {kv("error", ex.what())});
        return {200, nlohmann::json{{"status", "unhealthy"},
                                    {"audio_files_count", 0},
                                    {"active_jobs_size", 0},
                                    {"memory_jobs_count", 0},
                                    {"message", std::string("Error: ") + ex.what()},
                                    {"error", ex.what()}}};
    }
}

}

#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

namespace tts_queue {

struct Config {
    std::filesystem::path audio_dir;
    int max_concurrent = 4;
    int admission_factor = 2;
    int min_artifact_bytes = 100;
    int list_limit = 50;
    int preview_length = 100;
    std::string rest_api_host = "0.0.0.0";
    int rest_api_port = 8000;
    int cache_max_age_sec = 86400;
    std::string engine_url;
    double engine_timeout_sec = 60.0;
    std::optional<std::string> authorization_token;
    std::string default_voice = "en-US-AriaNeural";
    std::string log_level = "INFO";
    std::optional<std::string> log_filename;
    std::optional<std::filesystem::path> logs_dir;
    std::string log_name = "tts_queue";

    // ENGINE_TIMEOUT_SEC as a duration; fractional seconds are kept.
    std::chrono::milliseconds engine_timeout() const;

    static Config load();
    void validate() const;
};

}

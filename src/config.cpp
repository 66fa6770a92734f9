#include "tts_queue/config.hpp"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

#include "tts_queue/utils/text.hpp"

namespace tts_queue {

namespace {

std::string get_env_str(const char* name, const std::string& fallback) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : fallback;
}

std::optional<std::string> get_env_optional(const char* name) {
    const char* value = std::getenv(name);
    if (!value) {
        return std::nullopt;
    }
    std::string result(value);
    if (result.empty()) {
        return std::nullopt;
    }
    return result;
}

std::string get_env_required(const char* name) {
    const char* value = std::getenv(name);
    if (!value || std::string(value).empty()) {
        throw std::runtime_error(std::string(name) + " is required");
    }
    return std::string(value);
}

int get_env_int(const char* name, int fallback) {
    const char* value = std::getenv(name);
    if (!value) {
        return fallback;
    }
    try {
        return std::stoi(value);
    } catch (const std::exception&) {
        throw std::runtime_error(std::string(name) + " must be an integer");
    }
}

double get_env_double(const char* name, double fallback) {
    const char* value = std::getenv(name);
    if (!value) {
        return fallback;
    }
    try {
        return std::stod(value);
    } catch (const std::exception&) {
        throw std::runtime_error(std::string(name) + " must be a number");
    }
}

std::string timestamp_suffix() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::tm tm_value{};
#if defined(_WIN32)
    localtime_s(&tm_value, &time_t);
#else
    localtime_r(&time_t, &tm_value);
#endif
    std::ostringstream stream;
    stream << std::put_time(&tm_value, "%Y%m%d_%H%M%S");
    return stream.str();
}

void set_env_value(const std::string& key, const std::string& value) {
#if defined(_WIN32)
    _putenv_s(key.c_str(), value.c_str());
#else
    setenv(key.c_str(), value.c_str(), 1);
#endif
}

std::string strip_quotes(std::string value) {
    if (value.size() < 2) {
        return value;
    }
    if ((value.front() == '"' && value.back() == '"') ||
        (value.front() == '\'' && value.back() == '\'')) {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

void load_dotenv() {
    const std::filesystem::path dotenv_path = std::filesystem::current_path() / ".env";
    if (!std::filesystem::exists(dotenv_path)) {
        return;
    }

    std::ifstream stream(dotenv_path);
    if (!stream.is_open()) {
        return;
    }

    std::string line;
    while (std::getline(stream, line)) {
        line = utils::trim(line);
        if (line.empty() || line.rfind("#", 0) == 0) {
            continue;
        }

        if (line.rfind("export ", 0) == 0) {
            line = utils::trim(line.substr(7));
        }

        const auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            continue;
        }

        std::string key = utils::trim(line.substr(0, eq_pos));
        std::string value = utils::trim(line.substr(eq_pos + 1));
        if (key.empty()) {
            continue;
        }
        value = strip_quotes(value);
        set_env_value(key, value);
    }
}

}

Config Config::load() {
    load_dotenv();
    Config config;
    const auto cwd = std::filesystem::current_path();

    config.audio_dir = get_env_str("AUDIO_DIR", (cwd / "audio").string());
    config.max_concurrent = get_env_int("MAX_CONCURRENT", 4);
    config.admission_factor = get_env_int("ADMISSION_FACTOR", 2);
    config.min_artifact_bytes = get_env_int("MIN_ARTIFACT_BYTES", 100);
    config.list_limit = get_env_int("LIST_LIMIT", 50);
    config.preview_length = get_env_int("PREVIEW_LENGTH", 100);

    config.rest_api_host = get_env_str("REST_API_HOST", "0.0.0.0");
    config.rest_api_port = get_env_int("REST_API_PORT", 8000);
    config.cache_max_age_sec = get_env_int("CACHE_MAX_AGE_SEC", 86400);

    config.engine_url = get_env_required("ENGINE_URL");
    config.engine_timeout_sec = get_env_double("ENGINE_TIMEOUT_SEC", 60.0);
    config.authorization_token = get_env_optional("AUTHORIZATION_TOKEN");
    config.default_voice = get_env_str("DEFAULT_VOICE", "en-US-AriaNeural");

    config.log_level = get_env_str("LOG_LEVEL", "INFO");
    const auto log_filename_raw = get_env_str("LOG_FILENAME", "");
    if (!log_filename_raw.empty()) {
        const std::filesystem::path log_path(log_filename_raw);
        const auto stamped = log_path.stem().string() + "_" + timestamp_suffix() +
                             log_path.extension().string();
        if (const auto log_dir = get_env_optional("LOGS_DIR")) {
            config.logs_dir = std::filesystem::path(*log_dir);
            config.log_filename = (std::filesystem::path(*log_dir) / stamped).string();
        } else {
            config.log_filename = stamped;
        }
    }
    config.log_name = get_env_str("LOG_NAME", "tts_queue");

    return config;
}

std::chrono::milliseconds Config::engine_timeout() const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::duration<double>(engine_timeout_sec));
}

void Config::validate() const {
    if (audio_dir.empty()) {
        throw std::runtime_error("AUDIO_DIR is required");
    }
    if (engine_url.empty()) {
        throw std::runtime_error("ENGINE_URL is required");
    }
    if (max_concurrent <= 0) {
        throw std::runtime_error("MAX_CONCURRENT must be positive");
    }
    if (admission_factor <= 0) {
        throw std::runtime_error("ADMISSION_FACTOR must be positive");
    }
    if (min_artifact_bytes < 0) {
        throw std::runtime_error("MIN_ARTIFACT_BYTES must be zero or positive");
    }
    if (list_limit <= 0) {
        throw std::runtime_error("LIST_LIMIT must be positive");
    }
    if (preview_length <= 0) {
        throw std::runtime_error("PREVIEW_LENGTH must be positive");
    }
    if (rest_api_port <= 0) {
        throw std::runtime_error("REST_API_PORT must be positive");
    }
    if (cache_max_age_sec < 0) {
        throw std::runtime_error("CACHE_MAX_AGE_SEC must be zero or positive");
    }
    if (engine_timeout_sec <= 0.0) {
        throw std::runtime_error("ENGINE_TIMEOUT_SEC must be positive");
    }
    if (engine_timeout() < std::chrono::milliseconds(1)) {
        throw std::runtime_error("ENGINE_TIMEOUT_SEC must be at least one millisecond");
    }
    if (log_name.empty()) {
        throw std::runtime_error("LOG_NAME must not be empty");
    }
}

}

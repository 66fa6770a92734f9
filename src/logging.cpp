#include "tts_queue/logging.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <memory>
#include <mutex>
#include <vector>

#include "spdlog/logger.h"
#include "spdlog/sinks/basic_file_sink.h"
#include "spdlog/sinks/stdout_color_sinks.h"
#include "spdlog/spdlog.h"
#include "tts_queue/jobs/job.hpp"

namespace tts_queue::logging {

namespace {

std::mutex& logger_name_mutex() {
    static std::mutex mutex;
    return mutex;
}

std::string& logger_name() {
    static std::string name = "tts_queue";
    return name;
}

spdlog::level::level_enum parse_level(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::toupper(ch)); });
    if (value == "TRACE") return spdlog::level::trace;
    if (value == "DEBUG") return spdlog::level::debug;
    if (value == "WARN" || value == "WARNING") return spdlog::level::warn;
    if (value == "ERROR") return spdlog::level::err;
    if (value == "CRITICAL") return spdlog::level::critical;
    if (value == "OFF") return spdlog::level::off;
    return spdlog::level::info;
}

bool needs_quotes(const std::string& value) {
    return value.empty() || value.find_first_of(" \"=,") != std::string::npos;
}

std::shared_ptr<spdlog::logger> get_logger() {
    std::string name;
    {
        std::lock_guard<std::mutex> lock(logger_name_mutex());
        name = logger_name();
    }
    if (auto logger = spdlog::get(name)) {
        return logger;
    }
    return spdlog::default_logger();
}

}

KeyValue kv(const std::string& key, JobStatus status) {
    return {key, to_string(status)};
}

KeyValue kv(const std::string& key, std::chrono::duration<double> elapsed) {
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%.3fs", elapsed.count());
    return {key, buffer};
}

std::string format_kv(std::initializer_list<KeyValue> items) {
    std::string result;
    for (const auto& item : items) {
        if (!result.empty()) {
            result += ", ";
        }
        result += item.key;
        result += '=';
        if (!needs_quotes(item.value)) {
            result += item.value;
            continue;
        }
        result += '"';
        for (const char ch : item.value) {
            if (ch == '"' || ch == '\\') {
                result += '\\';
            }
            result += ch;
        }
        result += '"';
    }
    return result;
}

void log(spdlog::level::level_enum level,
         const std::string& message,
         std::initializer_list<KeyValue> items) {
    auto logger = get_logger();
    if (!logger || !logger->should_log(level)) {
        return;
    }
    const auto context = format_kv(items);
    if (context.empty()) {
        logger->log(level, message);
    } else {
        logger->log(level, message + " [" + context + "]");
    }
}

void init(const Config& config) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

    if (config.log_filename) {
        const std::filesystem::path log_path(*config.log_filename);
        if (!log_path.parent_path().empty()) {
            std::filesystem::create_directories(log_path.parent_path());
        }
        sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_path.string(),
                                                                            true));
    }

    auto logger = std::make_shared<spdlog::logger>(config.log_name, sinks.begin(), sinks.end());
    spdlog::drop(config.log_name);
    spdlog::register_logger(logger);
    spdlog::set_default_logger(logger);
    spdlog::set_level(parse_level(config.log_level));

    std::lock_guard<std::mutex> lock(logger_name_mutex());
    logger_name() = config.log_name;
}

}

#pragma once

#include <chrono>
#include <filesystem>
#include <initializer_list>
#include <sstream>
#include <string>

#include "tts_queue/config.hpp"
#include "spdlog/common.h"

namespace tts_queue {

enum class JobStatus;

namespace logging {

struct KeyValue {
    std::string key;
    std::string value;
};

template <typename T>
inline KeyValue kv(const std::string& key, const T& value) {
    std::ostringstream oss;
    oss << value;
    return {key, oss.str()};
}

// Lowercase wire name, the same string clients see.
KeyValue kv(const std::string& key, JobStatus status);

// Seconds with millisecond precision, e.g. "1.250s".
KeyValue kv(const std::string& key, std::chrono::duration<double> elapsed);

inline KeyValue kv(const std::string& key, const std::filesystem::path& path) {
    return {key, path.string()};
}

// Values that are empty or hold spaces, quotes or '=' are quoted so the
// line stays splittable on ", ".
std::string format_kv(std::initializer_list<KeyValue> items);

void init(const Config& config);
void log(spdlog::level::level_enum level,
         const std::string& message,
         std::initializer_list<KeyValue> items = {});

inline void debug(const std::string& message,
                  std::initializer_list<KeyValue> items = {}) {
    log(spdlog::level::debug, message, items);
}

inline void info(const std::string& message,
                 std::initializer_list<KeyValue> items = {}) {
    log(spdlog::level::info, message, items);
}

inline void warn(const std::string& message,
                 std::initializer_list<KeyValue> items = {}) {
    log(spdlog::level::warn, message, items);
}

inline void error(const std::string& message,
                  std::initializer_list<KeyValue> items = {}) {
    log(spdlog::level::err, message, items);
}

}

using logging::kv;

}

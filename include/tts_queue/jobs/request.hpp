#pragma once

#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

namespace tts_queue {

class ValidationError : public std::runtime_error {
public:
    explicit ValidationError(const std::string& message) : std::runtime_error(message) {}
};

// Immutable once accepted. pitch is a Hz offset, speed and volume are
// percent offsets, all relative to the voice defaults.
struct TtsRequest {
    std::string text;
    std::string voice;
    int pitch = 0;
    int speed = 0;
    int volume = 0;
};

constexpr int kPitchMin = -100;
constexpr int kPitchMax = 100;
constexpr int kSpeedMin = -50;
constexpr int kSpeedMax = 100;
constexpr int kVolumeMin = -100;
constexpr int kVolumeMax = 100;

// Throws ValidationError for an empty text, wrong field types or values
// out of range. The returned text is trimmed.
TtsRequest parse_tts_request(const nlohmann::json& body, const std::string& default_voice);

}

#include "tts_queue/jobs/request.hpp"

#include "tts_queue/utils/text.hpp"

namespace tts_queue {

namespace {

int read_bounded_int(const nlohmann::json& body, const char* field, int min_value, int max_value) {
    const auto it = body.find(field);
    if (it == body.end() || it->is_null()) {
        return 0;
    }
    if (!it->is_number_integer()) {
        throw ValidationError(std::string(field) + " must be an integer");
    }
    const auto value = it->get<long long>();
    if (value < min_value || value > max_value) {
        throw ValidationError(std::string(field) + " must be between " +
                              std::to_string(min_value) + " and " + std::to_string(max_value));
    }
    return static_cast<int>(value);
}

}

TtsRequest parse_tts_request(const nlohmann::json& body, const std::string& default_voice) {
    if (!body.is_object()) {
        throw ValidationError("request body must be a JSON object");
    }

    TtsRequest request;
    const auto text_it = body.find("text");
    if (text_it != body.end() && !text_it->is_null() && !text_it->is_string()) {
        throw ValidationError("text must be a string");
    }
    if (text_it != body.end() && text_it->is_string()) {
        request.text = utils::trim(text_it->get<std::string>());
    }
    if (request.text.empty()) {
        throw ValidationError("Text is required");
    }

    request.voice = default_voice;
    const auto voice_it = body.find("voice");
    if (voice_it != body.end() && !voice_it->is_null()) {
        if (!voice_it->is_string()) {
            throw ValidationError("voice must be a string");
        }
        auto voice = utils::trim(voice_it->get<std::string>());
        if (voice.empty()) {
            throw ValidationError("voice must not be empty");
        }
        request.voice = std::move(voice);
    }

    request.pitch = read_bounded_int(body, "pitch", kPitchMin, kPitchMax);
    request.speed = read_bounded_int(body, "speed", kSpeedMin, kSpeedMax);
    request.volume = read_bounded_int(body, "volume", kVolumeMin, kVolumeMax);
    return request;
}

}

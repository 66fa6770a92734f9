#include "tts_queue/engine/http_engine.hpp"

#include <utility>
#include <vector>

#include "tts_queue/logging.hpp"
#include "tts_queue/utils/http.hpp"

namespace tts_queue {

namespace {

std::string signed_offset(int value, const char* unit) {
    return (value >= 0 ? "+" : "") + std::to_string(value) + unit;
}

}

HttpSynthesisEngine::HttpSynthesisEngine(const std::string& engine_url,
                                         std::optional<std::string> authorization_token,
                                         BackendRequestOptions options)
    : client_(engine_url, std::move(authorization_token), options) {
    logging::info(
        "Synthesis engine configured",
        {kv("endpoint", client_.endpoint())});
}

std::string HttpSynthesisEngine::build_synthesis_query(const TtsRequest& request) {
    return utils::build_query({
        {"text", request.text},
        {"voice", request.voice},
        {"pitch", signed_offset(request.pitch, "Hz")},
        {"rate", signed_offset(request.speed, "%")},
        {"volume", signed_offset(request.volume, "%")},
    });
}

std::string HttpSynthesisEngine::synthesize(const TtsRequest& request) {
    auto audio = client_.get_binary("/synthesize", build_synthesis_query(request));
    if (audio.empty()) {
        throw SynthesisError("Synthesis engine returned no audio");
    }
    return audio;
}

}

#pragma once

#include <optional>
#include <string>

#include "tts_queue/backend/client.hpp"
#include "tts_queue/engine/synthesis_engine.hpp"

namespace tts_queue {

class HttpSynthesisEngine : public SynthesisEngine {
public:
    HttpSynthesisEngine(const std::string& engine_url,
                        std::optional<std::string> authorization_token,
                        BackendRequestOptions options);

    std::string synthesize(const TtsRequest& request) override;

    static std::string build_synthesis_query(const TtsRequest& request);

private:
    BackendClient client_;
};

}

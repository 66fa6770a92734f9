#pragma once

#include <stdexcept>
#include <string>

#include "tts_queue/jobs/request.hpp"

namespace tts_queue {

class SynthesisError : public std::runtime_error {
public:
    explicit SynthesisError(const std::string& message) : std::runtime_error(message) {}
};

// Blocking text-to-audio conversion. Called concurrently from every worker
// thread, so implementations must be thread-safe. Failures are reported by
// throwing.
class SynthesisEngine {
public:
    virtual ~SynthesisEngine() = default;

    virtual std::string synthesize(const TtsRequest& request) = 0;
};

}

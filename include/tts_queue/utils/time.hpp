#pragma once

#include <chrono>
#include <string>

namespace tts_queue::utils {

using Clock = std::chrono::system_clock;

// Local time, e.g. 2024-05-01T13:45:10.123456.
std::string to_iso8601(Clock::time_point time);

double to_epoch_seconds(Clock::time_point time);
Clock::time_point from_epoch_seconds(double seconds);

}

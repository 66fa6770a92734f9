#include "tts_queue/utils/time.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace tts_queue::utils {

std::string to_iso8601(Clock::time_point time) {
    const auto since_epoch = time.time_since_epoch();
    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(since_epoch);
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(since_epoch - seconds);
    if (micros.count() < 0) {
        seconds -= std::chrono::seconds(1);
        micros += std::chrono::seconds(1);
    }
    const std::time_t time_t = static_cast<std::time_t>(seconds.count());
    std::tm tm_value{};
#if defined(_WIN32)
    localtime_s(&tm_value, &time_t);
#else
    localtime_r(&time_t, &tm_value);
#endif
    std::ostringstream stream;
    stream << std::put_time(&tm_value, "%Y-%m-%dT%H:%M:%S") << '.'
           << std::setw(6) << std::setfill('0') << micros.count();
    return stream.str();
}

double to_epoch_seconds(Clock::time_point time) {
    return std::chrono::duration<double>(time.time_since_epoch()).count();
}

Clock::time_point from_epoch_seconds(double seconds) {
    return Clock::time_point(std::chrono::duration_cast<Clock::duration>(
        std::chrono::duration<double>(seconds)));
}

}

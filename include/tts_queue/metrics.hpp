#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace tts_queue {

class Metrics {
public:
    static Metrics& instance();

    void increment_request();
    void increment(const std::string& counter);
    uint64_t counter_value(const std::string& counter) const;
    void observe_synthesis_time(double seconds);
    void observe_response_summary(const std::string& route, double seconds);
    std::string render_prometheus() const;

private:
    struct SummarySeries {
        uint64_t count = 0;
        double sum = 0.0;
    };

    struct HistogramSeries {
        uint64_t count = 0;
        double sum = 0.0;
        std::vector<uint64_t> buckets;
    };

    Metrics();

    mutable std::mutex mutex_;
    uint64_t request_total_ = 0;
    std::map<std::string, uint64_t> counters_;
    std::unordered_map<std::string, SummarySeries> response_summaries_;
    HistogramSeries synthesis_histogram_;
    std::vector<double> histogram_bounds_;
};

namespace metric {

inline constexpr const char* kJobsSubmitted = "tts_jobs_submitted_total";
inline constexpr const char* kJobsRejected = "tts_jobs_rejected_total";
inline constexpr const char* kJobsCompleted = "tts_jobs_completed_total";
inline constexpr const char* kJobsFailed = "tts_jobs_failed_total";

}

}

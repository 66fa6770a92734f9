#include "tts_queue/metrics.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace tts_queue {

Metrics& Metrics::instance() {
    static Metrics metrics;
    return metrics;
}

Metrics::Metrics() {
    histogram_bounds_ = {0.1, 0.25, 0.5, 1.0, 2.5, 5.0, 10.0, 20.0, 30.0, 60.0, 120.0};
    synthesis_histogram_.buckets.assign(histogram_bounds_.size() + 1, 0);
    for (const auto* name : {metric::kJobsSubmitted, metric::kJobsRejected,
                             metric::kJobsCompleted, metric::kJobsFailed}) {
        counters_[name] = 0;
    }
}

void Metrics::increment_request() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++request_total_;
}

void Metrics::increment(const std::string& counter) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++counters_[counter];
}

uint64_t Metrics::counter_value(const std::string& counter) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = counters_.find(counter);
    return it == counters_.end() ? 0 : it->second;
}

void Metrics::observe_synthesis_time(double seconds) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& histogram = synthesis_histogram_;
    histogram.count += 1;
    histogram.sum += seconds;
    for (size_t i = 0; i < histogram_bounds_.size(); ++i) {
        if (seconds <= histogram_bounds_[i]) {
            histogram.buckets[i] += 1;
        }
    }
    histogram.buckets.back() += 1;
}

void Metrics::observe_response_summary(const std::string& route, double seconds) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& summary = response_summaries_[route];
    summary.count += 1;
    summary.sum += seconds;
}

std::string Metrics::render_prometheus() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::ostringstream out;
    out.setf(std::ios::fixed);
    out << std::setprecision(6);

    out << "# HELP http_requests_total Total number of HTTP requests\n";
    out << "# TYPE http_requests_total counter\n";
    out << "http_requests_total " << request_total_ << "\n";

    for (const auto& item : counters_) {
        out << "# TYPE " << item.first << " counter\n";
        out << item.first << " " << item.second << "\n";
    }

    out << "# HELP http_response_summary Time elapsed for response\n";
    out << "# TYPE http_response_summary summary\n";
    std::vector<std::string> routes;
    routes.reserve(response_summaries_.size());
    for (const auto& item : response_summaries_) {
        routes.push_back(item.first);
    }
    std::sort(routes.begin(), routes.end());
    for (const auto& route : routes) {
        const auto& series = response_summaries_.at(route);
        out << "http_response_summary_count{route=\"" << route << "\"} "
            << series.count << "\n";
        out << "http_response_summary_sum{route=\"" << route << "\"} "
            << series.sum << "\n";
    }

    out << "# HELP synthesis_duration_seconds Synthesis engine call duration\n";
    out << "# TYPE synthesis_duration_seconds histogram\n";
    const auto& series = synthesis_histogram_;
    for (size_t i = 0; i < histogram_bounds_.size(); ++i) {
        out << "synthesis_duration_seconds_bucket{le=\"" << histogram_bounds_[i] << "\"} "
            << series.buckets[i] << "\n";
    }
    out << "synthesis_duration_seconds_bucket{le=\"+Inf\"} " << series.buckets.back() << "\n";
    out << "synthesis_duration_seconds_count " << series.count << "\n";
    out << "synthesis_duration_seconds_sum " << series.sum << "\n";

    return out.str();
}

}

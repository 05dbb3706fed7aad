#include "voice_bridge/metrics.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace voice_bridge {

namespace {

template <typename Map>
std::vector<std::string> sorted_keys(const Map& map) {
    std::vector<std::string> keys;
    keys.reserve(map.size());
    for (const auto& item : map) {
        keys.push_back(item.first);
    }
    std::sort(keys.begin(), keys.end());
    return keys;
}

}

Metrics& Metrics::instance() {
    static Metrics metrics;
    return metrics;
}

Metrics::Metrics() {
    histogram_bounds_ = {0.05, 0.1, 0.25, 0.5, 0.75, 1.0, 2.5, 5.0, 10.0, 30.0};
}

void Metrics::session_started() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++sessions_total_;
    ++sessions_active_;
}

void Metrics::session_finished() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (sessions_active_ > 0) {
        --sessions_active_;
    }
}

void Metrics::count_frame(const std::string& direction) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++frames_[direction];
}

void Metrics::count_outbound_call(bool success) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (success) {
        ++outbound_calls_ok_;
    } else {
        ++outbound_calls_failed_;
    }
}

Metrics::HistogramSeries& Metrics::histogram_for(const std::string& method) {
    auto& series = upstream_histograms_[method];
    if (series.buckets.empty()) {
        series.buckets.assign(histogram_bounds_.size() + 1, 0);
    }
    return series;
}

void Metrics::observe_upstream_time(const std::string& method, double seconds) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& histogram = histogram_for(method);
    histogram.count += 1;
    histogram.sum += seconds;
    for (size_t i = 0; i < histogram_bounds_.size(); ++i) {
        if (seconds <= histogram_bounds_[i]) {
            histogram.buckets[i] += 1;
        }
    }
    histogram.buckets.back() += 1;
}

int64_t Metrics::active_sessions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_active_;
}

uint64_t Metrics::frames(const std::string& direction) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = frames_.find(direction);
    return it == frames_.end() ? 0 : it->second;
}

std::string Metrics::render_prometheus() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::ostringstream out;
    out.setf(std::ios::fixed);
    out << std::setprecision(6);

    out << "# HELP sessions_started_total Media stream sessions accepted\n";
    out << "# TYPE sessions_started_total counter\n";
    out << "sessions_started_total " << sessions_total_ << "\n";

    out << "# HELP sessions_active Media stream sessions currently open\n";
    out << "# TYPE sessions_active gauge\n";
    out << "sessions_active " << sessions_active_ << "\n";

    out << "# HELP outbound_calls_total Outbound call requests by result\n";
    out << "# TYPE outbound_calls_total counter\n";
    out << "outbound_calls_total{result=\"ok\"} " << outbound_calls_ok_ << "\n";
    out << "outbound_calls_total{result=\"failed\"} " << outbound_calls_failed_ << "\n";

    out << "# HELP frames_total Frames relayed by direction\n";
    out << "# TYPE frames_total counter\n";
    for (const auto& direction : sorted_keys(frames_)) {
        out << "frames_total{direction=\"" << direction << "\"} "
            << frames_.at(direction) << "\n";
    }

    out << "# HELP upstream_response_seconds Upstream provider response time\n";
    out << "# TYPE upstream_response_seconds histogram\n";
    for (const auto& method : sorted_keys(upstream_histograms_)) {
        const auto& series = upstream_histograms_.at(method);
        for (size_t i = 0; i < histogram_bounds_.size(); ++i) {
            out << "upstream_response_seconds_bucket{method=\"" << method
                << "\",le=\"" << histogram_bounds_[i] << "\"} "
                << series.buckets[i] << "\n";
        }
        out << "upstream_response_seconds_bucket{method=\"" << method
            << "\",le=\"+Inf\"} " << series.buckets.back() << "\n";
        out << "upstream_response_seconds_count{method=\"" << method << "\"} "
            << series.count << "\n";
        out << "upstream_response_seconds_sum{method=\"" << method << "\"} "
            << series.sum << "\n";
    }

    return out.str();
}

}

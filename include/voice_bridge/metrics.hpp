#pragma once

#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace voice_bridge {

class Metrics {
public:
    static Metrics& instance();

    void session_started();
    void session_finished();
    void count_frame(const std::string& direction);
    void count_outbound_call(bool success);
    void observe_upstream_time(const std::string& method, double seconds);
    int64_t active_sessions() const;
    uint64_t frames(const std::string& direction) const;
    std::string render_prometheus() const;

private:
    struct HistogramSeries {
        uint64_t count = 0;
        double sum = 0.0;
        std::vector<uint64_t> buckets;
    };

    Metrics();

    HistogramSeries& histogram_for(const std::string& method);

    mutable std::mutex mutex_;
    uint64_t sessions_total_ = 0;
    int64_t sessions_active_ = 0;
    uint64_t outbound_calls_ok_ = 0;
    uint64_t outbound_calls_failed_ = 0;
    std::unordered_map<std::string, uint64_t> frames_;
    std::unordered_map<std::string, HistogramSeries> upstream_histograms_;
    std::vector<double> histogram_bounds_;
};

}

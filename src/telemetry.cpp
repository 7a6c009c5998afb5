#include "telemetry.hpp"

std::shared_ptr<TelemetrySink> null_telemetry() {
    static std::shared_ptr<TelemetrySink> sink = std::make_shared<NullTelemetrySink>();
    return sink;
}

std::shared_ptr<LatencyTracker> LatencyRecorder::tracker_for(const std::string& operation) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = trackers_.find(operation);
    if (it == trackers_.end()) {
        it = trackers_.emplace(operation, std::make_shared<LatencyTracker>(window_)).first;
    }
    return it->second;
}

void LatencyRecorder::record(const std::string& operation, double duration_ms,
                             const std::string& trace_id,
                             const nlohmann::json& metadata) {
    tracker_for(operation)->record(duration_ms);

    if (log_events_ && log_enabled("DEBUG")) {
        nlohmann::json fields = nlohmann::json::object();
        if (!trace_id.empty()) fields["trace_id"] = trace_id;
        if (metadata.is_object() && !metadata.empty()) fields["meta"] = metadata;
        log_event(operation, duration_ms, fields);
    }
}

size_t LatencyRecorder::count(const std::string& operation) const {
    std::shared_ptr<LatencyTracker> tracker;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = trackers_.find(operation);
        if (it == trackers_.end()) return 0;
        tracker = it->second;
    }
    return tracker->total();
}

double LatencyRecorder::percentile(const std::string& operation, double p) const {
    std::shared_ptr<LatencyTracker> tracker;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = trackers_.find(operation);
        if (it == trackers_.end()) return 0.0;
        tracker = it->second;
    }
    return tracker->percentile(p);
}

nlohmann::json LatencyRecorder::summary() const {
    std::map<std::string, std::shared_ptr<LatencyTracker>> snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        snapshot = trackers_;
    }

    nlohmann::json out = nlohmann::json::object();
    for (const auto& [operation, tracker] : snapshot) {
        out[operation]["count"] = tracker->total();
        out[operation]["p50_ms"] = round_to(tracker->percentile(50.0), 3);
        out[operation]["p95_ms"] = round_to(tracker->percentile(95.0), 3);
        out[operation]["p99_ms"] = round_to(tracker->percentile(99.0), 3);
    }
    return out;
}

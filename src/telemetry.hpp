#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <nlohmann/json.hpp>
#include "util.hpp"

// Fire-and-forget sink for per-operation timings. Implementations must not throw.
class TelemetrySink {
public:
    virtual ~TelemetrySink() = default;
    virtual void record(const std::string& operation, double duration_ms,
                        const std::string& trace_id,
                        const nlohmann::json& metadata) = 0;
};

class NullTelemetrySink : public TelemetrySink {
public:
    void record(const std::string&, double, const std::string&, const nlohmann::json&) override {}
};

// Keeps a latency window per operation and writes one event line per record
class LatencyRecorder : public TelemetrySink {
public:
    explicit LatencyRecorder(size_t window = 1000, bool log_events = true)
        : window_(window), log_events_(log_events) {}

    void record(const std::string& operation, double duration_ms,
                const std::string& trace_id,
                const nlohmann::json& metadata) override;

    size_t count(const std::string& operation) const;
    double percentile(const std::string& operation, double p) const;

    // {"<operation>": {"count", "p50_ms", "p95_ms", "p99_ms"}, ...}
    nlohmann::json summary() const;

private:
    std::shared_ptr<LatencyTracker> tracker_for(const std::string& operation);

    size_t window_;
    bool log_events_;
    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<LatencyTracker>> trackers_;
};

// Shared default for components constructed without a sink
std::shared_ptr<TelemetrySink> null_telemetry();

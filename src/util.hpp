#pragma once

#include <chrono>
#include <deque>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

// Steady-clock stopwatch
class Timer {
public:
    Timer() : start_(std::chrono::steady_clock::now()) {}

    double elapsed_ms() const;
    double elapsed_sec() const { return elapsed_ms() / 1000.0; }
    void reset() { start_ = std::chrono::steady_clock::now(); }

private:
    std::chrono::steady_clock::time_point start_;
};

// Latency samples in a fixed-size ring; percentiles cover the ring only
class LatencyTracker {
public:
    explicit LatencyTracker(size_t window = 1000);

    void record(double latency_ms);

    // Nearest rank; 0 with no samples
    double percentile(double p) const;

    // Every sample ever recorded, including those rotated out
    size_t total() const;

private:
    mutable std::mutex mutex_;
    std::vector<double> ring_;
    size_t next_ = 0;
    size_t filled_ = 0;
    size_t total_ = 0;
};

// Events per second over a sliding window
class RateTracker {
public:
    explicit RateTracker(std::chrono::seconds window = std::chrono::seconds(60)) : window_(window) {}

    void record();
    double per_second() const;

private:
    using Clock = std::chrono::steady_clock;

    std::chrono::seconds window_;
    mutable std::mutex mutex_;
    mutable std::deque<Clock::time_point> events_;
};

// Seconds since the Unix epoch, with sub-second precision
double unix_time_now();

// Rounds for display (search scores go out with 4 decimals)
double round_to(double value, int decimals);

// Lowercases ASCII letters only
std::string to_lower_ascii(const std::string& text);

// Minimum level is process-wide: DEBUG < INFO < WARN < ERROR
void set_log_level(const std::string& level);
std::string get_log_level();
bool log_enabled(const std::string& level);

void log(const std::string& level, const std::string& message);

// Structured event line for one engine operation
void log_event(const std::string& operation, double latency_ms,
               const nlohmann::json& fields = nlohmann::json::object());

#define LOG_INFO(msg) log("INFO", msg)
#define LOG_WARN(msg) log("WARN", msg)
#define LOG_ERROR(msg) log("ERROR", msg)
#define LOG_DEBUG(msg) log("DEBUG", msg)

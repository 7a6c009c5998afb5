#include "util.hpp"
#include <algorithm>
#include <atomic>
#include <cmath>
#include <cctype>
#include <ctime>
#include <iostream>
#include <iomanip>
#include <sstream>

namespace {

int level_rank(const std::string& level) {
    if (level == "DEBUG") return 0;
    if (level == "INFO") return 1;
    if (level == "WARN") return 2;
    if (level == "ERROR") return 3;
    // EVENT and anything unknown print at INFO
    return 1;
}

std::atomic<int> min_level{1};
std::mutex output_mutex;

}

double Timer::elapsed_ms() const {
    auto elapsed = std::chrono::steady_clock::now() - start_;
    return std::chrono::duration_cast<std::chrono::microseconds>(elapsed).count() / 1000.0;
}

LatencyTracker::LatencyTracker(size_t window) : ring_(std::max<size_t>(window, 1)) {}

void LatencyTracker::record(double latency_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    ring_[next_] = latency_ms;
    next_ = (next_ + 1) % ring_.size();
    filled_ = std::min(filled_ + 1, ring_.size());
    total_++;
}

double LatencyTracker::percentile(double p) const {
    std::vector<double> sorted;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (filled_ == 0) return 0.0;
        sorted.assign(ring_.begin(), ring_.begin() + static_cast<std::ptrdiff_t>(filled_));
    }
    std::sort(sorted.begin(), sorted.end());

    double rank = std::ceil(p / 100.0 * static_cast<double>(sorted.size()));
    size_t idx = rank < 1.0 ? 0 : static_cast<size_t>(rank) - 1;
    return sorted[std::min(idx, sorted.size() - 1)];
}

size_t LatencyTracker::total() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return total_;
}

void RateTracker::record() {
    auto now = Clock::now();
    std::lock_guard<std::mutex> lock(mutex_);
    while (!events_.empty() && events_.front() < now - window_) {
        events_.pop_front();
    }
    events_.push_back(now);
}

double RateTracker::per_second() const {
    auto now = Clock::now();
    std::lock_guard<std::mutex> lock(mutex_);
    while (!events_.empty() && events_.front() < now - window_) {
        events_.pop_front();
    }
    if (events_.empty()) return 0.0;

    // Until a full window has passed, divide by the time actually covered
    double span = std::chrono::duration<double>(now - events_.front()).count();
    double window = std::chrono::duration<double>(window_).count();
    double covered = std::min(window, span);
    return covered > 0.0 ? static_cast<double>(events_.size()) / covered : 0.0;
}

double unix_time_now() {
    auto now = std::chrono::system_clock::now();
    return std::chrono::duration<double>(now.time_since_epoch()).count();
}

double round_to(double value, int decimals) {
    double scale = std::pow(10.0, decimals);
    return std::round(value * scale) / scale;
}

std::string to_lower_ascii(const std::string& text) {
    std::string out = text;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

void set_log_level(const std::string& level) {
    std::string upper = level;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper == "WARNING") upper = "WARN";
    min_level.store(level_rank(upper));
}

std::string get_log_level() {
    switch (min_level.load()) {
        case 0: return "DEBUG";
        case 2: return "WARN";
        case 3: return "ERROR";
        default: return "INFO";
    }
}

bool log_enabled(const std::string& level) {
    return level_rank(level) >= min_level.load();
}

void log(const std::string& level, const std::string& message) {
    if (!log_enabled(level)) return;

    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm_buf{};
    localtime_r(&time_t, &tm_buf);

    std::stringstream ss;
    ss << "[" << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    ss << "." << std::setfill('0') << std::setw(3) << ms.count() << "]";
    ss << " [" << level << "] " << message;

    std::lock_guard<std::mutex> lock(output_mutex);
    std::cout << ss.str() << std::endl;
}

void log_event(const std::string& operation, double latency_ms, const nlohmann::json& fields) {
    nlohmann::json line = nlohmann::json::object();
    line["op"] = operation;
    line["lat_ms"] = round_to(latency_ms, 2);
    if (fields.is_object()) {
        for (auto it = fields.begin(); it != fields.end(); ++it) {
            line[it.key()] = it.value();
        }
    }
    log("EVENT", line.dump());
}

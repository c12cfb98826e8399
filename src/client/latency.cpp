/*
 * ChatRelay - message latency measurement implementation
 */

#include "latency.hpp"

#include <algorithm>
#include <chrono>
#include <iomanip>
#include <sstream>

namespace chatrelay {

double unix_time_seconds() {
    auto now = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration_cast<std::chrono::duration<double>>(now).count();
}

double latency_seconds(double sent_at, double received_at) {
    return std::max(0.0, received_at - sent_at);
}

void LatencyStats::record(double seconds) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (count_ == 0) {
        min_ = seconds;
        max_ = seconds;
    } else {
        min_ = std::min(min_, seconds);
        max_ = std::max(max_, seconds);
    }
    total_ += seconds;
    ++count_;
}

std::size_t LatencyStats::count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return count_;
}

double LatencyStats::average_ms() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return count_ == 0 ? 0.0 : total_ / static_cast<double>(count_) * 1000.0;
}

double LatencyStats::min_ms() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return min_ * 1000.0;
}

double LatencyStats::max_ms() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return max_ * 1000.0;
}

std::string LatencyStats::summary() const {
    if (count() == 0) {
        return "no samples";
    }
    std::ostringstream out;
    out << std::fixed << std::setprecision(2) << "Avg: " << average_ms() << "ms, Min: " << min_ms()
        << "ms, Max: " << max_ms() << "ms";
    return out.str();
}

} // namespace chatrelay

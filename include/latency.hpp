/*
 * ChatRelay - message latency measurement
 */

#pragma once

#include <cstddef>
#include <mutex>
#include <string>

namespace chatrelay {

// Wall clock seconds since the Unix epoch, the unit carried in message timestamps.
double unix_time_seconds();

// Time between a sender's timestamp and its arrival. Clock skew between hosts
// can make the difference negative; that reads as zero.
double latency_seconds(double sent_at, double received_at);

// Running count, mean, minimum and maximum of observed latencies.
class LatencyStats {
public:
    void record(double seconds);

    std::size_t count() const;
    double average_ms() const;
    double min_ms() const;
    double max_ms() const;

    // "Avg: 1.25ms, Min: 0.80ms, Max: 2.10ms", or "no samples".
    std::string summary() const;

private:
    mutable std::mutex mutex_;
    std::size_t count_ = 0;
    double total_ = 0.0;
    double min_ = 0.0;
    double max_ = 0.0;
};

} // namespace chatrelay

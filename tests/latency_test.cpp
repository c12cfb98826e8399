/*
 * ChatRelay - latency measurement tests
 */

#include <cmath>
#include <string>
#include <thread>
#include <vector>

#include "latency.hpp"
#include "test_support.hpp"

using namespace chatrelay;

namespace {
bool near(double a, double b) {
    return std::fabs(a - b) < 1e-6;
}
} // namespace

int main() {
    LatencyStats stats;
    if (stats.count() != 0 || stats.average_ms() != 0.0 || stats.summary() != "no samples") {
        FAIL();
    }

    stats.record(0.002);
    stats.record(0.0005);
    stats.record(0.0035);
    if (stats.count() != 3 || !near(stats.average_ms(), 2.0) || !near(stats.min_ms(), 0.5) ||
        !near(stats.max_ms(), 3.5)) {
        FAIL();
    }
    if (stats.summary() != "Avg: 2.00ms, Min: 0.50ms, Max: 3.50ms") {
        FAIL();
    }

    // Skewed clocks never produce negative latency.
    if (latency_seconds(100.0, 99.5) != 0.0 || !near(latency_seconds(100.0, 100.25), 0.25)) {
        FAIL();
    }

    // Message timestamps are Unix seconds.
    const double now = unix_time_seconds();
    if (now < 1.6e9 || latency_seconds(now, unix_time_seconds()) > 5.0) {
        FAIL();
    }

    // Concurrent receivers share one accumulator.
    LatencyStats shared;
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&shared] {
            for (int i = 0; i < 250; ++i) {
                shared.record(0.001);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    if (shared.count() != 1000 || !near(shared.average_ms(), 1.0)) {
        FAIL();
    }
    return 0;
}

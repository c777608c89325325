#pragma once

#include <string>
#include <vector>
#include <map>
#include <memory>
#include <mutex>
#include <atomic>
#include "common/types.hpp"

namespace arbexec {

// Names used by the engine and the server
namespace metric {
    inline constexpr const char* REQUESTS_TOTAL = "requests_total";
    inline constexpr const char* REQUESTS_SUCCEEDED = "requests_succeeded";
    inline constexpr const char* REQUESTS_FAILED = "requests_failed";
    inline constexpr const char* DECODE_ERRORS = "decode_errors";
    inline constexpr const char* CONNECTIONS_ACCEPTED = "connections_accepted";
    inline constexpr const char* CONNECTIONS_REJECTED = "connections_rejected";
    inline constexpr const char* EXECUTION_LATENCY = "execution_latency";
}

/**
 * Sliding window over the most recent latency samples. Once the window is
 * full each new sample replaces the oldest one; count() keeps the total.
 */
class LatencyHistogram {
public:
    struct Snapshot {
        int64_t count{0};
        Duration p50{Duration::zero()};
        Duration p99{Duration::zero()};
        Duration max{Duration::zero()};
    };

    explicit LatencyHistogram(size_t window = 4096);

    void record(Duration d);

    // Percentiles over the current window, zero when empty
    Snapshot snapshot() const;

    int64_t count() const { return count_.load(); }
    void reset();

private:
    size_t window_;
    std::atomic<int64_t> count_{0};

    mutable std::mutex mutex_;
    std::vector<int64_t> window_ns_;
    size_t oldest_{0};
};

class Counter {
public:
    void increment(int64_t delta = 1) { value_ += delta; }
    int64_t value() const { return value_.load(); }
    void reset() { value_ = 0; }

private:
    std::atomic<int64_t> value_{0};
};

/**
 * Process-wide request and connection counters. Metrics are created on
 * first use and live until exit, so returned references stay valid.
 */
class MetricsRegistry {
public:
    static MetricsRegistry& instance();

    Counter& counter(const std::string& name);
    LatencyHistogram& histogram(const std::string& name);

    // {"counters": {...}, "histograms": {name: {count, p50_us, p99_us, max_us}}}
    std::string to_json() const;

    // Zeroes every metric without invalidating references
    void reset_all();

private:
    MetricsRegistry() = default;

    mutable std::mutex mutex_;
    std::map<std::string, std::unique_ptr<Counter>> counters_;
    std::map<std::string, std::unique_ptr<LatencyHistogram>> histograms_;
};

#define METRIC_COUNTER(name) ::arbexec::MetricsRegistry::instance().counter(name)
#define METRIC_HISTOGRAM(name) ::arbexec::MetricsRegistry::instance().histogram(name)

} // namespace arbexec

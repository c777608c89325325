#pragma once

#include <string>
#include <chrono>
#include <optional>
#include "common/types.hpp"

namespace arbexec {
namespace time_utils {

/**
 * Human-readable duration for logs ("850ns", "12us", "3ms", "1.25s").
 */
std::string format_duration(Duration d);

/**
 * Wire form of ArbitrageResponse::execution_time: whole milliseconds
 * followed by "ms".
 */
std::string format_execution_time(int64_t ms);

/**
 * Measures one request from construction until stop().
 */
class LatencyTimer {
public:
    LatencyTimer() : start_(now()) {}

    // Freezes elapsed(); later calls are no-ops
    void stop();

    Duration elapsed() const;
    int64_t elapsed_ms() const;

private:
    Timestamp start_;
    std::optional<Timestamp> stopped_at_;
};

/**
 * Per-request time budget. A budget of zero never expires.
 */
class Deadline {
public:
    explicit Deadline(std::chrono::milliseconds budget) : start_(now()), budget_(budget) {}

    bool enabled() const { return budget_.count() > 0; }
    bool expired() const;

    int64_t budget_ms() const { return budget_.count(); }

private:
    Timestamp start_;
    std::chrono::milliseconds budget_;
};

} // namespace time_utils
} // namespace arbexec

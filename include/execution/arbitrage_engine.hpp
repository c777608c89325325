#pragma once

#include <memory>
#include <atomic>
#include "common/types.hpp"
#include "config/config.hpp"
#include "protocol/messages.hpp"
#include "market_data/rate_source.hpp"
#include "strategy/execution_strategy.hpp"
#include "utils/time_utils.hpp"

namespace arbexec {

/**
 * Runs one arbitrage request end-to-end: fetch both funding rates,
 * evaluate the strategy, build the response.
 *
 * execute() never throws. Every failure becomes an error response with
 * execution_time "0ms"; only successful requests are timed.
 *
 * The engine holds the config by reference; it must outlive the engine
 * and is never mutated after startup, so concurrent execute() calls
 * from connection threads need no locking.
 */
class ArbitrageEngine {
public:
    ArbitrageEngine(
        const Config& config,
        std::shared_ptr<RateSource> rate_source,
        std::shared_ptr<ExecutionStrategy> strategy
    );

    ArbitrageResponse execute(const ArbitrageRequest& request);

    // Stats
    int64_t requests_executed() const { return requests_executed_.load(); }
    int64_t requests_succeeded() const { return requests_succeeded_.load(); }
    int64_t requests_failed() const { return requests_failed_.load(); }

private:
    const Config& config_;
    std::shared_ptr<RateSource> rate_source_;
    std::shared_ptr<ExecutionStrategy> strategy_;

    std::atomic<int64_t> requests_executed_{0};
    std::atomic<int64_t> requests_succeeded_{0};
    std::atomic<int64_t> requests_failed_{0};

    struct RatePair {
        Rate primary{0.0};
        Rate secondary{0.0};
    };

    // Throws on any failure; execute() converts
    double run_pipeline(const ArbitrageRequest& request, const time_utils::Deadline& deadline);
    RatePair fetch_rates(const ArbitrageRequest& request);
    static void check_deadline(const time_utils::Deadline& deadline);

    ArbitrageResponse fail(const std::string& message);
};

} // namespace arbexec

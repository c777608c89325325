#include "execution/arbitrage_engine.hpp"
#include "common/errors.hpp"
#include "utils/metrics.hpp"
#include <future>
#include <spdlog/spdlog.h>

namespace arbexec {

ArbitrageEngine::ArbitrageEngine(
    const Config& config,
    std::shared_ptr<RateSource> rate_source,
    std::shared_ptr<ExecutionStrategy> strategy)
    : config_(config)
    , rate_source_(std::move(rate_source))
    , strategy_(std::move(strategy))
{
    spdlog::info("ArbitrageEngine ready: strategy={} gas_price={} gas_limit={}",
                 strategy_->name(), config_.gas.current_gas_price, config_.gas.max_gas_limit);
}

ArbitrageResponse ArbitrageEngine::execute(const ArbitrageRequest& request) {
    requests_executed_++;
    METRIC_COUNTER(metric::REQUESTS_TOTAL).increment();

    spdlog::info("Executing {}: {} {} vs {} amount={} priority={}",
                 request.strategy_id, request.symbol, request.primary_exchange,
                 request.secondary_exchange, request.amount, request.priority);

    time_utils::LatencyTimer timer;
    time_utils::Deadline deadline(std::chrono::milliseconds(config_.engine.request_timeout_ms));
    double profit = 0.0;

    try {
        profit = run_pipeline(request, deadline);
    } catch (const BelowThresholdError& e) {
        // Expected outcome, not a fault
        spdlog::debug("{}: {}", request.strategy_id, e.what());
        return fail(e.what());
    } catch (const ArbitrageError& e) {
        spdlog::warn("{} failed ({}): {}", request.strategy_id,
                     error_kind_to_string(e.kind()), e.what());
        return fail(e.what());
    } catch (const std::exception& e) {
        spdlog::error("{} failed unexpectedly: {}", request.strategy_id, e.what());
        return fail(e.what());
    }

    timer.stop();
    requests_succeeded_++;
    METRIC_COUNTER(metric::REQUESTS_SUCCEEDED).increment();
    METRIC_HISTOGRAM(metric::EXECUTION_LATENCY).record(timer.elapsed());

    spdlog::info("{} succeeded: profit={:.4f} in {}", request.strategy_id, profit,
                 time_utils::format_duration(timer.elapsed()));

    return ArbitrageResponse::success(profit, timer.elapsed_ms(), config_.gas.current_gas_price);
}

double ArbitrageEngine::run_pipeline(const ArbitrageRequest& request,
                                     const time_utils::Deadline& deadline) {
    RatePair rates = fetch_rates(request);
    spdlog::debug("{} rates: primary={:.6f} secondary={:.6f}",
                  request.strategy_id, rates.primary, rates.secondary);
    check_deadline(deadline);

    double profit = strategy_->evaluate(rates.primary, rates.secondary, request.amount);
    check_deadline(deadline);

    return profit;
}

ArbitrageEngine::RatePair ArbitrageEngine::fetch_rates(const ArbitrageRequest& request) {
    for (const auto* exchange : {&request.primary_exchange, &request.secondary_exchange}) {
        if (!rate_source_->supports(*exchange)) {
            throw UnsupportedExchangeError(*exchange);
        }
    }

    RatePair rates;

    if (config_.engine.concurrent_rate_fetch) {
        auto secondary = std::async(std::launch::async, [this, &request]() {
            return rate_source_->get_rate(request.secondary_exchange, request.symbol);
        });
        // If the primary fetch throws, the future's destructor waits for the secondary
        rates.primary = rate_source_->get_rate(request.primary_exchange, request.symbol);
        rates.secondary = secondary.get();
        return rates;
    }

    rates.primary = rate_source_->get_rate(request.primary_exchange, request.symbol);
    rates.secondary = rate_source_->get_rate(request.secondary_exchange, request.symbol);
    return rates;
}

void ArbitrageEngine::check_deadline(const time_utils::Deadline& deadline) {
    if (deadline.expired()) {
        throw RequestTimeoutError(deadline.budget_ms());
    }
}

ArbitrageResponse ArbitrageEngine::fail(const std::string& message) {
    requests_failed_++;
    METRIC_COUNTER(metric::REQUESTS_FAILED).increment();
    return ArbitrageResponse::failure(message);
}

} // namespace arbexec

#include "strategy/execution_strategy.hpp"
#include "common/errors.hpp"
#include <cmath>
#include <thread>
#include <spdlog/spdlog.h>

namespace arbexec {

ExecutionStrategy::ExecutionStrategy(const std::string& name)
    : name_(name)
{
}

SimulatedExecutionStrategy::SimulatedExecutionStrategy(const StrategyConfig& config,
                                                       std::shared_ptr<RandomSource> random)
    : ExecutionStrategy("SimulatedFlashLoan")
    , config_(config)
    , random_(std::move(random))
{
    spdlog::info("{} strategy: threshold={:.6f} p_success={:.2f} efficiency={:.2f}",
                 name_, config_.rate_diff_threshold, config_.success_probability,
                 config_.efficiency_factor);
}

bool SimulatedExecutionStrategy::above_threshold(Rate diff) const {
    return std::abs(diff) >= config_.rate_diff_threshold;
}

double SimulatedExecutionStrategy::expected_profit(Rate diff, Notional amount) const {
    return amount * std::abs(diff);
}

double SimulatedExecutionStrategy::evaluate(Rate rate_a, Rate rate_b, Notional amount) {
    evaluations_++;

    Rate diff = rate_a - rate_b;
    if (!above_threshold(diff)) {
        throw BelowThresholdError(diff, config_.rate_diff_threshold);
    }

    return simulate_execution(expected_profit(diff, amount));
}

double SimulatedExecutionStrategy::simulate_execution(double expected) {
    executions_attempted_++;

    if (config_.execution_latency_us > 0) {
        std::this_thread::sleep_for(std::chrono::microseconds(config_.execution_latency_us));
    }

    if (random_->next_unit() >= config_.success_probability) {
        throw ExecutionFailedError();
    }

    executions_succeeded_++;
    return expected * config_.efficiency_factor;
}

} // namespace arbexec

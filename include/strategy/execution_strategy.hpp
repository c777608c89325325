#pragma once

#include <string>
#include <memory>
#include <atomic>
#include "common/types.hpp"
#include "config/config.hpp"
#include "utils/random_source.hpp"

namespace arbexec {

/**
 * Base class for profitability strategies.
 * evaluate() returns the realized profit or throws BelowThresholdError /
 * ExecutionFailedError. Implementations are shared across connection
 * threads.
 */
class ExecutionStrategy {
public:
    explicit ExecutionStrategy(const std::string& name);
    virtual ~ExecutionStrategy() = default;

    virtual double evaluate(Rate rate_a, Rate rate_b, Notional amount) = 0;

    const std::string& name() const { return name_; }

    // Stats
    int64_t evaluations() const { return evaluations_.load(); }
    int64_t executions_attempted() const { return executions_attempted_.load(); }
    int64_t executions_succeeded() const { return executions_succeeded_.load(); }

protected:
    std::string name_;
    std::atomic<int64_t> evaluations_{0};
    std::atomic<int64_t> executions_attempted_{0};
    std::atomic<int64_t> executions_succeeded_{0};
};

/**
 * Funding-rate spread capture with a simulated execution step.
 *
 *   diff     = rate_a - rate_b
 *   |diff| < threshold       -> BelowThresholdError, nothing executed
 *   expected = amount * |diff|
 *   u < success_probability  -> expected * efficiency_factor
 *   otherwise                -> ExecutionFailedError
 */
class SimulatedExecutionStrategy : public ExecutionStrategy {
public:
    SimulatedExecutionStrategy(const StrategyConfig& config, std::shared_ptr<RandomSource> random);

    double evaluate(Rate rate_a, Rate rate_b, Notional amount) override;

    bool above_threshold(Rate diff) const;
    double expected_profit(Rate diff, Notional amount) const;

    const StrategyConfig& config() const { return config_; }

private:
    StrategyConfig config_;
    std::shared_ptr<RandomSource> random_;

    double simulate_execution(double expected);
};

} // namespace arbexec

#pragma once

#include <string>
#include <memory>
#include "common/types.hpp"
#include "config/config.hpp"
#include "utils/random_source.hpp"

namespace arbexec {

/**
 * Funding-rate lookup for one exchange/symbol pair.
 * Implementations throw UnsupportedExchangeError for ids they don't know
 * and must be safe to call from several connection threads at once.
 */
class RateSource {
public:
    virtual ~RateSource() = default;

    virtual Rate get_rate(const std::string& exchange_id, const std::string& symbol) = 0;
    virtual bool supports(const std::string& exchange_id) const = 0;
};

/**
 * Synthetic feed over the configured exchange registry.
 * Each rate is base_rate + U[0,1) * rate_jitter for the exchange;
 * the symbol does not influence the value.
 */
class SimulatedRateSource : public RateSource {
public:
    SimulatedRateSource(const ExchangeRegistry& registry, std::shared_ptr<RandomSource> random);

    Rate get_rate(const std::string& exchange_id, const std::string& symbol) override;
    bool supports(const std::string& exchange_id) const override;

    const ExchangeConnector& connector(const std::string& exchange_id) const;

private:
    const ExchangeRegistry& registry_;
    std::shared_ptr<RandomSource> random_;
};

} // namespace arbexec

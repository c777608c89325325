#include "market_data/rate_source.hpp"
#include "common/errors.hpp"
#include <spdlog/spdlog.h>

namespace arbexec {

SimulatedRateSource::SimulatedRateSource(const ExchangeRegistry& registry,
                                         std::shared_ptr<RandomSource> random)
    : registry_(registry)
    , random_(std::move(random))
{
    spdlog::info("SimulatedRateSource initialized with {} exchanges", registry_.size());
}

Rate SimulatedRateSource::get_rate(const std::string& exchange_id, const std::string& symbol) {
    const auto& conn = connector(exchange_id);
    Rate rate = conn.base_rate + random_->next_unit() * conn.rate_jitter;
    spdlog::debug("Funding rate {} {}: {:.6f}", exchange_id, symbol, rate);
    return rate;
}

bool SimulatedRateSource::supports(const std::string& exchange_id) const {
    return registry_.count(exchange_id) > 0;
}

const ExchangeConnector& SimulatedRateSource::connector(const std::string& exchange_id) const {
    auto it = registry_.find(exchange_id);
    if (it == registry_.end()) {
        throw UnsupportedExchangeError(exchange_id);
    }
    return it->second;
}

} // namespace arbexec

#pragma once

#include <map>
#include <mutex>
#include <vector>
#include <atomic>
#include "common/errors.hpp"
#include "market_data/rate_source.hpp"
#include "utils/random_source.hpp"

namespace arbexec {
namespace fakes {

// Rates pinned per exchange; unknown ids fail like the real registry
class FixedRateSource : public RateSource {
public:
    explicit FixedRateSource(std::map<std::string, Rate> rates) : rates_(std::move(rates)) {}

    Rate get_rate(const std::string& exchange_id, const std::string& /*symbol*/) override {
        calls_++;
        auto it = rates_.find(exchange_id);
        if (it == rates_.end()) {
            throw UnsupportedExchangeError(exchange_id);
        }
        return it->second;
    }

    bool supports(const std::string& exchange_id) const override {
        return rates_.count(exchange_id) > 0;
    }

    int calls() const { return calls_.load(); }

private:
    std::map<std::string, Rate> rates_;
    std::atomic<int> calls_{0};
};

// Replays a script of draws, repeating the last one when exhausted
class ScriptedRandomSource : public RandomSource {
public:
    explicit ScriptedRandomSource(std::vector<double> draws) : draws_(std::move(draws)) {}

    static std::shared_ptr<ScriptedRandomSource> always(double value) {
        return std::make_shared<ScriptedRandomSource>(std::vector<double>{value});
    }

    double next_unit() override {
        std::lock_guard<std::mutex> lock(mutex_);
        double value = draws_[std::min(index_, draws_.size() - 1)];
        index_++;
        return value;
    }

private:
    std::mutex mutex_;
    std::vector<double> draws_;
    size_t index_{0};
};

// Draws that force the simulated execution outcome
constexpr double FORCE_SUCCESS = 0.0;
constexpr double FORCE_FAILURE = 0.999;

} // namespace fakes
} // namespace arbexec

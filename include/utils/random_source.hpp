#pragma once

#include <mutex>
#include <random>
#include <cstdint>

namespace arbexec {

/**
 * Uniform [0, 1) draws. Injected wherever the engine simulates something,
 * so tests can script the outcome.
 */
class RandomSource {
public:
    virtual ~RandomSource() = default;
    virtual double next_unit() = 0;
};

/**
 * Thread-safe Mersenne Twister. Shared by all connection handlers.
 */
class Mt19937RandomSource : public RandomSource {
public:
    Mt19937RandomSource();
    explicit Mt19937RandomSource(uint64_t seed);

    double next_unit() override;

private:
    std::mutex mutex_;
    std::mt19937_64 gen_;
    std::uniform_real_distribution<double> dist_{0.0, 1.0};
};

} // namespace arbexec

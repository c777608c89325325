#include "utils/random_source.hpp"

namespace arbexec {

Mt19937RandomSource::Mt19937RandomSource()
    : gen_(std::random_device{}())
{
}

Mt19937RandomSource::Mt19937RandomSource(uint64_t seed)
    : gen_(seed)
{
}

double Mt19937RandomSource::next_unit() {
    std::lock_guard<std::mutex> lock(mutex_);
    return dist_(gen_);
}

} // namespace arbexec

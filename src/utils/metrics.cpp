#include "utils/metrics.hpp"
#include <algorithm>
#include <nlohmann/json.hpp>

namespace arbexec {

LatencyHistogram::LatencyHistogram(size_t window)
    : window_(std::max<size_t>(window, 1))
{
    window_ns_.reserve(window_);
}

void LatencyHistogram::record(Duration d) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (window_ns_.size() < window_) {
        window_ns_.push_back(d.count());
    } else {
        window_ns_[oldest_] = d.count();
        oldest_ = (oldest_ + 1) % window_;
    }
    count_++;
}

LatencyHistogram::Snapshot LatencyHistogram::snapshot() const {
    std::vector<int64_t> sorted;
    Snapshot snap;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sorted = window_ns_;
        snap.count = count_.load();
    }
    if (sorted.empty()) {
        return snap;
    }

    std::sort(sorted.begin(), sorted.end());
    auto at = [&sorted](double p) {
        return Duration(sorted[static_cast<size_t>(p * static_cast<double>(sorted.size() - 1))]);
    };
    snap.p50 = at(0.50);
    snap.p99 = at(0.99);
    snap.max = Duration(sorted.back());
    return snap;
}

void LatencyHistogram::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    window_ns_.clear();
    oldest_ = 0;
    count_ = 0;
}

MetricsRegistry& MetricsRegistry::instance() {
    static MetricsRegistry registry;
    return registry;
}

Counter& MetricsRegistry::counter(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& slot = counters_[name];
    if (!slot) {
        slot = std::make_unique<Counter>();
    }
    return *slot;
}

LatencyHistogram& MetricsRegistry::histogram(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& slot = histograms_[name];
    if (!slot) {
        slot = std::make_unique<LatencyHistogram>();
    }
    return *slot;
}

std::string MetricsRegistry::to_json() const {
    using std::chrono::microseconds;
    using std::chrono::duration_cast;

    std::lock_guard<std::mutex> lock(mutex_);

    nlohmann::json counters = nlohmann::json::object();
    for (const auto& [name, counter] : counters_) {
        counters[name] = counter->value();
    }

    nlohmann::json histograms = nlohmann::json::object();
    for (const auto& [name, hist] : histograms_) {
        auto snap = hist->snapshot();
        histograms[name] = {
            {"count", snap.count},
            {"p50_us", duration_cast<microseconds>(snap.p50).count()},
            {"p99_us", duration_cast<microseconds>(snap.p99).count()},
            {"max_us", duration_cast<microseconds>(snap.max).count()}
        };
    }

    return nlohmann::json{{"counters", counters}, {"histograms", histograms}}.dump(2);
}

void MetricsRegistry::reset_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& entry : counters_) {
        entry.second->reset();
    }
    for (auto& entry : histograms_) {
        entry.second->reset();
    }
}

} // namespace arbexec

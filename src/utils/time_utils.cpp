#include "utils/time_utils.hpp"
#include <spdlog/fmt/fmt.h>

namespace arbexec {
namespace time_utils {

std::string format_duration(Duration d) {
    int64_t ns = d.count();

    if (ns < 1'000) return fmt::format("{}ns", ns);
    if (ns < 1'000'000) return fmt::format("{}us", ns / 1'000);
    if (ns < 1'000'000'000) return fmt::format("{}ms", ns / 1'000'000);
    return fmt::format("{:.2f}s", static_cast<double>(ns) / 1e9);
}

std::string format_execution_time(int64_t ms) {
    return fmt::format("{}ms", ms);
}

void LatencyTimer::stop() {
    if (!stopped_at_) {
        stopped_at_ = now();
    }
}

Duration LatencyTimer::elapsed() const {
    return stopped_at_.value_or(now()) - start_;
}

int64_t LatencyTimer::elapsed_ms() const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(elapsed()).count();
}

bool Deadline::expired() const {
    return enabled() && now() - start_ > budget_;
}

} // namespace time_utils
} // namespace arbexec

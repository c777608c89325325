#include "common/errors.hpp"
#include <cmath>
#include <spdlog/fmt/fmt.h>

namespace arbexec {

BelowThresholdError::BelowThresholdError(Rate difference, Rate threshold)
    : ArbitrageError(ErrorKind::BELOW_THRESHOLD,
                     fmt::format("funding rate difference too small: |{:.6f}| < {:.6f}",
                                 std::abs(difference), threshold))
    , difference_(difference)
    , threshold_(threshold)
{
}

} // namespace arbexec

#include "analytics/DynamicThresholdCalculator.h"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace ustw {
namespace analytics {

DynamicThresholdCalculator::DynamicThresholdCalculator(ThresholdScaling scaling)
    : scaling_(scaling) {
    if (scaling_.up_multiplier < 0.0 || scaling_.down_multiplier < 0.0) {
        throw std::invalid_argument("Threshold multipliers must be >= 0");
    }
    if (scaling_.floor < 0.0 || scaling_.ceiling < scaling_.floor) {
        throw std::invalid_argument("Threshold floor/ceiling must satisfy 0 <= floor <= ceiling");
    }
}

Percent DynamicThresholdCalculator::scaled(Percent volatility, double multiplier) const {
    // A non-finite estimate degrades to the most conservative threshold
    if (!std::isfinite(volatility)) {
        return scaling_.ceiling;
    }
    return std::clamp(volatility * multiplier, scaling_.floor, scaling_.ceiling);
}

ThresholdRule DynamicThresholdCalculator::compute(const VolatilityEstimate& volatility) const {
    return ThresholdRule(
        scaled(volatility.value, scaling_.up_multiplier),
        scaled(volatility.value, scaling_.down_multiplier),
        volatility.value,
        volatility.as_of);
}

} // namespace analytics
} // namespace ustw

#pragma once

#include "common/Types.h"
#include "analytics/VolatilityEstimator.h"

namespace ustw {
namespace analytics {

// Scaling from volatility to reaction thresholds (all percent)
struct ThresholdScaling {
    double up_multiplier = 1.0;
    double down_multiplier = 1.0;
    Percent floor = 0.7;        // 평온한 장: 더 민감하게
    Percent ceiling = 1.8;      // 폭풍 장: 더 보수적으로
};

// Asymmetric "significant move" definition. Both thresholds are >= 0;
// a move fires when return >= up_threshold or return <= -down_threshold.
struct ThresholdRule {
    Percent up_threshold;
    Percent down_threshold;
    Percent basis_volatility;
    Date basis_date;

    ThresholdRule() : up_threshold(0), down_threshold(0), basis_volatility(0) {}
    ThresholdRule(Percent up, Percent down, Percent vol, const Date& date)
        : up_threshold(up), down_threshold(down), basis_volatility(vol), basis_date(date) {}

    // Up test first, so a zero threshold still maps a 0% move to SURGE deterministically
    ReactionBucket classify(Percent day_return) const {
        if (day_return >= up_threshold) return ReactionBucket::SURGE;
        if (day_return <= -down_threshold) return ReactionBucket::CRASH;
        return ReactionBucket::FLAT;
    }

    bool fires(Percent day_return) const { return classify(day_return) != ReactionBucket::FLAT; }
};

class DynamicThresholdCalculator {
public:
    // Throws std::invalid_argument for negative multipliers or floor/ceiling out of order
    explicit DynamicThresholdCalculator(ThresholdScaling scaling = ThresholdScaling());

    // up = clamp(vol * up_multiplier, floor, ceiling), down likewise
    ThresholdRule compute(const VolatilityEstimate& volatility) const;

    const ThresholdScaling& scaling() const { return scaling_; }

private:
    Percent scaled(Percent volatility, double multiplier) const;

    ThresholdScaling scaling_;
};

} // namespace analytics
} // namespace ustw

#pragma once

#include "common/Types.h"
#include "common/PriceSeries.h"
#include <vector>

namespace ustw {
namespace analytics {

struct VolatilityEstimate {
    Date as_of;
    int window;
    Percent value;              // dispersion of day returns, percent
    DispersionMethod method;

    VolatilityEstimate() : window(0), value(0), method(DispersionMethod::STANDARD_DEVIATION) {}
};

// Rolling dispersion of day-over-day returns over the trailing N observations.
// Day returns are taken between consecutive observations, so calendar gaps
// never count as moves.
class VolatilityEstimator {
public:
    // window >= 2, throws std::invalid_argument otherwise
    explicit VolatilityEstimator(int window,
                                 DispersionMethod method = DispersionMethod::STANDARD_DEVIATION);

    // As of the series' last date. Throws InsufficientHistory with fewer than N+1 points.
    VolatilityEstimate estimate(const PriceSeries& series) const;

    // As of series[last_index], using only points up to and including it
    VolatilityEstimate estimateAt(const PriceSeries& series, size_t last_index) const;

    int window() const { return window_; }
    DispersionMethod method() const { return method_; }

    static double dispersion(const std::vector<double>& values, DispersionMethod method);

private:
    int window_;
    DispersionMethod method_;
};

} // namespace analytics
} // namespace ustw

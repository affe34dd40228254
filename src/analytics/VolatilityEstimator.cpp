#include "analytics/VolatilityEstimator.h"
#include "common/Errors.h"
#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>

namespace ustw {
namespace analytics {

VolatilityEstimator::VolatilityEstimator(int window, DispersionMethod method)
    : window_(window), method_(method) {
    if (window_ < 2) {
        throw std::invalid_argument("Volatility window must be >= 2, got " + std::to_string(window_));
    }
}

VolatilityEstimate VolatilityEstimator::estimate(const PriceSeries& series) const {
    if (series.empty()) {
        throw InsufficientHistory(series.instrumentId() + ": empty price series",
                                  static_cast<size_t>(window_) + 1, 0);
    }
    return estimateAt(series, series.size() - 1);
}

VolatilityEstimate VolatilityEstimator::estimateAt(const PriceSeries& series, size_t last_index) const {
    const size_t required = static_cast<size_t>(window_) + 1;
    const size_t available = series.empty() ? 0 : std::min(last_index + 1, series.size());
    if (available < required) {
        throw InsufficientHistory(
            series.instrumentId() + ": volatility window " + std::to_string(window_) +
                " needs " + std::to_string(required) + " points, have " + std::to_string(available),
            required, available);
    }

    // 최근 N개 일간 수익률
    std::vector<double> returns;
    returns.reserve(static_cast<size_t>(window_));
    for (size_t i = last_index + 1 - static_cast<size_t>(window_); i <= last_index; ++i) {
        returns.push_back(series.returnAt(i));
    }

    VolatilityEstimate result;
    result.as_of = series[last_index].date;
    result.window = window_;
    result.method = method_;
    result.value = dispersion(returns, method_);
    return result;
}

double VolatilityEstimator::dispersion(const std::vector<double>& values, DispersionMethod method) {
    if (values.empty()) {
        return 0.0;
    }

    const double n = static_cast<double>(values.size());
    const double mean = std::accumulate(values.begin(), values.end(), 0.0) / n;

    if (method == DispersionMethod::MEAN_ABSOLUTE_DEVIATION) {
        double sum_abs = 0.0;
        for (double v : values) {
            sum_abs += std::abs(v - mean);
        }
        return sum_abs / n;
    }

    double sum_sq = 0.0;
    for (double v : values) {
        const double d = v - mean;
        sum_sq += d * d;
    }
    // population variance; constant input gives exactly 0
    return std::sqrt(sum_sq / n);
}

} // namespace analytics
} // namespace ustw

#pragma once

#include "common/PriceSeries.h"

#include <cmath>
#include <iostream>
#include <string>
#include <vector>

// Fails the enclosing test (returns 1 from it) with the failing expression
#define USTW_CHECK(cond)                                                                  \
    do {                                                                                  \
        if (!(cond)) {                                                                    \
            std::cerr << "[TEST] check failed: " #cond " (" << __FILE__ << ":" << __LINE__ \
                      << ")\n";                                                           \
            return 1;                                                                     \
        }                                                                                 \
    } while (0)

#define USTW_CHECK_NEAR(a, b, tol) USTW_CHECK(std::abs((a) - (b)) <= (tol))

namespace ustw {
namespace test {

// One point per calendar day starting at `start`
inline PriceSeries dailySeries(const std::string& id, const Date& start, const std::vector<double>& closes) {
    std::vector<PricePoint> points;
    for (size_t i = 0; i < closes.size(); ++i) {
        points.emplace_back(start.addDays(static_cast<long long>(i)), closes[i]);
    }
    return PriceSeries(id, std::move(points));
}

// Closes compounded from `base` by each percent return; size = returns.size() + 1
inline PriceSeries seriesFromReturns(const std::string& id, const Date& start, double base,
                                     const std::vector<double>& returns_pct) {
    std::vector<double> closes{base};
    for (double r : returns_pct) {
        closes.push_back(closes.back() * (1.0 + r / 100.0));
    }
    return dailySeries(id, start, closes);
}

// Repeats `pattern` until `count` values are produced
inline std::vector<double> cycle(const std::vector<double>& pattern, size_t count) {
    std::vector<double> out;
    out.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        out.push_back(pattern[i % pattern.size()]);
    }
    return out;
}

} // namespace test
} // namespace ustw

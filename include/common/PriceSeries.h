#pragma once

#include <string>
#include <vector>
#include <optional>
#include "common/Types.h"

namespace ustw {

// Immutable, chronologically ordered price history of one instrument.
// Dates are strictly increasing; gaps (non-trading days) are allowed.
class PriceSeries {
public:
    PriceSeries() = default;

    // Throws std::invalid_argument on unordered/duplicate dates or non-positive closes
    PriceSeries(std::string instrument_id, std::vector<PricePoint> points,
                std::string display_name = "");

    const std::string& instrumentId() const { return instrument_id_; }
    const std::string& displayName() const { return display_name_.empty() ? instrument_id_ : display_name_; }
    const std::vector<PricePoint>& points() const { return points_; }

    size_t size() const { return points_.size(); }
    bool empty() const { return points_.empty(); }
    const PricePoint& operator[](size_t i) const { return points_[i]; }
    const PricePoint& front() const { return points_.front(); }
    const PricePoint& back() const { return points_.back(); }

    // Index of the last point with date <= d
    std::optional<size_t> indexOnOrBefore(const Date& d) const;
    // Index of the first point with date > d
    std::optional<size_t> firstIndexAfter(const Date& d) const;
    std::optional<size_t> indexOf(const Date& d) const;

    // Day return of point i against point i-1 (i >= 1)
    Percent returnAt(size_t i) const;
    std::vector<DailyReturn> dailyReturns() const;

    PriceSeries slice(const DateRange& range) const;
    PriceSeries truncatedAt(const Date& last_date) const;

private:
    std::string instrument_id_;
    std::string display_name_;
    std::vector<PricePoint> points_;
};

} // namespace ustw

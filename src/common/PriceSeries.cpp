#include "common/PriceSeries.h"

#include <algorithm>
#include <stdexcept>

namespace ustw {

PriceSeries::PriceSeries(std::string instrument_id, std::vector<PricePoint> points,
                         std::string display_name)
    : instrument_id_(std::move(instrument_id))
    , display_name_(std::move(display_name))
    , points_(std::move(points)) {
    for (size_t i = 0; i < points_.size(); ++i) {
        if (!(points_[i].close > 0.0)) {
            throw std::invalid_argument(instrument_id_ + ": non-positive close on " +
                                        points_[i].date.toString());
        }
        if (i > 0 && !(points_[i - 1].date < points_[i].date)) {
            throw std::invalid_argument(instrument_id_ + ": dates not strictly increasing at " +
                                        points_[i].date.toString());
        }
    }
}

std::optional<size_t> PriceSeries::indexOnOrBefore(const Date& d) const {
    auto it = std::upper_bound(points_.begin(), points_.end(), d,
                               [](const Date& value, const PricePoint& p) { return value < p.date; });
    if (it == points_.begin()) {
        return std::nullopt;
    }
    return static_cast<size_t>(std::distance(points_.begin(), it) - 1);
}

std::optional<size_t> PriceSeries::firstIndexAfter(const Date& d) const {
    auto it = std::upper_bound(points_.begin(), points_.end(), d,
                               [](const Date& value, const PricePoint& p) { return value < p.date; });
    if (it == points_.end()) {
        return std::nullopt;
    }
    return static_cast<size_t>(std::distance(points_.begin(), it));
}

std::optional<size_t> PriceSeries::indexOf(const Date& d) const {
    auto idx = indexOnOrBefore(d);
    if (idx && points_[*idx].date == d) {
        return idx;
    }
    return std::nullopt;
}

Percent PriceSeries::returnAt(size_t i) const {
    if (i == 0 || i >= points_.size()) {
        throw std::out_of_range(instrument_id_ + ": no day return at index " + std::to_string(i));
    }
    return (points_[i].close / points_[i - 1].close - 1.0) * 100.0;
}

std::vector<DailyReturn> PriceSeries::dailyReturns() const {
    std::vector<DailyReturn> returns;
    if (points_.size() < 2) {
        return returns;
    }
    returns.reserve(points_.size() - 1);
    for (size_t i = 1; i < points_.size(); ++i) {
        returns.emplace_back(points_[i].date, points_[i - 1].date, returnAt(i));
    }
    return returns;
}

PriceSeries PriceSeries::slice(const DateRange& range) const {
    std::vector<PricePoint> kept;
    for (const auto& p : points_) {
        if (range.contains(p.date)) {
            kept.push_back(p);
        }
    }
    return PriceSeries(instrument_id_, std::move(kept), display_name_);
}

PriceSeries PriceSeries::truncatedAt(const Date& last_date) const {
    auto idx = indexOnOrBefore(last_date);
    if (!idx) {
        return PriceSeries(instrument_id_, {}, display_name_);
    }
    std::vector<PricePoint> kept(points_.begin(), points_.begin() + static_cast<long>(*idx + 1));
    return PriceSeries(instrument_id_, std::move(kept), display_name_);
}

} // namespace ustw

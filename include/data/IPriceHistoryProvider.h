#pragma once

#include <string>
#include <optional>
#include "common/Date.h"
#include "common/PriceSeries.h"

namespace ustw {
namespace data {

// Source of price history for any instrument. Implementations must allow
// concurrent fetch() calls for different instruments (batch evaluation).
class IPriceHistoryProvider {
public:
    virtual ~IPriceHistoryProvider() = default;

    // Whole available history when range is empty.
    // Throws DataUnavailable; retry/backoff is the implementation's concern.
    virtual PriceSeries fetch(const std::string& instrument_id,
                              const std::optional<DateRange>& range = std::nullopt) = 0;
};

} // namespace data
} // namespace ustw

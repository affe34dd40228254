#pragma once

#include <map>
#include <string>
#include "data/IPriceHistoryProvider.h"

namespace ustw {
namespace data {

// File-backed provider: one CSV (or .json) file per instrument.
// Stateless after construction, so concurrent fetch() calls are safe.
class CsvPriceHistoryProvider : public IPriceHistoryProvider {
public:
    struct Source {
        std::string path;
        std::string display_name;
    };

    CsvPriceHistoryProvider() = default;
    explicit CsvPriceHistoryProvider(std::map<std::string, Source> sources);

    void addSource(const std::string& instrument_id, const std::string& path,
                   const std::string& display_name = "");

    PriceSeries fetch(const std::string& instrument_id,
                      const std::optional<DateRange>& range = std::nullopt) override;

private:
    std::map<std::string, Source> sources_;
};

} // namespace data
} // namespace ustw

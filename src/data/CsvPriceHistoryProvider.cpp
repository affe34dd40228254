#include "data/CsvPriceHistoryProvider.h"
#include "data/DataHistory.h"
#include "common/Errors.h"
#include <algorithm>
#include <cctype>
#include <filesystem>

namespace ustw {
namespace data {

CsvPriceHistoryProvider::CsvPriceHistoryProvider(std::map<std::string, Source> sources)
    : sources_(std::move(sources)) {}

void CsvPriceHistoryProvider::addSource(const std::string& instrument_id, const std::string& path,
                                        const std::string& display_name) {
    sources_[instrument_id] = Source{path, display_name};
}

PriceSeries CsvPriceHistoryProvider::fetch(const std::string& instrument_id,
                                           const std::optional<DateRange>& range) {
    const auto it = sources_.find(instrument_id);
    if (it == sources_.end()) {
        throw DataUnavailable(instrument_id, "no data source configured");
    }

    const std::filesystem::path path(it->second.path);
    if (!std::filesystem::exists(path)) {
        throw DataUnavailable(instrument_id, "file not found: " + path.string());
    }

    std::string ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    auto points = (ext == ".json") ? DataHistory::loadJSON(path.string())
                                   : DataHistory::loadCSV(path.string());
    if (range) {
        points = DataHistory::filterByDate(points, *range);
    }
    if (points.empty()) {
        throw DataUnavailable(instrument_id, "no price rows in " + path.string() +
                                             (range ? " for " + range->toString() : std::string()));
    }

    return PriceSeries(instrument_id, std::move(points), it->second.display_name);
}

} // namespace data
} // namespace ustw

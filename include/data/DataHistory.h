#pragma once

#include <istream>
#include <string>
#include <vector>
#include "common/Types.h"
#include "common/PriceSeries.h"

namespace ustw {
namespace data {

class DataHistory {
public:
    // Load daily bars from a CSV file
    // Expected format: date,open,high,low,close[,volume] or date,close
    // Header rows, quoted cells and a UTF-8 BOM are tolerated; rows are sorted by date.
    static std::vector<PricePoint> loadCSV(const std::string& file_path);

    // JSON array of {"date", "close", "open"?, "high"?, "low"?}
    static std::vector<PricePoint> loadJSON(const std::string& file_path);

    // Parse CSV text (same rules as loadCSV)
    static std::vector<PricePoint> parseCSV(std::istream& input, const std::string& source_name);

    // Keep points with start <= date <= end
    static std::vector<PricePoint> filterByDate(const std::vector<PricePoint>& points,
                                                const DateRange& range);

    // Sort by date and drop repeated dates (last row wins)
    static std::vector<PricePoint> normalize(std::vector<PricePoint> points);
};

} // namespace data
} // namespace ustw

#include "data/DataHistory.h"
#include <fstream>
#include <sstream>
#include <map>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <iterator>
#include <optional>
#include "common/Logger.h"

namespace ustw {
namespace data {

namespace {
std::string trim(std::string s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
        s.erase(s.begin());
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.pop_back();
    }
    return s;
}

std::string normalizeCell(std::string s) {
    s = trim(std::move(s));

    // Strip UTF-8 BOM if present at first cell.
    if (s.size() >= 3 &&
        static_cast<unsigned char>(s[0]) == 0xEF &&
        static_cast<unsigned char>(s[1]) == 0xBB &&
        static_cast<unsigned char>(s[2]) == 0xBF) {
        s = s.substr(3);
    }

    // Accept quoted CSV cells.
    if (s.size() >= 2 && s.front() == '"' && s.back() == '"') {
        s = s.substr(1, s.size() - 2);
    }
    return trim(std::move(s));
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::optional<double> optionalCell(const std::vector<std::string>& row, int col) {
    if (col < 0 || static_cast<size_t>(col) >= row.size() || row[static_cast<size_t>(col)].empty()) {
        return std::nullopt;
    }
    return std::stod(row[static_cast<size_t>(col)]);
}

struct ColumnMap {
    int date = 0;
    int open = -1;
    int high = -1;
    int low = -1;
    int close = -1;
};

// Positional layout when the file has no header
ColumnMap positionalColumns(size_t width) {
    ColumnMap cols;
    if (width >= 5) {
        cols.open = 1;
        cols.high = 2;
        cols.low = 3;
        cols.close = 4;
    } else {
        cols.close = 1;
    }
    return cols;
}

std::optional<double> jsonNumber(const nlohmann::json& item, const char* key, const char* short_key) {
    if (item.contains(key) && item[key].is_number()) return item[key].get<double>();
    if (item.contains(short_key) && item[short_key].is_number()) return item[short_key].get<double>();
    return std::nullopt;
}
}

std::vector<PricePoint> DataHistory::parseCSV(std::istream& input, const std::string& source_name) {
    std::vector<PricePoint> points;
    std::optional<ColumnMap> header_cols;
    std::string line;

    while (std::getline(input, line)) {
        std::stringstream ss(line);
        std::string cell;
        std::vector<std::string> row;

        while (std::getline(ss, cell, ',')) {
            row.push_back(normalizeCell(cell));
        }

        if (row.size() < 2) continue;
        if (row[0].empty()) continue;
        if (!std::isdigit(static_cast<unsigned char>(row[0][0]))) {
            // Header row: map columns by name
            ColumnMap cols;
            cols.date = -1;
            for (size_t i = 0; i < row.size(); ++i) {
                const std::string name = lower(row[i]);
                const int idx = static_cast<int>(i);
                if (name == "date" || name == "datetime" || name == "timestamp") cols.date = idx;
                else if (name == "open") cols.open = idx;
                else if (name == "high") cols.high = idx;
                else if (name == "low") cols.low = idx;
                else if (name == "close") cols.close = idx;
                else if (name == "adj close" && cols.close < 0) cols.close = idx;
            }
            if (cols.date >= 0 && cols.close >= 0) {
                header_cols = cols;
            } else {
                LOG_WARN("Unrecognized header in {}: {}", source_name, line);
            }
            continue;
        }

        const ColumnMap cols = header_cols ? *header_cols : positionalColumns(row.size());
        if (static_cast<size_t>(cols.close) >= row.size() || static_cast<size_t>(cols.date) >= row.size()) {
            continue;
        }

        try {
            PricePoint point;
            point.date = Date::parse(row[static_cast<size_t>(cols.date)]);
            point.close = std::stod(row[static_cast<size_t>(cols.close)]);
            point.open = optionalCell(row, cols.open);
            point.high = optionalCell(row, cols.high);
            point.low = optionalCell(row, cols.low);
            if (!(point.close > 0.0)) {
                LOG_WARN("Skipping non-positive close in {}: {}", source_name, line);
                continue;
            }
            points.push_back(point);
        } catch (const std::exception& e) {
            LOG_WARN("Error parsing row: {} - {}", line, e.what());
        }
    }

    return normalize(std::move(points));
}

std::vector<PricePoint> DataHistory::loadCSV(const std::string& file_path) {
    std::ifstream file(file_path);

    if (!file.is_open()) {
        LOG_ERROR("Failed to open CSV file: {}", file_path);
        return {};
    }

    auto points = parseCSV(file, file_path);
    LOG_INFO("Loaded {} bars from {}", points.size(), file_path);
    return points;
}

std::vector<PricePoint> DataHistory::loadJSON(const std::string& file_path) {
    std::vector<PricePoint> points;
    std::ifstream file(file_path);

    if (!file.is_open()) {
        LOG_ERROR("Failed to open JSON file: {}", file_path);
        return points;
    }

    nlohmann::json j;
    try {
        file >> j;
        for (const auto& item : j) {
            PricePoint point;
            if (item.contains("date")) point.date = Date::parse(item["date"].get<std::string>());
            else if (item.contains("d")) point.date = Date::parse(item["d"].get<std::string>());
            else continue;

            const auto close = jsonNumber(item, "close", "c");
            if (!close || !(*close > 0.0)) continue;
            point.close = *close;
            point.open = jsonNumber(item, "open", "o");
            point.high = jsonNumber(item, "high", "h");
            point.low = jsonNumber(item, "low", "l");
            points.push_back(point);
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Error parsing JSON file: {} - {}", file_path, e.what());
        return {};
    }

    points = normalize(std::move(points));
    LOG_INFO("Loaded {} bars from {}", points.size(), file_path);
    return points;
}

std::vector<PricePoint> DataHistory::filterByDate(const std::vector<PricePoint>& points,
                                                  const DateRange& range) {
    std::vector<PricePoint> kept;
    std::copy_if(points.begin(), points.end(), std::back_inserter(kept),
                 [&](const PricePoint& p) { return range.contains(p.date); });
    return kept;
}

std::vector<PricePoint> DataHistory::normalize(std::vector<PricePoint> points) {
    std::stable_sort(points.begin(), points.end(), [](const PricePoint& a, const PricePoint& b) {
        return a.date < b.date;
    });

    std::vector<PricePoint> unique;
    unique.reserve(points.size());
    for (auto& p : points) {
        if (!unique.empty() && unique.back().date == p.date) {
            unique.back() = p;
        } else {
            unique.push_back(p);
        }
    }
    return unique;
}

} // namespace data
} // namespace ustw

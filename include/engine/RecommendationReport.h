#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "engine/RecommendationComposer.h"

namespace ustw {
namespace engine {

// JSON views of the engine output for report formatting / delivery
nlohmann::json toJson(const analytics::ThresholdRule& rule);
nlohmann::json toJson(const backtest::BacktestStatistics& statistics);
nlohmann::json toJson(const strategy::Signal& signal);
nlohmann::json toJson(const InstrumentEvaluation& evaluation, bool include_events = false);
nlohmann::json toJson(const RecommendationSet& result, bool include_events = false);

// Writes the report atomically (temp file + rename). Returns false on I/O failure.
bool writeReport(const RecommendationSet& result, const std::string& path, bool include_events = false);

} // namespace engine
} // namespace ustw

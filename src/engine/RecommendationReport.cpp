#include "engine/RecommendationReport.h"

#include <filesystem>
#include <fstream>
#include <system_error>

namespace ustw {
namespace engine {

namespace {
template <typename T>
nlohmann::json optionalJson(const std::optional<T>& value) {
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

nlohmann::json eventToJson(const backtest::BacktestEvent& e) {
    return nlohmann::json{
        {"trigger_date", e.trigger_date.toString()},
        {"trigger_return", e.trigger_return},
        {"bucket", toString(e.bucket)},
        {"outcome_date", e.outcome_date.toString()},
        {"exit_date", e.exit_date.toString()},
        {"entry_price", e.entry_price},
        {"exit_price", e.exit_price},
        {"outcome_return", e.outcome_return},
        {"win", e.win}
    };
}
}

nlohmann::json toJson(const analytics::ThresholdRule& rule) {
    return nlohmann::json{
        {"up_threshold", rule.up_threshold},
        {"down_threshold", rule.down_threshold},
        {"basis_volatility", rule.basis_volatility},
        {"basis_date", rule.basis_date.toString()}
    };
}

nlohmann::json toJson(const backtest::BacktestStatistics& statistics) {
    nlohmann::json j;
    j["status"] = statistics.sufficient() ? "ok" : "insufficient_data";
    j["sample_size"] = statistics.sample_size;
    j["win_count"] = statistics.win_count;
    j["min_sample_size"] = statistics.min_sample_size;
    // 표본 부족이면 승률을 유효한 통계로 내보내지 않음
    j["win_rate"] = statistics.sufficient() ? optionalJson(statistics.win_rate) : nlohmann::json(nullptr);
    j["average_outcome_return"] = statistics.sufficient()
        ? optionalJson(statistics.average_outcome_return)
        : nlohmann::json(nullptr);
    j["window"] = {{"start", statistics.window.start.toString()}, {"end", statistics.window.end.toString()}};
    return j;
}

nlohmann::json toJson(const strategy::Signal& signal) {
    return nlohmann::json{
        {"date", signal.date.toString()},
        {"observed_return", signal.observed_return},
        {"bucket", toString(signal.bucket)},
        {"grade", toString(signal.grade)},
        {"confidence", signal.confidence},
        {"confidence_level", toString(signal.confidence_level)},
        {"reason", signal.reason},
        {"rule", toJson(signal.rule)},
        {"statistics", toJson(signal.statistics)}
    };
}

nlohmann::json toJson(const InstrumentEvaluation& evaluation, bool include_events) {
    nlohmann::json j;
    j["instrument"] = evaluation.instrument_id;
    j["name"] = evaluation.display_name;
    j["signal"] = toJson(evaluation.signal);
    j["preference"] = toString(evaluation.preference);
    j["breakdown"] = {
        {"surge", toJson(evaluation.backtest.surge)},
        {"crash", toJson(evaluation.backtest.crash)},
        {"flat", toJson(evaluation.backtest.flat)}
    };
    j["skipped_pairings"] = evaluation.backtest.skipped_pairings;
    j["confirmation"] = {
        {"preference", toString(evaluation.confirmation_preference)},
        {"surge", toJson(evaluation.confirmation.surge)},
        {"crash", toJson(evaluation.confirmation.crash)}
    };
    j["confirmed_preference"] = toString(evaluation.confirmed_preference);
    j["flat_advice"] = toString(evaluation.flat_advice);
    if (include_events) {
        nlohmann::json events = nlohmann::json::array();
        for (const auto& e : evaluation.backtest.events) {
            events.push_back(eventToJson(e));
        }
        j["events"] = events;
    }
    return j;
}

nlohmann::json toJson(const RecommendationSet& result, bool include_events) {
    const auto& m = result.market;
    nlohmann::json j;
    j["market"] = {
        {"trigger", m.trigger_id},
        {"as_of", m.as_of.toString()},
        {"observed_return", m.observed_return},
        {"status", toString(m.bucket)},
        {"volatility", {
            {"value", m.volatility.value},
            {"window", m.volatility.window},
            {"method", toString(m.volatility.method)},
            {"as_of", m.volatility.as_of.toString()}
        }},
        {"rule", toJson(m.rule)},
        {"evaluation_window", {{"start", m.evaluation_window.start.toString()},
                               {"end", m.evaluation_window.end.toString()}}},
        {"confirmation_window", {{"start", m.confirmation_window.start.toString()},
                                 {"end", m.confirmation_window.end.toString()}}}
    };

    nlohmann::json ranked = nlohmann::json::array();
    for (const auto& e : result.ranked) {
        ranked.push_back(toJson(e, include_events));
    }
    j["recommendations"] = ranked;

    nlohmann::json failures = nlohmann::json::array();
    for (const auto& f : result.failures) {
        failures.push_back({{"instrument", f.instrument_id}, {"reason", f.reason}});
    }
    j["failures"] = failures;
    return j;
}

bool writeReport(const RecommendationSet& result, const std::string& path, bool include_events) {
    const std::filesystem::path file_path(path);
    std::error_code ec;
    if (file_path.has_parent_path()) {
        std::filesystem::create_directories(file_path.parent_path(), ec);
        if (ec) {
            return false;
        }
    }

    auto tmp_path = file_path;
    tmp_path += ".tmp";

    {
        std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            return false;
        }
        out << toJson(result, include_events).dump(2);
        if (!out.good()) {
            return false;
        }
    }

    std::filesystem::rename(tmp_path, file_path, ec);
    if (ec) {
        std::filesystem::remove(tmp_path, ec);
        return false;
    }
    return true;
}

} // namespace engine
} // namespace ustw

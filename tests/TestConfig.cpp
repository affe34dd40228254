#include "common/Config.h"
#include "common/Errors.h"
#include "common/PathUtils.h"
#include "TestHelpers.h"

#include <filesystem>
#include <fstream>
#include <iostream>

using namespace ustw;

namespace {
bool throwsConfigError(const nlohmann::json& j) {
    try {
        Config::fromJson(j);
    } catch (const ConfigError&) {
        return true;
    }
    return false;
}
}

int main() {
    std::cout << "[TEST] Starting Config Test..." << std::endl;

    // 1. Defaults alone are a valid run
    {
        const Config config;
        config.validate();
        const auto& e = config.getEngineConfig();
        USTW_CHECK(e.volatility_window == 20);
        USTW_CHECK(e.up_multiplier == 1.0 && e.down_multiplier == 1.0);
        USTW_CHECK(e.threshold_floor == 0.7);
        USTW_CHECK(e.threshold_ceiling == 1.8);
        USTW_CHECK(e.min_sample_size == 5);
        USTW_CHECK(e.strong_win_rate == 0.65);
        USTW_CHECK(e.evaluation_days == 95);
        USTW_CHECK(e.confirmation_days == 180);
        USTW_CHECK(e.confidence_sample_scale == 10.0);
        USTW_CHECK(e.preference_margin == 0.5);
        USTW_CHECK(e.flat_min_average_return == 0.1);
        USTW_CHECK(e.flat_min_win_rate == 0.5);
        USTW_CHECK(e.holding_days == 1);
        USTW_CHECK(e.max_pairing_gap_days == 4);
        USTW_CHECK(!e.rolling_threshold);
        USTW_CHECK(e.max_workers == 0);
        USTW_CHECK(e.dispersion == DispersionMethod::STANDARD_DEVIATION);
        USTW_CHECK(config.getTrigger().id == "QQQ");
        USTW_CHECK(config.getLoggingConfig().level == "info");
    }

    // 2. Explicit values
    {
        const auto j = nlohmann::json::parse(R"({
            "engine": {"volatility_window": 30, "dispersion": "MAD", "up_multiplier": 1.2,
                       "down_multiplier": 0.9, "threshold_floor": 0.5, "threshold_ceiling": 2.5,
                       "min_sample_size": 8, "strong_win_rate": 0.7, "flat_min_average_return": 0.2},
            "backtest": {"evaluation_days": 120, "confirmation_days": 240, "holding_days": 2, "entry_basis": "open",
                         "win_rule": "positive-return", "rolling_threshold": true},
            "batch": {"max_workers": 3},
            "logging": {"level": "DEBUG", "directory": "/tmp/ustw-logs"},
            "instruments": {
                "trigger": {"id": "QQQ", "name": "Invesco QQQ", "csv": "data/QQQ.csv"},
                "outcomes": [{"id": "2330.TW", "name": "TSMC", "csv": "data/2330.csv"},
                             {"id": "2454.TW", "csv": "data/2454.csv"}]
            }
        })");
        const Config config = Config::fromJson(j);
        const auto& e = config.getEngineConfig();
        USTW_CHECK(e.volatility_window == 30);
        USTW_CHECK(e.dispersion == DispersionMethod::MEAN_ABSOLUTE_DEVIATION);
        USTW_CHECK(e.up_multiplier == 1.2);
        USTW_CHECK(e.threshold_ceiling == 2.5);
        USTW_CHECK(e.min_sample_size == 8);
        USTW_CHECK(e.evaluation_days == 120);
        USTW_CHECK(e.confirmation_days == 240);
        USTW_CHECK(e.flat_min_average_return == 0.2);
        USTW_CHECK(e.holding_days == 2);
        USTW_CHECK(e.entry_basis == EntryBasis::OPEN);
        USTW_CHECK(e.win_rule == WinRule::POSITIVE_RETURN);
        USTW_CHECK(e.rolling_threshold);
        USTW_CHECK(e.max_workers == 3);
        USTW_CHECK(config.getLoggingConfig().level == "debug");
        USTW_CHECK(config.getOutcomes().size() == 2);
        USTW_CHECK(config.getOutcomes()[0].name == "TSMC");

        // converters carry the values to each component
        USTW_CHECK(e.thresholdScaling().floor == 0.5);
        USTW_CHECK(e.backtestOptions().min_sample_size == 8);
        USTW_CHECK(e.signalPolicy().strong_win_rate == 0.7);
        USTW_CHECK(e.signalPolicy().flat_min_sample_size == 8);
        USTW_CHECK(e.signalPolicy().flat_min_average_return == 0.2);

        // toJson -> fromJson keeps every option
        const Config reloaded = Config::fromJson(config.toJson());
        USTW_CHECK(reloaded.toJson() == config.toJson());
    }

    // 3. Invalid options
    USTW_CHECK(throwsConfigError(nlohmann::json::array()));
    USTW_CHECK(throwsConfigError({{"engine", {{"volatility_window", 1}}}}));
    USTW_CHECK(throwsConfigError({{"engine", {{"volatility_window", "twenty"}}}}));
    USTW_CHECK(throwsConfigError({{"engine", {{"dispersion", "variance"}}}}));
    USTW_CHECK(throwsConfigError({{"engine", {{"threshold_floor", 2.0}, {"threshold_ceiling", 1.0}}}}));
    USTW_CHECK(throwsConfigError({{"engine", {{"strong_win_rate", 1.5}}}}));
    USTW_CHECK(throwsConfigError({{"backtest", {{"holding_days", 0}}}}));
    USTW_CHECK(throwsConfigError({{"backtest", {{"confirmation_days", 60}}}}));
    USTW_CHECK(throwsConfigError({{"engine", {{"flat_min_win_rate", 1.2}}}}));
    USTW_CHECK(throwsConfigError({{"backtest", {{"win_rule", "lucky"}}}}));
    USTW_CHECK(throwsConfigError({{"logging", {{"level", "loud"}}}}));
    USTW_CHECK(throwsConfigError(nlohmann::json::parse(R"({"instruments": {"outcomes": [{"name": "no id"}]}})")));

    // 4. Files
    {
        const auto dir = std::filesystem::temp_directory_path() / "ustw_test_config";
        std::filesystem::create_directories(dir);
        const auto path = dir / "config.json";
        {
            std::ofstream out(path);
            out << R"({"engine": {"volatility_window": 10},
                       "instruments": {"outcomes": [{"id": "2330.TW", "csv": "2330.csv"}]}})";
        }

        const Config config = Config::loadFromFile(path.string());
        USTW_CHECK(config.getEngineConfig().volatility_window == 10);
        USTW_CHECK(std::filesystem::path(config.getBaseDir()) == std::filesystem::absolute(dir));
        const auto csv = utils::PathUtils::resolveAgainst(config.getBaseDir(), config.getOutcomes()[0].csv);
        USTW_CHECK(csv == std::filesystem::absolute(dir) / "2330.csv");

        {
            std::ofstream out(path);
            out << "{ not json";
        }
        bool threw = false;
        try {
            Config::loadFromFile(path.string());
        } catch (const ConfigError&) {
            threw = true;
        }
        USTW_CHECK(threw);

        const Config missing = Config::loadFromFile((dir / "absent.json").string());
        USTW_CHECK(missing.getEngineConfig().volatility_window == 20);

        std::error_code ec;
        std::filesystem::remove_all(dir, ec);
    }

    std::cout << "[TEST] Config Test PASSED!" << std::endl;
    return 0;
}

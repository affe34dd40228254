#include "common/Config.h"
#include "common/Errors.h"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace ustw {

namespace {
std::string trimCopy(std::string s) {
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
    s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
    return s;
}

std::string normalizeToken(std::string name) {
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    name = trimCopy(name);
    std::replace(name.begin(), name.end(), '-', '_');
    return name;
}

DispersionMethod parseDispersion(const std::string& raw) {
    const std::string v = normalizeToken(raw);
    if (v == "stddev" || v == "std" || v == "standard_deviation") {
        return DispersionMethod::STANDARD_DEVIATION;
    }
    if (v == "mad" || v == "mean_absolute_deviation") {
        return DispersionMethod::MEAN_ABSOLUTE_DEVIATION;
    }
    throw ConfigError("engine.dispersion: unknown method '" + raw + "' (expected stddev|mad)");
}

EntryBasis parseEntryBasis(const std::string& raw) {
    const std::string v = normalizeToken(raw);
    if (v == "previous_close" || v == "close") return EntryBasis::PREVIOUS_CLOSE;
    if (v == "open") return EntryBasis::OPEN;
    throw ConfigError("backtest.entry_basis: unknown value '" + raw + "' (expected previous_close|open)");
}

WinRule parseWinRule(const std::string& raw) {
    const std::string v = normalizeToken(raw);
    if (v == "same_direction") return WinRule::SAME_DIRECTION;
    if (v == "positive_return") return WinRule::POSITIVE_RETURN;
    if (v == "high_above_entry") return WinRule::HIGH_ABOVE_ENTRY;
    throw ConfigError("backtest.win_rule: unknown value '" + raw +
                      "' (expected same_direction|positive_return|high_above_entry)");
}

InstrumentSource parseInstrument(const nlohmann::json& j) {
    InstrumentSource src;
    src.id = trimCopy(j.value("id", ""));
    src.name = trimCopy(j.value("name", ""));
    src.csv = trimCopy(j.value("csv", ""));
    if (src.id.empty()) {
        throw ConfigError("instruments: every instrument needs an 'id'");
    }
    return src;
}

nlohmann::json instrumentToJson(const InstrumentSource& src) {
    return nlohmann::json{{"id", src.id}, {"name", src.name}, {"csv", src.csv}};
}
}

Config Config::loadFromFile(const std::string& path) {
    std::filesystem::path config_path(path);

    if (!std::filesystem::exists(config_path)) {
        std::cerr << "Warning: config file not found: " << config_path.string()
                  << " (using defaults)" << std::endl;
        Config defaults;
        defaults.base_dir_ = std::filesystem::current_path().string();
        return defaults;
    }

    std::ifstream file(config_path);
    if (!file.is_open()) {
        throw ConfigError("Cannot open config file: " + config_path.string());
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError("Malformed config file " + config_path.string() + ": " + e.what());
    }

    Config config = fromJson(j);
    config.base_dir_ = std::filesystem::absolute(config_path).parent_path().string();
    std::cout << "Config loaded: " << config_path.string() << std::endl;
    return config;
}

Config Config::fromJson(const nlohmann::json& j) {
    Config config;
    if (!j.is_object()) {
        throw ConfigError("Config root must be a JSON object");
    }

    try {
        auto& e = config.engine_config_;

        if (j.contains("engine")) {
            const auto& s = j["engine"];
            e.volatility_window = s.value("volatility_window", 20);
            e.dispersion = parseDispersion(s.value("dispersion", std::string("stddev")));
            e.up_multiplier = s.value("up_multiplier", 1.0);
            e.down_multiplier = s.value("down_multiplier", 1.0);
            e.threshold_floor = s.value("threshold_floor", 0.7);
            e.threshold_ceiling = s.value("threshold_ceiling", 1.8);
            e.min_sample_size = s.value("min_sample_size", 5);
            e.strong_win_rate = s.value("strong_win_rate", 0.65);
            e.confidence_sample_scale = s.value("confidence_sample_scale", 10.0);
            e.preference_margin = s.value("preference_margin", 0.5);
            e.flat_min_average_return = s.value("flat_min_average_return", 0.1);
            e.flat_min_win_rate = s.value("flat_min_win_rate", 0.5);
        }

        if (j.contains("backtest")) {
            const auto& s = j["backtest"];
            e.evaluation_days = s.value("evaluation_days", 95);
            e.confirmation_days = s.value("confirmation_days", 180);
            e.holding_days = s.value("holding_days", 1);
            e.max_pairing_gap_days = s.value("max_pairing_gap_days", 4);
            e.entry_basis = parseEntryBasis(s.value("entry_basis", std::string("previous_close")));
            e.win_rule = parseWinRule(s.value("win_rule", std::string("same_direction")));
            e.rolling_threshold = s.value("rolling_threshold", false);
        }

        if (j.contains("batch")) {
            e.max_workers = j["batch"].value("max_workers", 0);
        }

        if (j.contains("logging")) {
            const auto& s = j["logging"];
            config.logging_.level = normalizeToken(s.value("level", std::string("info")));
            config.logging_.directory = s.value("directory", std::string("logs"));
        }

        if (j.contains("instruments")) {
            const auto& s = j["instruments"];
            if (s.contains("trigger")) {
                config.trigger_ = parseInstrument(s["trigger"]);
            }
            if (s.contains("outcomes")) {
                for (const auto& item : s["outcomes"]) {
                    config.outcomes_.push_back(parseInstrument(item));
                }
            }
        }
    } catch (const nlohmann::json::exception& ex) {
        throw ConfigError(std::string("Invalid config value: ") + ex.what());
    }

    config.validate();
    return config;
}

void Config::validate() const {
    const auto& e = engine_config_;
    if (e.volatility_window < 2) {
        throw ConfigError("engine.volatility_window must be >= 2");
    }
    if (e.up_multiplier < 0.0 || e.down_multiplier < 0.0) {
        throw ConfigError("engine.up_multiplier/down_multiplier must be >= 0");
    }
    if (e.threshold_floor < 0.0 || e.threshold_ceiling < e.threshold_floor) {
        throw ConfigError("engine.threshold_floor/threshold_ceiling must satisfy 0 <= floor <= ceiling");
    }
    if (e.min_sample_size < 1) {
        throw ConfigError("engine.min_sample_size must be >= 1");
    }
    if (e.strong_win_rate < 0.0 || e.strong_win_rate > 1.0) {
        throw ConfigError("engine.strong_win_rate must be within [0, 1]");
    }
    if (!(e.confidence_sample_scale > 0.0)) {
        throw ConfigError("engine.confidence_sample_scale must be > 0");
    }
    if (e.preference_margin < 0.0) {
        throw ConfigError("engine.preference_margin must be >= 0");
    }
    if (e.flat_min_win_rate < 0.0 || e.flat_min_win_rate > 1.0) {
        throw ConfigError("engine.flat_min_win_rate must be within [0, 1]");
    }
    if (e.evaluation_days < 1) {
        throw ConfigError("backtest.evaluation_days must be >= 1");
    }
    if (e.confirmation_days < e.evaluation_days) {
        throw ConfigError("backtest.confirmation_days must be >= backtest.evaluation_days");
    }
    if (e.holding_days < 1) {
        throw ConfigError("backtest.holding_days must be >= 1");
    }
    if (e.max_pairing_gap_days < 1) {
        throw ConfigError("backtest.max_pairing_gap_days must be >= 1");
    }
    if (e.max_workers < 0) {
        throw ConfigError("batch.max_workers must be >= 0");
    }
    static const std::vector<std::string> kLevels = {"trace", "debug", "info", "warn", "warning", "error", "critical", "off"};
    if (std::find(kLevels.begin(), kLevels.end(), logging_.level) == kLevels.end()) {
        throw ConfigError("logging.level: unknown level '" + logging_.level + "'");
    }
}

nlohmann::json Config::toJson() const {
    const auto& e = engine_config_;
    nlohmann::json j;
    j["engine"] = {
        {"volatility_window", e.volatility_window},
        {"dispersion", toString(e.dispersion)},
        {"up_multiplier", e.up_multiplier},
        {"down_multiplier", e.down_multiplier},
        {"threshold_floor", e.threshold_floor},
        {"threshold_ceiling", e.threshold_ceiling},
        {"min_sample_size", e.min_sample_size},
        {"strong_win_rate", e.strong_win_rate},
        {"confidence_sample_scale", e.confidence_sample_scale},
        {"preference_margin", e.preference_margin},
        {"flat_min_average_return", e.flat_min_average_return},
        {"flat_min_win_rate", e.flat_min_win_rate}
    };
    j["backtest"] = {
        {"evaluation_days", e.evaluation_days},
        {"confirmation_days", e.confirmation_days},
        {"holding_days", e.holding_days},
        {"max_pairing_gap_days", e.max_pairing_gap_days},
        {"entry_basis", toString(e.entry_basis)},
        {"win_rule", toString(e.win_rule)},
        {"rolling_threshold", e.rolling_threshold}
    };
    j["batch"] = {{"max_workers", e.max_workers}};
    j["logging"] = {{"level", logging_.level}, {"directory", logging_.directory}};

    nlohmann::json outcomes = nlohmann::json::array();
    for (const auto& o : outcomes_) {
        outcomes.push_back(instrumentToJson(o));
    }
    j["instruments"] = {{"trigger", instrumentToJson(trigger_)}, {"outcomes", outcomes}};
    return j;
}

} // namespace ustw

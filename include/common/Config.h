#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "engine/EngineConfig.h"

namespace ustw {

struct InstrumentSource {
    std::string id;
    std::string name;
    std::string csv;
};

struct LoggingConfig {
    std::string level = "info";
    std::string directory = "logs";
};

// Explicit configuration object handed to the engine at construction time.
// Value type: no process-wide instance.
class Config {
public:
    Config() = default;

    // Missing file -> defaults (with a warning). Malformed JSON or invalid values -> ConfigError.
    static Config loadFromFile(const std::string& config_path);
    static Config fromJson(const nlohmann::json& j);

    nlohmann::json toJson() const;

    // Throws ConfigError naming the first invalid option
    void validate() const;

    const engine::EngineConfig& getEngineConfig() const { return engine_config_; }
    engine::EngineConfig& mutableEngineConfig() { return engine_config_; }
    const LoggingConfig& getLoggingConfig() const { return logging_; }
    const InstrumentSource& getTrigger() const { return trigger_; }
    const std::vector<InstrumentSource>& getOutcomes() const { return outcomes_; }

    void setTrigger(const InstrumentSource& v) { trigger_ = v; }
    void setOutcomes(const std::vector<InstrumentSource>& v) { outcomes_ = v; }
    void setLogLevel(const std::string& v) { logging_.level = v; }

    // Relative CSV paths resolve against this directory (the config file's)
    const std::string& getBaseDir() const { return base_dir_; }

private:
    engine::EngineConfig engine_config_;
    LoggingConfig logging_;
    InstrumentSource trigger_{"QQQ", "Nasdaq-100", ""};
    std::vector<InstrumentSource> outcomes_;
    std::string base_dir_;
};

} // namespace ustw

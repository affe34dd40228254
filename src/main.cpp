#include "common/Logger.h"
#include "common/Config.h"
#include "common/Errors.h"
#include "common/PathUtils.h"
#include "data/CsvPriceHistoryProvider.h"
#include "engine/RecommendationComposer.h"
#include "engine/RecommendationReport.h"

#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

using namespace ustw;

namespace {

struct CliOptions {
    std::string config_path = "config/config.json";
    std::optional<Date> as_of;
    std::string json_path;
    bool include_events = false;
};

void printUsage() {
    std::cout << "Usage: ustw_signal [--config path] [--as-of YYYY-MM-DD] [--json output-path] [--events]\n";
}

// Returns false when the process should exit (help or bad arguments)
bool parseArgs(int argc, char* argv[], CliOptions& out, int& exit_code) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            printUsage();
            exit_code = 0;
            return false;
        }
        if (arg == "--events") {
            out.include_events = true;
            continue;
        }
        if (i + 1 >= argc) {
            std::cerr << "Missing value for " << arg << "\n";
            printUsage();
            exit_code = 1;
            return false;
        }
        const std::string value = argv[++i];
        if (arg == "--config") {
            out.config_path = value;
        } else if (arg == "--as-of") {
            try {
                out.as_of = Date::parse(value);
            } catch (const std::invalid_argument& e) {
                std::cerr << e.what() << "\n";
                exit_code = 1;
                return false;
            }
        } else if (arg == "--json") {
            out.json_path = value;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            printUsage();
            exit_code = 1;
            return false;
        }
    }
    return true;
}

std::string formatPct(double v) {
    std::ostringstream oss;
    oss << std::showpos << std::fixed << std::setprecision(2) << v << "%";
    return oss.str();
}

std::string formatStats(const backtest::BacktestStatistics& s) {
    if (!s.sufficient()) {
        return std::to_string(s.sample_size) + " (insufficient)";
    }
    std::ostringstream oss;
    oss << s.sample_size << " / " << std::fixed << std::setprecision(0) << (*s.win_rate * 100.0) << "% / "
        << formatPct(*s.average_outcome_return);
    return oss.str();
}

void printSummary(const engine::RecommendationSet& result) {
    const auto& m = result.market;
    std::cout << "\n========================================================\n";
    std::cout << " " << m.trigger_id << " " << m.as_of.toString() << "  " << formatPct(m.observed_return)
              << "  [" << toString(m.bucket) << "]\n";
    std::cout << " volatility(" << m.volatility.window << ") " << std::fixed << std::setprecision(2)
              << m.volatility.value << "%  thresholds +" << m.rule.up_threshold << "% / -"
              << m.rule.down_threshold << "%\n";
    std::cout << " backtest window " << m.evaluation_window.toString()
              << "  confirmation " << m.confirmation_window.toString() << "\n";
    std::cout << "--------------------------------------------------------\n";
    std::cout << std::left << std::setw(12) << "instrument" << std::setw(14) << "grade"
              << std::setw(12) << "confidence" << std::setw(28) << "n / win / avg" << std::setw(16) << "prefer"
              << std::setw(16) << "confirmed" << "flat day\n";
    for (const auto& e : result.ranked) {
        std::ostringstream conf;
        conf << std::fixed << std::setprecision(2) << e.signal.confidence << " " << toString(e.signal.confidence_level);
        std::cout << std::left << std::setw(12) << e.instrument_id << std::setw(14) << toString(e.signal.grade)
                  << std::setw(12) << conf.str() << std::setw(28) << formatStats(e.signal.statistics)
                  << std::setw(16) << toString(e.preference) << std::setw(16) << toString(e.confirmed_preference)
                  << toString(e.flat_advice) << "\n";
    }
    for (const auto& f : result.failures) {
        std::cout << std::left << std::setw(12) << f.instrument_id << "not evaluated: " << f.reason << "\n";
    }
    std::cout << "========================================================\n";
}

} // namespace

int main(int argc, char* argv[]) {
    CliOptions cli;
    int exit_code = 0;
    if (!parseArgs(argc, argv, cli, exit_code)) {
        return exit_code;
    }

    try {
        const Config config = Config::loadFromFile(cli.config_path);

        Logger::getInstance().initialize(config.getLoggingConfig().directory, config.getLoggingConfig().level);
        LOG_INFO("Starting signal run (config: {})", cli.config_path);

        if (config.getOutcomes().empty()) {
            LOG_ERROR("No outcome instruments configured");
            return 1;
        }

        data::CsvPriceHistoryProvider provider;
        const auto& trigger = config.getTrigger();
        provider.addSource(trigger.id,
                           utils::PathUtils::resolveAgainst(config.getBaseDir(), trigger.csv).string(),
                           trigger.name);

        std::vector<std::string> outcome_ids;
        for (const auto& o : config.getOutcomes()) {
            provider.addSource(o.id, utils::PathUtils::resolveAgainst(config.getBaseDir(), o.csv).string(), o.name);
            outcome_ids.push_back(o.id);
        }

        const engine::RecommendationComposer composer(config.getEngineConfig());
        const auto result = composer.compose(provider, trigger.id, outcome_ids, cli.as_of);

        printSummary(result);

        if (!cli.json_path.empty()) {
            if (!engine::writeReport(result, cli.json_path, cli.include_events)) {
                LOG_ERROR("Failed to write report: {}", cli.json_path);
                return 1;
            }
            LOG_INFO("Report written: {}", cli.json_path);
        }
        Logger::getInstance().flush();
        return 0;

    } catch (const ConfigError& e) {
        std::cerr << "Config error: " << e.what() << std::endl;
        return 1;
    } catch (const DataUnavailable& e) {
        LOG_ERROR("Trigger data unavailable: {}", e.what());
        std::cerr << e.what() << std::endl;
        return 1;
    } catch (const InsufficientHistory& e) {
        LOG_ERROR("Insufficient trigger history: {}", e.what());
        std::cerr << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        LOG_ERROR("Fatal error: {}", e.what());
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}

#include "common/Logger.h"
#include "TestHelpers.h"

#include <iostream>
#include <optional>
#include <stdexcept>

using namespace ustw;

int main() {
    // 1. signals.log line with a measured win rate
    {
        const auto line = Logger::formatSignalLine("2024-06-03", "2330.TW", "strong_buy", 0.615384, 16, 1.0);
        USTW_CHECK(line == "2024-06-03,2330.TW,strong_buy,0.6154,16,1.0000");
    }

    // 2. insufficient sample: the win rate column stays empty, never 0
    {
        const auto line = Logger::formatSignalLine("2024-06-03", "2454.TW", "hold", 0.0, 0, std::nullopt);
        USTW_CHECK(line == "2024-06-03,2454.TW,hold,0.0000,0,");
    }

    // 3. a real zero win rate is still written
    {
        const auto line = Logger::formatSignalLine("2024-06-03", "2317.TW", "buy", 0.0, 12, 0.0);
        USTW_CHECK(line == "2024-06-03,2317.TW,buy,0.0000,12,0.0000");
    }

    // 4. uninitialized logger is a no-op
    {
        Logger& logger = Logger::getInstance();
        USTW_CHECK(!logger.isInitialized());
        USTW_CHECK(!logger.writesSignalLog());
        logger.logSignal("2024-06-03", "2330.TW", "hold", 0.0, 0, std::nullopt);
        LOG_INFO("not initialized {}", 1);
    }

    // 5. unknown level is rejected, console-only init works
    {
        bool threw = false;
        try {
            Logger::getInstance().initialize("", "loud");
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        USTW_CHECK(threw);
        USTW_CHECK(!Logger::getInstance().isInitialized());

        Logger::getInstance().initialize("", "warn");
        USTW_CHECK(Logger::getInstance().isInitialized());
        USTW_CHECK(!Logger::getInstance().writesSignalLog());
        Logger::getInstance().flush();
    }

    std::cout << "[TEST] Logger PASSED\n";
    return 0;
}

#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/daily_file_sink.h>
#include <memory>
#include <optional>
#include <string>

namespace ustw {

// Process logger facade. Calls are no-ops until initialize() runs, so the
// engine library can be used (and tested) without any logging setup.
class Logger {
public:
    static Logger& getInstance();

    // Empty log_dir -> console only, no ustw.log / signals.log files
    void initialize(const std::string& log_dir = "logs", const std::string& level = "info");
    bool isInitialized() const { return initialized_; }
    bool writesSignalLog() const { return static_cast<bool>(signal_logger_); }

    template<typename... Args>
    void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        log(spdlog::level::debug, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        log(spdlog::level::info, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        log(spdlog::level::warn, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        log(spdlog::level::err, fmt, std::forward<Args>(args)...);
    }

    // One CSV line per emitted signal: date,instrument,grade,confidence,sample,win_rate
    // 표본 부족이면 win_rate 칸은 비워 둔다
    void logSignal(const std::string& date, const std::string& instrument, const std::string& grade,
                   double confidence, int sample_size, std::optional<double> win_rate);

    static std::string formatSignalLine(const std::string& date, const std::string& instrument,
                                        const std::string& grade, double confidence, int sample_size,
                                        std::optional<double> win_rate);

    void flush();

private:
    Logger() = default;

    template<typename... Args>
    void log(spdlog::level::level_enum lvl, spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (main_logger_) {
            main_logger_->log(lvl, fmt, std::forward<Args>(args)...);
        }
    }

    std::shared_ptr<spdlog::logger> main_logger_;
    std::shared_ptr<spdlog::logger> signal_logger_;
    bool initialized_ = false;
};

#define LOG_DEBUG(...) ustw::Logger::getInstance().debug(__VA_ARGS__)
#define LOG_INFO(...) ustw::Logger::getInstance().info(__VA_ARGS__)
#define LOG_WARN(...) ustw::Logger::getInstance().warn(__VA_ARGS__)
#define LOG_ERROR(...) ustw::Logger::getInstance().error(__VA_ARGS__)

} // namespace ustw

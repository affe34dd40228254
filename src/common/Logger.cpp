#include "common/Logger.h"
#include "common/PathUtils.h"
#include <filesystem>
#include <sstream>
#include <iomanip>
#include <stdexcept>
#include <vector>

namespace ustw {

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

void Logger::initialize(const std::string& log_dir, const std::string& level) {
    if (initialized_) return;

    const auto lvl = spdlog::level::from_str(level);
    if (lvl == spdlog::level::off && level != "off") {
        throw std::invalid_argument("Unknown log level: " + level);
    }

    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_pattern("[%Y-%m-%d %H:%M:%S] [%^%l%$] %v");
    std::vector<spdlog::sink_ptr> sinks{console_sink};

    std::filesystem::path logs_path;
    try {
        if (!log_dir.empty()) {
            // 상대 경로는 실행 파일 기준
            logs_path = std::filesystem::path(log_dir).is_absolute()
                ? std::filesystem::path(log_dir)
                : utils::PathUtils::resolveRelativePath(log_dir);
            std::filesystem::create_directories(logs_path);

            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                (logs_path / "ustw.log").string(), 1024 * 1024 * 10, 3));

            signal_logger_ = spdlog::daily_logger_mt("signal", (logs_path / "signals.log").string());
            signal_logger_->set_pattern("%v");
        }

        main_logger_ = std::make_shared<spdlog::logger>("main", sinks.begin(), sinks.end());
        main_logger_->set_level(lvl);
        main_logger_->flush_on(spdlog::level::warn);
        spdlog::register_logger(main_logger_);
    } catch (const std::exception& ex) {
        main_logger_.reset();
        signal_logger_.reset();
        spdlog::drop("signal");
        throw std::runtime_error(std::string("Log init failed: ") + ex.what());
    }

    initialized_ = true;
    if (logs_path.empty()) {
        main_logger_->info("Logger initialized (console only, level {})", level);
    } else {
        main_logger_->info("Logger initialized, directory {} (level {})", logs_path.string(), level);
    }
}

std::string Logger::formatSignalLine(const std::string& date, const std::string& instrument,
                                     const std::string& grade, double confidence, int sample_size,
                                     std::optional<double> win_rate) {
    std::ostringstream oss;
    oss << date << "," << instrument << "," << grade << ","
        << std::fixed << std::setprecision(4) << confidence << ","
        << sample_size << ",";
    if (win_rate) {
        oss << std::fixed << std::setprecision(4) << *win_rate;
    }
    return oss.str();
}

void Logger::logSignal(const std::string& date, const std::string& instrument, const std::string& grade,
                       double confidence, int sample_size, std::optional<double> win_rate) {
    if (signal_logger_) {
        signal_logger_->info(formatSignalLine(date, instrument, grade, confidence, sample_size, win_rate));
    }
}

void Logger::flush() {
    if (main_logger_) main_logger_->flush();
    if (signal_logger_) signal_logger_->flush();
}

} // namespace ustw

#include "common/Logger.h"
#include "common/PathUtils.h"
#include <filesystem>
#include <sstream>
#include <iomanip>
#include <stdexcept>

namespace replaylab {

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

void Logger::initialize(const std::string& log_dir, const std::string& level) {
    if (initialized_) return;

    std::filesystem::path logs_path;
    if (std::filesystem::path(log_dir).is_absolute()) {
        logs_path = log_dir;
    } else {
        logs_path = utils::PathUtils::resolveRelativePath(log_dir);
    }

    try {
        std::filesystem::create_directories(logs_path);

        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_pattern("[%Y-%m-%d %H:%M:%S] [%^%l%$] %v");

        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            (logs_path / "replaylab.log").string(), 1024 * 1024 * 10, 3
        );

        std::vector<spdlog::sink_ptr> sinks{console_sink, file_sink};
        main_logger_ = std::make_shared<spdlog::logger>("main", sinks.begin(), sinks.end());
        main_logger_->set_level(spdlog::level::from_str(level));
        main_logger_->flush_on(spdlog::level::warn);
        spdlog::register_logger(main_logger_);

        trade_logger_ = spdlog::daily_logger_mt("trade", (logs_path / "trades.log").string());
        trade_logger_->set_pattern("%v");

        initialized_ = true;
        main_logger_->info("Logger initialized");
        main_logger_->info("Log directory: {}", logs_path.string());

    } catch (const std::exception& ex) {
        throw std::runtime_error(std::string("Log init failed: ") + ex.what());
    }
}

void Logger::setLevel(const std::string& level) {
    const auto lvl = spdlog::level::from_str(level);
    if (main_logger_) {
        main_logger_->set_level(lvl);
    } else {
        spdlog::set_level(lvl);
    }
}

void Logger::logTrade(const std::string& strategy, const std::string& side,
                      double entry_price, double exit_price, double size,
                      double net_pnl, const std::string& exit_reason) {
    if (trade_logger_) {
        std::ostringstream oss;
        oss << strategy << "," << side << ","
            << std::fixed << std::setprecision(8) << entry_price << ","
            << std::fixed << std::setprecision(8) << exit_price << ","
            << std::fixed << std::setprecision(8) << size << ","
            << std::fixed << std::setprecision(2) << net_pnl << ","
            << exit_reason;
        trade_logger_->info(oss.str());
    }
}

} // namespace replaylab

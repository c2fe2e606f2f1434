#include "fwdiff/io/Logger.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <algorithm>
#include <cctype>
#include <iostream>
#include <stdexcept>
#include <vector>

namespace fwdiff::io {

Logger::Logger() {
    // Initialize with default settings
    initialize();
}

Logger* Logger::getInstance() {
    static Logger instance;
    return &instance;
}

void Logger::initialize(const std::string& logFile, Level consoleLevel, Level fileLevel) {
    try {
        // Console sink
        auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console_sink->set_level(static_cast<spdlog::level::level_enum>(consoleLevel));
        console_sink->set_pattern("[%H:%M:%S.%e] [%n] [%^%l%$] %v");

        std::vector<spdlog::sink_ptr> sinks{console_sink};

        // File sink
        if (!logFile.empty()) {
            auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(logFile, true);
            file_sink->set_level(static_cast<spdlog::level::level_enum>(fileLevel));
            file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] [%t] %v");
            sinks.push_back(file_sink);
        }

        if (logger_) {
            spdlog::drop(logger_->name());
        }

        logger_ = std::make_shared<spdlog::logger>("fwdiff", sinks.begin(), sinks.end());
        Level loggerLevel = logFile.empty() ? consoleLevel : std::min(consoleLevel, fileLevel);
        logger_->set_level(static_cast<spdlog::level::level_enum>(loggerLevel));
        logger_->flush_on(spdlog::level::warn);

        spdlog::register_logger(logger_);

    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Logger initialization failed: " << ex.what() << std::endl;
        if (!logger_) {
            logger_ = spdlog::stderr_color_mt("fwdiff");
        }
    }
}

void Logger::setLevel(Level level) {
    logger_->set_level(static_cast<spdlog::level::level_enum>(level));
    // The console sink is always created first
    logger_->sinks().front()->set_level(static_cast<spdlog::level::level_enum>(level));
}

Logger::Level Logger::level() const {
    return static_cast<Level>(logger_->level());
}

Logger::Level Logger::consoleLevel() const {
    return static_cast<Level>(logger_->sinks().front()->level());
}

std::optional<Logger::Level> Logger::fileLevel() const {
    if (logger_->sinks().size() < 2) {
        return std::nullopt;
    }
    return static_cast<Level>(logger_->sinks()[1]->level());
}

Logger::Level Logger::parseLevel(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "trace") return Level::TRACE;
    if (lower == "debug") return Level::DEBUG;
    if (lower == "info") return Level::INFO;
    if (lower == "warn" || lower == "warning") return Level::WARN;
    if (lower == "error") return Level::ERROR;
    if (lower == "critical") return Level::CRITICAL;
    if (lower == "off") return Level::OFF;

    throw std::invalid_argument("Unknown log level: " + name);
}

} // namespace fwdiff::io

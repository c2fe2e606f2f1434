#pragma once

#include "fwdiff/core/Types.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/fmt/ostr.h>
#include <chrono>
#include <memory>
#include <optional>
#include <sstream>
#include <string>

namespace fwdiff::io {

// Logger wrapper class
class Logger {
public:
    enum class Level {
        TRACE = SPDLOG_LEVEL_TRACE,
        DEBUG = SPDLOG_LEVEL_DEBUG,
        INFO = SPDLOG_LEVEL_INFO,
        WARN = SPDLOG_LEVEL_WARN,
        ERROR = SPDLOG_LEVEL_ERROR,
        CRITICAL = SPDLOG_LEVEL_CRITICAL,
        OFF = SPDLOG_LEVEL_OFF
    };

    // Get singleton instance
    static Logger* getInstance();

    // (Re)initialize sinks. An empty logFile keeps the console sink only.
    void initialize(const std::string& logFile = "",
                    Level consoleLevel = Level::WARN,
                    Level fileLevel = Level::DEBUG);

    // Logging functions
    template<typename... Args>
    void trace(const std::string& fmt, Args&&... args) {
        logger_->trace(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void debug(const std::string& fmt, Args&&... args) {
        logger_->debug(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void info(const std::string& fmt, Args&&... args) {
        logger_->info(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void warn(const std::string& fmt, Args&&... args) {
        logger_->warn(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void error(const std::string& fmt, Args&&... args) {
        logger_->error(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void critical(const std::string& fmt, Args&&... args) {
        logger_->critical(fmt, std::forward<Args>(args)...);
    }

    // Set the logger and console level; a file sink keeps its own level
    void setLevel(Level level);
    Level level() const;

    Level consoleLevel() const;
    std::optional<Level> fileLevel() const;

    // Parse "trace", "debug", ..., "off"
    static Level parseLevel(const std::string& name);

    // Flush logger
    void flush() {
        logger_->flush();
    }

    // Performance timer
    class Timer {
    public:
        Timer(const std::string& name, Logger* logger = getInstance())
            : name_(name), logger_(logger), start_(std::chrono::high_resolution_clock::now()) {
            logger_->trace("Timer '{}' started", name_);
        }

        ~Timer() {
            logger_->debug("Timer '{}' elapsed: {:.3f} ms", name_, elapsed() * 1000.0);
        }

        Real elapsed() const {
            auto now = std::chrono::high_resolution_clock::now();
            auto duration = std::chrono::duration_cast<std::chrono::microseconds>(now - start_);
            return duration.count() / Real(1.0e6);  // Return seconds
        }

    private:
        std::string name_;
        Logger* logger_;
        std::chrono::high_resolution_clock::time_point start_;
    };

    // Create timer
    std::unique_ptr<Timer> createTimer(const std::string& name) {
        return std::make_unique<Timer>(name, this);
    }

private:
    std::shared_ptr<spdlog::logger> logger_;

    Logger();

    // Delete copy constructor and assignment
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
};

// Convenience macros
#define FWDIFF_LOG_TRACE(...) fwdiff::io::Logger::getInstance()->trace(__VA_ARGS__)
#define FWDIFF_LOG_DEBUG(...) fwdiff::io::Logger::getInstance()->debug(__VA_ARGS__)
#define FWDIFF_LOG_INFO(...) fwdiff::io::Logger::getInstance()->info(__VA_ARGS__)
#define FWDIFF_LOG_WARN(...) fwdiff::io::Logger::getInstance()->warn(__VA_ARGS__)
#define FWDIFF_LOG_ERROR(...) fwdiff::io::Logger::getInstance()->error(__VA_ARGS__)

#define FWDIFF_LOG_TIMER(name) auto _timer_##__LINE__ = fwdiff::io::Logger::getInstance()->createTimer(name)

} // namespace fwdiff::io

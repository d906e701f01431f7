#pragma once
#include "ILogger.hpp"
#include <string>
#include <mutex>
#include <atomic>

// 控制台日志，错误输出到stderr
class ConsoleLogger : public ILogger {
private:
    std::atomic<LogLevel> level;
    std::mutex outputMutex;

public:
    explicit ConsoleLogger(LogLevel minLevel = LogLevel::INFO);

    void info(const std::string& message) override;

    void error(const std::string& message) override;

    void warn(const std::string& message) override;

    void debug(const std::string& message) override;

    void setLogLevel(LogLevel newLevel) override;

    LogLevel getLogLevel() const override;

    void log(LogLevel messageLevel, const std::string& message) override;
};

#pragma once
#include "ILogger.hpp"
#include <string>
#include <functional>
#include <atomic>

using LogCallback = std::function<void(const std::string&)>;

// 将日志转发给外部回调（单向通知，不关心返回）
class CallbackLogger : public ILogger {
private:
    LogCallback callback;
    std::atomic<LogLevel> level;

public:
    explicit CallbackLogger(LogCallback onLog, LogLevel minLevel = LogLevel::INFO);

    void info(const std::string& message) override;

    void error(const std::string& message) override;

    void warn(const std::string& message) override;

    void debug(const std::string& message) override;

    void setLogLevel(LogLevel newLevel) override;

    LogLevel getLogLevel() const override;

    void log(LogLevel messageLevel, const std::string& message) override;
};

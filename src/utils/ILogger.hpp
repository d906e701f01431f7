#pragma once
#include <string>

enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR_LEVEL
};

inline const char* toString(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARNING: return "WARN";
        case LogLevel::ERROR_LEVEL: return "ERROR";
        default: return "UNKNOWN";
    }
}

// 低于阈值的消息被丢弃
inline bool isLevelEnabled(LogLevel messageLevel, LogLevel minLevel) {
    return static_cast<int>(messageLevel) >= static_cast<int>(minLevel);
}

// 备份过程的日志出口，实现需要可以从定时器线程调用
class ILogger {
public:
    virtual ~ILogger() = default;
    virtual void info(const std::string& message) = 0;

    virtual void error(const std::string& message) = 0;

    virtual void warn(const std::string& message) = 0;

    virtual void debug(const std::string& message) = 0;

    virtual void setLogLevel(LogLevel level) = 0;

    virtual LogLevel getLogLevel() const = 0;

    virtual void log(LogLevel level, const std::string& message) = 0;
};

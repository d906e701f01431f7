#include "CallbackLogger.hpp"
#include <utility>

CallbackLogger::CallbackLogger(LogCallback onLog, LogLevel minLevel)
    : callback(std::move(onLog)), level(minLevel) {}

void CallbackLogger::info(const std::string& message) {
    log(LogLevel::INFO, message);
}

void CallbackLogger::error(const std::string& message) {
    log(LogLevel::ERROR_LEVEL, message);
}

void CallbackLogger::warn(const std::string& message) {
    log(LogLevel::WARNING, message);
}

void CallbackLogger::debug(const std::string& message) {
    log(LogLevel::DEBUG, message);
}

void CallbackLogger::setLogLevel(LogLevel newLevel) {
    level = newLevel;
}

LogLevel CallbackLogger::getLogLevel() const {
    return level;
}

void CallbackLogger::log(LogLevel messageLevel, const std::string& message) {
    if (!callback || !isLevelEnabled(messageLevel, level.load())) {
        return;
    }
    callback(message);
}

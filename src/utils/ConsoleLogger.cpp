// src/utils/ConsoleLogger.cpp
#include "ConsoleLogger.hpp"
#include <iostream>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

static std::string getCurrentTime() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::tm timeStruct{};
#ifdef _WIN32
    localtime_s(&timeStruct, &time_t);
#else
    localtime_r(&time_t, &timeStruct);
#endif
    std::ostringstream oss;
    oss << std::put_time(&timeStruct, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

ConsoleLogger::ConsoleLogger(LogLevel minLevel) : level(minLevel) {}

void ConsoleLogger::info(const std::string& message) {
    log(LogLevel::INFO, message);
}

void ConsoleLogger::error(const std::string& message) {
    log(LogLevel::ERROR_LEVEL, message);
}

void ConsoleLogger::warn(const std::string& message) {
    log(LogLevel::WARNING, message);
}

void ConsoleLogger::debug(const std::string& message) {
    log(LogLevel::DEBUG, message);
}

void ConsoleLogger::setLogLevel(LogLevel newLevel) {
    level = newLevel;
}

LogLevel ConsoleLogger::getLogLevel() const {
    return level;
}

void ConsoleLogger::log(LogLevel messageLevel, const std::string& message) {
    if (!isLevelEnabled(messageLevel, level.load())) {
        return;
    }

    std::lock_guard<std::mutex> lock(outputMutex);
    std::ostream& out = (messageLevel == LogLevel::ERROR_LEVEL) ? std::cerr : std::cout;
    out << "[" << getCurrentTime() << "] [" << toString(messageLevel) << "] " << message << std::endl;
}

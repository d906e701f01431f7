#pragma once
#include <functional>
#include <mutex>
#include <optional>
#include <filesystem>
#include "Types.hpp"

class ILogger;

namespace fs = std::filesystem;

// 一次备份会话：持有配置和水位线，同一时刻只允许一次备份执行
class BackupSession {
public:
    using Clock = std::function<fs::file_time_type()>;

    BackupSession(const BackupConfig& config, ILogger* logger, Clock clock = nullptr);

    BackupSession(const BackupSession&) = delete;
    BackupSession& operator=(const BackupSession&) = delete;

    // 执行一次备份；仅在完整成功（含无文件的情况）后推进水位线
    PassResult runPass();

    std::optional<fs::file_time_type> getLastBackupTime() const;

    const BackupConfig& getConfig() const;

private:
    const BackupConfig config;
    ILogger* logger;
    Clock clock;

    BackupState state;
    mutable std::mutex stateMutex;
    std::mutex passMutex;
};

#pragma once
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <filesystem>
#include "Types.hpp"
#include "../utils/CallbackLogger.hpp"

class TimerBackupManager;

namespace fs = std::filesystem;

// 对外接口：启动/停止定时备份、从归档还原
// 所有进度和状态都通过onLog回调通知
class BackupService {
private:
    std::mutex serviceMutex;
    std::unique_ptr<CallbackLogger> logger;
    std::unique_ptr<TimerBackupManager> manager;
    std::optional<BackupError> lastError;

public:
    BackupService();
    ~BackupService();

    BackupService(const BackupService&) = delete;
    BackupService& operator=(const BackupService&) = delete;

    bool start(const fs::path& sourceRoot, const fs::path& backupRoot, int intervalMinutes, LogCallback onLog);

    void stop();

    bool isRunning();

    std::optional<BackupError> getLastError();

    static RestoreResult restore(const fs::path& archivePath, const fs::path& destinationDir, LogCallback onLog);

    // 在独立线程上还原
    static std::future<RestoreResult> restoreAsync(const fs::path& archivePath, const fs::path& destinationDir,
                                                   LogCallback onLog);
};

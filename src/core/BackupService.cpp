#include "BackupService.hpp"
#include "BackupEngine.hpp"
#include "TimerBackupManager.hpp"
#include <exception>
#include <iostream>
#include <utility>

BackupService::BackupService() {}

BackupService::~BackupService() {
    stop();
}

bool BackupService::start(const fs::path& sourceRoot, const fs::path& backupRoot, int intervalMinutes,
                          LogCallback onLog) {
    std::lock_guard<std::mutex> lock(serviceMutex);

    if (manager && manager->isRunning()) {
        lastError = BackupError{BackupErrorKind::AlreadyRunning, "Backup service is already running."};
        if (onLog) {
            onLog(lastError->message);
        }
        return false;
    }

    auto newLogger = std::make_unique<CallbackLogger>(std::move(onLog));
    auto newManager = std::make_unique<TimerBackupManager>(newLogger.get());
    if (!newManager->start(BackupConfig(sourceRoot, backupRoot, intervalMinutes))) {
        lastError = newManager->getLastError();
        return false;
    }

    // 旧的管理器已停止，先释放它再替换日志对象
    manager = std::move(newManager);
    logger = std::move(newLogger);
    lastError.reset();
    return true;
}

void BackupService::stop() {
    std::lock_guard<std::mutex> lock(serviceMutex);
    if (manager) {
        manager->stop();
    }
}

bool BackupService::isRunning() {
    std::lock_guard<std::mutex> lock(serviceMutex);
    return manager && manager->isRunning();
}

std::optional<BackupError> BackupService::getLastError() {
    std::lock_guard<std::mutex> lock(serviceMutex);
    if (lastError) {
        return lastError;
    }
    if (manager) {
        return manager->getLastError();
    }
    return std::nullopt;
}

RestoreResult BackupService::restore(const fs::path& archivePath, const fs::path& destinationDir,
                                     LogCallback onLog) {
    // 回调抛出的异常不能传给调用方
    try {
        CallbackLogger restoreLogger(std::move(onLog));
        return BackupEngine::restore(archivePath, destinationDir, &restoreLogger);
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] Restore aborted by log callback: " << e.what() << std::endl;
        RestoreResult result;
        result.error = BackupError{BackupErrorKind::RestoreFailure, e.what()};
        return result;
    }
}

std::future<RestoreResult> BackupService::restoreAsync(const fs::path& archivePath, const fs::path& destinationDir,
                                                       LogCallback onLog) {
    return std::async(std::launch::async, [archivePath, destinationDir, onLog]() {
        return BackupService::restore(archivePath, destinationDir, onLog);
    });
}

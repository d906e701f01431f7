#include "BackupSession.hpp"
#include "tasks/BackupTask.hpp"
#include "../utils/ILogger.hpp"
#include <utility>

BackupSession::BackupSession(const BackupConfig& config, ILogger* logger, Clock clock)
    : config(config), logger(logger), clock(std::move(clock)) {
    if (!this->clock) {
        this->clock = []() { return fs::file_time_type::clock::now(); };
    }
}

PassResult BackupSession::runPass() {
    std::lock_guard<std::mutex> passLock(passMutex);

    const fs::file_time_type now = clock();
    BackupTask task(config, getLastBackupTime(), now, logger);
    if (task.execute()) {
        std::lock_guard<std::mutex> lock(stateMutex);
        // 时钟回拨时保持水位线不减
        if (!state.lastBackupTime.has_value() || now > *state.lastBackupTime) {
            state.lastBackupTime = now;
        }
    }
    return task.getResult();
}

std::optional<fs::file_time_type> BackupSession::getLastBackupTime() const {
    std::lock_guard<std::mutex> lock(stateMutex);
    return state.lastBackupTime;
}

const BackupConfig& BackupSession::getConfig() const {
    return config;
}

#pragma once
#include <string>
#include <filesystem>
#include <optional>
#include <cstddef>

namespace fs = std::filesystem;

enum class TaskStatus {
    PENDING,
    RUNNING,
    COMPLETED,
    FAILED
};

// 错误分类
enum class BackupErrorKind {
    InvalidConfig,   // 配置无效，会话未启动
    AlreadyRunning,  // 重复启动
    PassFailure,     // 单次备份失败，会话继续
    RestoreFailure   // 还原失败
};

struct BackupError {
    BackupErrorKind kind;
    std::string message;
};

// 备份配置，会话期间不可变
struct BackupConfig {
    fs::path sourceRoot;   // 源目录
    fs::path backupRoot;   // 备份目录
    int intervalMinutes;   // 备份间隔（分钟）

    BackupConfig() : intervalMinutes(0) {}
    BackupConfig(const fs::path& source, const fs::path& backup, int interval)
        : sourceRoot(source), backupRoot(backup), intervalMinutes(interval) {}
};

// 备份状态，nullopt 表示从未备份
struct BackupState {
    std::optional<fs::file_time_type> lastBackupTime;
};

// 单次备份结果
struct PassResult {
    TaskStatus status = TaskStatus::PENDING;
    bool archiveWritten = false;
    fs::path archivePath;
    std::size_t fileCount = 0;
    std::optional<BackupError> error;
};

// 还原结果
struct RestoreResult {
    bool success = false;
    std::size_t restoredCount = 0;
    std::optional<BackupError> error;
};

inline std::string toString(TaskStatus status) {
    switch (status) {
        case TaskStatus::PENDING: return "PENDING";
        case TaskStatus::RUNNING: return "RUNNING";
        case TaskStatus::COMPLETED: return "COMPLETED";
        case TaskStatus::FAILED: return "FAILED";
        default: return "UNKNOWN";
    }
}

inline std::string toString(BackupErrorKind kind) {
    switch (kind) {
        case BackupErrorKind::InvalidConfig: return "InvalidConfig";
        case BackupErrorKind::AlreadyRunning: return "AlreadyRunning";
        case BackupErrorKind::PassFailure: return "PassFailure";
        case BackupErrorKind::RestoreFailure: return "RestoreFailure";
        default: return "UNKNOWN";
    }
}

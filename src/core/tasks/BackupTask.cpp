#include "BackupTask.hpp"
#include "../../utils/FileSystem.hpp"
#include "../../utils/ZipPackager.hpp"
#include <exception>

BackupTask::BackupTask(const BackupConfig& config, const std::optional<fs::file_time_type>& lastBackupTime,
                       fs::file_time_type now, ILogger* log)
    : config(config), lastBackupTime(lastBackupTime), passTime(now), status(TaskStatus::PENDING), logger(log) {}

bool BackupTask::execute() {
    logger->info("Scanning folder: " + config.sourceRoot.string() + " at " +
                 FileSystem::formatFileTime(passTime, "%Y-%m-%d %H:%M:%S"));
    status = TaskStatus::RUNNING;
    result = PassResult();
    result.status = status;

    fs::path partPath;
    try {
        std::vector<FileCandidate> candidates;
        std::string errorMessage;
        if (!scan(candidates, errorMessage)) {
            return fail(errorMessage);
        }

        if (candidates.empty()) {
            logger->info("No new or modified files to back up.");
            status = TaskStatus::COMPLETED;
            result.status = status;
            return true;
        }

        logger->info("Found " + std::to_string(candidates.size()) + " new or modified files");

        fs::path archivePath = config.backupRoot / makeArchiveName(passTime);
        // 归档写出后不可变，同名文件已存在时本次失败，水位线不动，下次重试
        if (FileSystem::exists(archivePath)) {
            return fail("Archive already exists: " + archivePath.string());
        }

        partPath = archivePath;
        partPath += ".part";

        ZipPackager packager;
        if (!packager.packageFiles(candidates, partPath)) {
            FileSystem::removeFile(partPath);
            return fail(packager.getLastError());
        }

        if (!FileSystem::renameFile(partPath, archivePath, errorMessage)) {
            FileSystem::removeFile(partPath);
            return fail(errorMessage);
        }

        for (const auto& candidate : candidates) {
            logger->debug("Archived: " + candidate.toString());
        }
        logger->info("Backup created: " + archivePath.string());

        result.archiveWritten = true;
        result.archivePath = archivePath;
        result.fileCount = candidates.size();
        status = TaskStatus::COMPLETED;
        result.status = status;
        return true;
    } catch (const std::exception& e) {
        if (!partPath.empty()) {
            FileSystem::removeFile(partPath);
        }
        return fail(e.what());
    }
}

bool BackupTask::scan(std::vector<FileCandidate>& candidates, std::string& errorMessage) const {
    std::vector<fs::path> files;
    if (!FileSystem::getRegularFiles(config.sourceRoot, files, errorMessage)) {
        return false;
    }

    // 文件在列举后被删除时FileCandidate会抛出filesystem_error，由execute统一处理
    for (const auto& file : files) {
        FileCandidate candidate(file, config.sourceRoot);
        if (isCandidate(candidate.getLastModifiedTime(), lastBackupTime)) {
            candidates.push_back(candidate);
        }
    }
    return true;
}

bool BackupTask::isCandidate(fs::file_time_type modifiedTime,
                             const std::optional<fs::file_time_type>& lastBackupTime) {
    return !lastBackupTime.has_value() || modifiedTime > *lastBackupTime;
}

std::string BackupTask::makeArchiveName(fs::file_time_type time) {
    return "backup_" + FileSystem::formatFileTime(time, "%Y%m%d_%H%M%S") + ".zip";
}

TaskStatus BackupTask::getStatus() const {
    return status;
}

const PassResult& BackupTask::getResult() const {
    return result;
}

bool BackupTask::fail(const std::string& message) {
    logger->error("Backup pass failed: " + message);
    status = TaskStatus::FAILED;
    result = PassResult();
    result.status = status;
    result.error = BackupError{BackupErrorKind::PassFailure, message};
    return false;
}

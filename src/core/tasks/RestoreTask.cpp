#include "RestoreTask.hpp"
#include "../../utils/FileSystem.hpp"
#include "../../utils/ZipPackager.hpp"
#include <exception>
#include <system_error>

RestoreTask::RestoreTask(const fs::path& archive, const fs::path& destination, ILogger* log)
    : archivePath(archive), restorePath(destination), status(TaskStatus::PENDING), logger(log), restoredCount(0) {}

bool RestoreTask::execute() {
    logger->info("Starting restore: " + archivePath.string() + " -> " + restorePath.string());
    status = TaskStatus::RUNNING;
    restoredCount = 0;
    error.reset();

    std::error_code ec;
    if (!fs::is_regular_file(archivePath, ec)) {
        return fail("Archive does not exist or is not a file: " + archivePath.string());
    }

    std::string errorMessage;
    if (!FileSystem::createDirectories(restorePath, errorMessage)) {
        return fail(errorMessage);
    }

    try {
        ZipPackager packager;
        bool success = packager.unpackFiles(archivePath, restorePath, [this](const fs::path& restoredFile) {
            ++restoredCount;
            logger->info("Restored file: " + restoredFile.string());
        });
        if (!success) {
            return fail(packager.getLastError());
        }
    } catch (const std::exception& e) {
        return fail(e.what());
    }

    logger->info("Restore completed in directory: " + restorePath.string() +
                 " (" + std::to_string(restoredCount) + " files)");
    status = TaskStatus::COMPLETED;
    return true;
}

TaskStatus RestoreTask::getStatus() const {
    return status;
}

std::size_t RestoreTask::getRestoredCount() const {
    return restoredCount;
}

const std::optional<BackupError>& RestoreTask::getError() const {
    return error;
}

RestoreResult RestoreTask::getResult() const {
    RestoreResult result;
    result.success = (status == TaskStatus::COMPLETED);
    result.restoredCount = restoredCount;
    result.error = error;
    return result;
}

bool RestoreTask::fail(const std::string& message) {
    // 部分还原的文件保留在目标目录，由错误信息告知调用方
    std::string fullMessage = message;
    if (restoredCount > 0) {
        fullMessage += " (" + std::to_string(restoredCount) + " files restored before the failure)";
    }
    logger->error("Restore failed: " + fullMessage);
    status = TaskStatus::FAILED;
    error = BackupError{BackupErrorKind::RestoreFailure, fullMessage};
    return false;
}

// core/BackupEngine.cpp
#include "BackupEngine.hpp"
#include "tasks/RestoreTask.hpp"
#include "../utils/FileSystem.hpp"
#include <algorithm>
#include <chrono>
#include <limits>
#include <regex>
#include <system_error>

int BackupEngine::maxIntervalMinutes() {
    const std::chrono::minutes::rep limit =
        std::chrono::duration_cast<std::chrono::minutes>(std::chrono::steady_clock::duration::max()).count() / 2;
    const std::chrono::minutes::rep intMax = std::numeric_limits<int>::max();
    return static_cast<int>(std::min(limit, intMax));
}

bool BackupEngine::validateConfig(const BackupConfig& config, BackupError& error) {
    error.kind = BackupErrorKind::InvalidConfig;

    if (config.intervalMinutes <= 0) {
        error.message = "Backup interval must be a positive number of minutes, got " +
                        std::to_string(config.intervalMinutes);
        return false;
    }
    if (config.intervalMinutes > maxIntervalMinutes()) {
        error.message = "Backup interval is too large: " + std::to_string(config.intervalMinutes) +
                        " minutes (maximum " + std::to_string(maxIntervalMinutes()) + ")";
        return false;
    }
    if (config.sourceRoot.empty()) {
        error.message = "Source directory is not set";
        return false;
    }
    if (!FileSystem::isDirectory(config.sourceRoot)) {
        error.message = "Source directory does not exist or is not a directory: " + config.sourceRoot.string();
        return false;
    }
    if (config.backupRoot.empty()) {
        error.message = "Backup directory is not set";
        return false;
    }
    if (FileSystem::exists(config.backupRoot) && !FileSystem::isDirectory(config.backupRoot)) {
        error.message = "Backup path exists and is not a directory: " + config.backupRoot.string();
        return false;
    }

    std::string createError;
    if (!FileSystem::createDirectories(config.backupRoot, createError)) {
        error.message = createError;
        return false;
    }
    return true;
}

RestoreResult BackupEngine::restore(const fs::path& archivePath, const fs::path& destinationDir, ILogger* logger) {
    RestoreTask task(archivePath, destinationDir, logger);
    bool success = task.execute();
    RestoreResult result = task.getResult();
    result.success = success;
    return result;
}

std::vector<fs::path> BackupEngine::listArchives(const fs::path& backupRoot) {
    std::vector<fs::path> archives;
    std::error_code ec;
    for (fs::directory_iterator it(backupRoot, ec), end; !ec && it != end; it.increment(ec)) {
        if (it->is_regular_file(ec) && isArchiveName(it->path().filename().string())) {
            archives.push_back(it->path());
        }
    }
    std::sort(archives.begin(), archives.end());
    return archives;
}

bool BackupEngine::isArchiveName(const std::string& fileName) {
    static const std::regex pattern(R"(^backup_\d{8}_\d{6}\.zip$)");
    return std::regex_match(fileName, pattern);
}

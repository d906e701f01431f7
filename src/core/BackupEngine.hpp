#pragma once
#include <string>
#include <vector>
#include <filesystem>
#include "Types.hpp"

class ILogger;

namespace fs = std::filesystem;

class BackupEngine {
public:
    // 间隔上限，保证换算成steady_clock的纳秒后加上时间点也不溢出
    static int maxIntervalMinutes();

    // 校验配置；备份目录不存在时创建
    static bool validateConfig(const BackupConfig& config, BackupError& error);

    static RestoreResult restore(const fs::path& archivePath, const fs::path& destinationDir, ILogger* logger);

    // 备份目录中符合命名规则的归档，按文件名（即时间）排序
    static std::vector<fs::path> listArchives(const fs::path& backupRoot);

    static bool isArchiveName(const std::string& fileName);
};

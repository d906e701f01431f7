#pragma once
#include <string>
#include <vector>
#include <optional>
#include <filesystem>
#include "../Types.hpp"
#include "../models/FileCandidate.hpp"
#include "../../utils/ILogger.hpp"

namespace fs = std::filesystem;

// 单次增量备份：扫描源目录，把新增/修改的文件写入一个zip
// 不修改水位线，由BackupSession在成功后更新
class BackupTask {
private:
    BackupConfig config;
    std::optional<fs::file_time_type> lastBackupTime;
    fs::file_time_type passTime;

    // 当前任务状态
    TaskStatus status;
    ILogger* logger;
    PassResult result;

    bool fail(const std::string& message);

public:
    BackupTask(const BackupConfig& config, const std::optional<fs::file_time_type>& lastBackupTime,
               fs::file_time_type now, ILogger* log);
    bool execute();
    TaskStatus getStatus() const;
    const PassResult& getResult() const;

    // 收集候选文件
    bool scan(std::vector<FileCandidate>& candidates, std::string& errorMessage) const;

    // 修改时间严格大于水位线才算候选；从未备份时全部选中
    static bool isCandidate(fs::file_time_type modifiedTime,
                            const std::optional<fs::file_time_type>& lastBackupTime);

    // backup_yyyyMMdd_HHmmss.zip
    static std::string makeArchiveName(fs::file_time_type time);
};

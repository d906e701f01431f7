#pragma once
#include <string>
#include <optional>
#include <cstddef>
#include <filesystem>
#include "../Types.hpp"
#include "../../utils/ILogger.hpp"

namespace fs = std::filesystem;

// 将一个备份zip还原到目标目录，与备份会话无共享状态
class RestoreTask {
private:
    fs::path archivePath;
    fs::path restorePath;
    TaskStatus status;
    ILogger* logger;
    std::size_t restoredCount;
    std::optional<BackupError> error;

    bool fail(const std::string& message);

public:
    RestoreTask(const fs::path& archive, const fs::path& destination, ILogger* log);
    bool execute();
    TaskStatus getStatus() const;
    std::size_t getRestoredCount() const;
    const std::optional<BackupError>& getError() const;
    RestoreResult getResult() const;
};

#pragma once
#include <string>
#include <filesystem>
#include <vector>
#include <cstdint>

namespace fs = std::filesystem;

// 本次备份中被选中的文件，每次扫描重新生成
class FileCandidate {
private:
    fs::path absolutePath;
    std::string relativePath;    // 相对源目录，统一使用'/'分隔
    fs::file_time_type lastModifiedTime;
    uint64_t fileSize;

public:
    FileCandidate();
    FileCandidate(const fs::path& path, const fs::path& sourceRoot);

    const fs::path& getAbsolutePath() const;
    const std::string& getRelativePath() const;
    fs::file_time_type getLastModifiedTime() const;
    uint64_t getFileSize() const;

    // 读取文件全部内容
    bool loadFileData(std::vector<char>& data) const;

    std::string toString() const;

    bool operator==(const FileCandidate& other) const;
};

// 压缩包中的一条记录
struct ArchiveEntry {
    std::string name;
    std::vector<char> data;
};

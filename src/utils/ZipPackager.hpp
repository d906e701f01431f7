#pragma once
#include <string>
#include <vector>
#include <functional>
#include <filesystem>

#include "../core/models/FileCandidate.hpp"

namespace fs = std::filesystem;

// 基于libarchive的zip读写
class ZipPackager {
public:
    using EntryCallback = std::function<void(const fs::path&)>;

    ZipPackager();
    ~ZipPackager();

    // 将文件集合写入zip，条目名为相对路径
    bool packageFiles(const std::vector<FileCandidate>& inputFiles, const fs::path& outputFile);

    // 写入已在内存中的条目
    bool packageEntries(const std::vector<ArchiveEntry>& entries, const fs::path& outputFile);

    // 按存储顺序解包到目录，每写完一个文件调用onEntry；遇到第一个错误即停止
    bool unpackFiles(const fs::path& inputFile, const fs::path& outputDir,
                     const EntryCallback& onEntry = nullptr);

    // 列出条目名
    bool listEntries(const fs::path& inputFile, std::vector<std::string>& names);

    const std::string& getLastError() const;

private:
    std::string lastError;
};

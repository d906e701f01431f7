#include "FileCandidate.hpp"
#include "../../utils/FileSystem.hpp"
#include <fstream>
#include <sstream>

FileCandidate::FileCandidate() : fileSize(0) {}

// 注意：不解析符号链接，调用方保证path是普通文件
FileCandidate::FileCandidate(const fs::path& path, const fs::path& sourceRoot)
    : absolutePath(path), fileSize(0) {
    this->relativePath = FileSystem::getRelativePath(path, sourceRoot);
    this->lastModifiedTime = fs::last_write_time(path);
    this->fileSize = fs::file_size(path);
}

const fs::path& FileCandidate::getAbsolutePath() const {
    return this->absolutePath;
}

const std::string& FileCandidate::getRelativePath() const {
    return this->relativePath;
}

fs::file_time_type FileCandidate::getLastModifiedTime() const {
    return this->lastModifiedTime;
}

uint64_t FileCandidate::getFileSize() const {
    return this->fileSize;
}

bool FileCandidate::loadFileData(std::vector<char>& data) const {
    std::ifstream file(this->absolutePath, std::ios::binary);
    if (!file) {
        return false;
    }

    data.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
    return !file.bad();
}

std::string FileCandidate::toString() const {
    std::ostringstream oss;
    oss << this->relativePath << " (" << this->fileSize << " bytes)";
    return oss.str();
}

bool FileCandidate::operator==(const FileCandidate& other) const {
    return this->absolutePath == other.absolutePath
        && this->relativePath == other.relativePath
        && this->lastModifiedTime == other.lastModifiedTime;
}

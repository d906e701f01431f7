#include "FileSystem.hpp"
#include <algorithm>
#include <chrono>
#include <ctime>

namespace fs = std::filesystem;

namespace {

// p是否位于base之下（p == base 也算）
bool isWithin(const fs::path& base, const fs::path& p) {
    fs::path rel = p.lexically_relative(base);
    return !rel.empty() && *rel.begin() != "..";
}

}

bool FileSystem::exists(const fs::path& path) {
    std::error_code ec;
    fs::file_status status = fs::symlink_status(path, ec);
    return !ec && status.type() != fs::file_type::not_found;
}

bool FileSystem::isDirectory(const fs::path& path) {
    std::error_code ec;
    return fs::is_directory(path, ec) && !ec;
}

bool FileSystem::isRegularFile(const fs::path& path) {
    std::error_code ec;
    fs::file_status status = fs::symlink_status(path, ec);
    return !ec && fs::is_regular_file(status);
}

bool FileSystem::createDirectories(const fs::path& path, std::string& errorMessage) {
    std::error_code ec;
    if (fs::is_directory(path, ec)) {
        return true;
    }

    fs::create_directories(path, ec);
    if (ec) {
        errorMessage = "Failed to create directory " + path.string() + " (" + ec.message() + ")";
        return false;
    }
    return true;
}

bool FileSystem::getRegularFiles(const fs::path& directory, std::vector<fs::path>& files,
                                 std::string& errorMessage) {
    std::error_code ec;
    fs::recursive_directory_iterator it(directory, fs::directory_options::none, ec);
    if (ec) {
        errorMessage = "Failed to open directory " + directory.string() + " (" + ec.message() + ")";
        return false;
    }

    for (fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            break;
        }
        // 不解析链接，链接本身和特殊文件都会被跳过
        if (isRegularFile(it->path())) {
            files.push_back(it->path());
        }
    }

    if (ec) {
        errorMessage = "Failed to traverse " + directory.string() + " (" + ec.message() + ")";
        return false;
    }

    std::sort(files.begin(), files.end(), [](const fs::path& a, const fs::path& b) {
        return a.generic_string() < b.generic_string();
    });
    return true;
}

std::string FileSystem::getRelativePath(const fs::path& path, const fs::path& base) {
    return path.lexically_relative(base).generic_string();
}

bool FileSystem::resolveWithin(const fs::path& root, const std::string& entryName, fs::path& resolved) {
    if (entryName.empty()) {
        return false;
    }

    // Windows生成的zip可能使用'\'
    std::string normalizedName = entryName;
    std::replace(normalizedName.begin(), normalizedName.end(), '\\', '/');

    fs::path entry(normalizedName);
    if (entry.is_absolute() || entry.has_root_name() || entry.has_root_directory()) {
        return false;
    }
    for (const auto& part : entry) {
        if (part == "..") {
            return false;
        }
    }

    std::error_code ec;
    fs::path base = fs::weakly_canonical(root, ec);
    if (ec) {
        return false;
    }

    fs::path target = (base / entry).lexically_normal();
    if (!target.has_filename()) {
        target = target.parent_path();
    }
    fs::path rel = target.lexically_relative(base);
    if (!isWithin(base, target) || rel == ".") {
        return false;
    }

    // 已存在的符号链接目录可能指向root之外
    fs::path parent = fs::weakly_canonical(target.parent_path(), ec);
    if (ec || !isWithin(base, parent)) {
        return false;
    }

    resolved = target;
    return true;
}

std::time_t FileSystem::toTimeT(fs::file_time_type time) {
    // 两个时钟的差值只取一次，同一文件时间在进程内总是得到同一个结果
    static const auto clockOffset =
        std::chrono::duration_cast<std::chrono::nanoseconds>(std::chrono::system_clock::now().time_since_epoch()) -
        std::chrono::duration_cast<std::chrono::nanoseconds>(fs::file_time_type::clock::now().time_since_epoch());
    auto sinceEpoch = std::chrono::duration_cast<std::chrono::nanoseconds>(time.time_since_epoch()) + clockOffset;
    return static_cast<std::time_t>(std::chrono::floor<std::chrono::seconds>(sinceEpoch).count());
}

std::string FileSystem::formatFileTime(fs::file_time_type time, const char* format) {
    std::time_t timeValue = toTimeT(time);

    std::tm timeStruct{};
#ifdef _WIN32
    localtime_s(&timeStruct, &timeValue);
#else
    localtime_r(&timeValue, &timeStruct);
#endif

    char buffer[64];
    std::size_t length = std::strftime(buffer, sizeof(buffer), format, &timeStruct);
    return std::string(buffer, length);
}

bool FileSystem::removeFile(const fs::path& path) {
    std::error_code ec;
    fs::remove(path, ec);
    return !ec;
}

bool FileSystem::renameFile(const fs::path& from, const fs::path& to, std::string& errorMessage) {
    std::error_code ec;
    fs::rename(from, to, ec);
    if (ec) {
        errorMessage = "Failed to rename " + from.string() + " -> " + to.string() + " (" + ec.message() + ")";
        return false;
    }
    return true;
}

#pragma once
#include <string>
#include <vector>
#include <filesystem>
#include <system_error>
#include <ctime>

namespace fs = std::filesystem;

class FileSystem {
public:
    // 检查文件或目录是否存在（不解析符号链接）
    static bool exists(const fs::path& path);

    // 检查是否为目录
    static bool isDirectory(const fs::path& path);

    // 检查是否为普通文件（符号链接、设备文件等都不算）
    static bool isRegularFile(const fs::path& path);

    // 创建目录（包括父目录）
    static bool createDirectories(const fs::path& path, std::string& errorMessage);

    // 递归获取目录下所有普通文件，不跟随符号链接，结果按路径排序
    static bool getRegularFiles(const fs::path& directory, std::vector<fs::path>& files,
                                std::string& errorMessage);

    // 获取相对路径，统一使用'/'分隔
    static std::string getRelativePath(const fs::path& path, const fs::path& base);

    // 将压缩包内的条目名解析为root下的路径，越界时返回false
    static bool resolveWithin(const fs::path& root, const std::string& entryName, fs::path& resolved);

    // 文件时间转换为time_t（秒）
    static std::time_t toTimeT(fs::file_time_type time);

    // 按strftime格式输出文件时间（本地时区）
    static std::string formatFileTime(fs::file_time_type time, const char* format);

    static bool removeFile(const fs::path& path);

    static bool renameFile(const fs::path& from, const fs::path& to, std::string& errorMessage);
};

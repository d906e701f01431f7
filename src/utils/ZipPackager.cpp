#include "ZipPackager.hpp"
#include "FileSystem.hpp"

#include <archive.h>
#include <archive_entry.h>

#include <ctime>
#include <fstream>
#include <memory>

namespace {

struct ArchiveWriteDeleter {
    void operator()(struct archive* a) const { archive_write_free(a); }
};

struct ArchiveReadDeleter {
    void operator()(struct archive* a) const { archive_read_free(a); }
};

struct ArchiveEntryDeleter {
    void operator()(struct archive_entry* e) const { archive_entry_free(e); }
};

using ArchiveWriter = std::unique_ptr<struct archive, ArchiveWriteDeleter>;
using ArchiveReader = std::unique_ptr<struct archive, ArchiveReadDeleter>;
using ArchiveEntryPtr = std::unique_ptr<struct archive_entry, ArchiveEntryDeleter>;

std::string archiveError(struct archive* a, const std::string& context) {
    const char* message = archive_error_string(a);
    return context + ": " + (message ? message : "unknown libarchive error");
}

ArchiveWriter openZipWriter(const fs::path& outputFile, std::string& error) {
    ArchiveWriter writer(archive_write_new());
    if (!writer) {
        error = "Failed to allocate archive writer";
        return nullptr;
    }
    if (archive_write_set_format_zip(writer.get()) != ARCHIVE_OK) {
        error = archiveError(writer.get(), "Failed to select zip format");
        return nullptr;
    }
    if (archive_write_open_filename(writer.get(), outputFile.string().c_str()) != ARCHIVE_OK) {
        error = archiveError(writer.get(), "Failed to create " + outputFile.string());
        return nullptr;
    }
    return writer;
}

bool writeEntry(struct archive* writer, const std::string& name, const std::vector<char>& data,
                std::time_t mtime, std::string& error) {
    ArchiveEntryPtr entry(archive_entry_new());
    if (!entry) {
        error = "Failed to allocate archive entry for " + name;
        return false;
    }

    archive_entry_set_pathname(entry.get(), name.c_str());
    archive_entry_set_filetype(entry.get(), AE_IFREG);
    archive_entry_set_perm(entry.get(), 0644);
    archive_entry_set_size(entry.get(), static_cast<la_int64_t>(data.size()));
    archive_entry_set_mtime(entry.get(), mtime, 0);

    if (archive_write_header(writer, entry.get()) != ARCHIVE_OK) {
        error = archiveError(writer, "Failed to write header for " + name);
        return false;
    }

    // 空文件只写头
    if (!data.empty()) {
        la_ssize_t written = archive_write_data(writer, data.data(), data.size());
        if (written < 0 || static_cast<std::size_t>(written) != data.size()) {
            error = archiveError(writer, "Failed to write data for " + name);
            return false;
        }
    }

    if (archive_write_finish_entry(writer) != ARCHIVE_OK) {
        error = archiveError(writer, "Failed to finish entry " + name);
        return false;
    }
    return true;
}

bool closeZipWriter(ArchiveWriter& writer, const fs::path& outputFile, std::string& error) {
    if (archive_write_close(writer.get()) != ARCHIVE_OK) {
        error = archiveError(writer.get(), "Failed to finalize " + outputFile.string());
        return false;
    }
    writer.reset();
    return true;
}

ArchiveReader openZipReader(const fs::path& inputFile, std::string& error) {
    ArchiveReader reader(archive_read_new());
    if (!reader) {
        error = "Failed to allocate archive reader";
        return nullptr;
    }
    archive_read_support_format_zip(reader.get());
    if (archive_read_open_filename(reader.get(), inputFile.string().c_str(), 10240) != ARCHIVE_OK) {
        error = archiveError(reader.get(), "Failed to open " + inputFile.string());
        return nullptr;
    }
    return reader;
}

// ARCHIVE_WARN 视为可继续
bool isHeaderError(int result) {
    return result != ARCHIVE_OK && result != ARCHIVE_WARN;
}

}

ZipPackager::ZipPackager() {}

ZipPackager::~ZipPackager() {}

bool ZipPackager::packageFiles(const std::vector<FileCandidate>& inputFiles, const fs::path& outputFile) {
    lastError.clear();
    ArchiveWriter writer = openZipWriter(outputFile, lastError);
    if (!writer) {
        return false;
    }

    // 逐个读取，避免整批文件同时驻留内存
    std::vector<char> data;
    for (const auto& file : inputFiles) {
        if (!file.loadFileData(data)) {
            lastError = "Failed to read " + file.getAbsolutePath().string();
            return false;
        }
        if (!writeEntry(writer.get(), file.getRelativePath(), data,
                        FileSystem::toTimeT(file.getLastModifiedTime()), lastError)) {
            return false;
        }
    }

    return closeZipWriter(writer, outputFile, lastError);
}

bool ZipPackager::packageEntries(const std::vector<ArchiveEntry>& entries, const fs::path& outputFile) {
    lastError.clear();
    ArchiveWriter writer = openZipWriter(outputFile, lastError);
    if (!writer) {
        return false;
    }

    std::time_t now = std::time(nullptr);
    for (const auto& entry : entries) {
        if (!writeEntry(writer.get(), entry.name, entry.data, now, lastError)) {
            return false;
        }
    }

    return closeZipWriter(writer, outputFile, lastError);
}

bool ZipPackager::unpackFiles(const fs::path& inputFile, const fs::path& outputDir,
                              const EntryCallback& onEntry) {
    lastError.clear();
    ArchiveReader reader = openZipReader(inputFile, lastError);
    if (!reader) {
        return false;
    }

    struct archive_entry* entry = nullptr;
    std::vector<char> buffer(64 * 1024);

    while (true) {
        int result = archive_read_next_header(reader.get(), &entry);
        if (result == ARCHIVE_EOF) {
            break;
        }
        if (isHeaderError(result)) {
            lastError = archiveError(reader.get(), "Failed to read entry header");
            return false;
        }

        const char* rawName = archive_entry_pathname(entry);
        std::string entryName = rawName ? rawName : "";

        fs::path target;
        if (!FileSystem::resolveWithin(outputDir, entryName, target)) {
            lastError = "Entry escapes destination directory: " + entryName;
            return false;
        }

        auto type = archive_entry_filetype(entry);
        if (type == AE_IFDIR) {
            if (!FileSystem::createDirectories(target, lastError)) {
                return false;
            }
            continue;
        }
        if (type != AE_IFREG) {
            lastError = "Unsupported entry type: " + entryName;
            return false;
        }

        if (!FileSystem::createDirectories(target.parent_path(), lastError)) {
            return false;
        }

        // 目标位置已有符号链接时替换链接本身，不写到链接指向处
        std::error_code ec;
        if (fs::is_symlink(fs::symlink_status(target, ec)) && !FileSystem::removeFile(target)) {
            lastError = "Failed to replace symlink " + target.string();
            return false;
        }

        std::ofstream out(target, std::ios::binary | std::ios::trunc);
        if (!out) {
            lastError = "Failed to open " + target.string() + " for writing";
            return false;
        }

        la_ssize_t bytesRead;
        while ((bytesRead = archive_read_data(reader.get(), buffer.data(), buffer.size())) > 0) {
            out.write(buffer.data(), bytesRead);
            if (!out) {
                lastError = "Failed to write " + target.string();
                return false;
            }
        }
        if (bytesRead < 0) {
            lastError = archiveError(reader.get(), "Failed to read data for " + entryName);
            return false;
        }

        out.close();
        if (!out) {
            lastError = "Failed to close " + target.string();
            return false;
        }

        if (onEntry) {
            onEntry(target);
        }
    }

    return true;
}

bool ZipPackager::listEntries(const fs::path& inputFile, std::vector<std::string>& names) {
    lastError.clear();
    ArchiveReader reader = openZipReader(inputFile, lastError);
    if (!reader) {
        return false;
    }

    struct archive_entry* entry = nullptr;
    while (true) {
        int result = archive_read_next_header(reader.get(), &entry);
        if (result == ARCHIVE_EOF) {
            break;
        }
        if (isHeaderError(result)) {
            lastError = archiveError(reader.get(), "Failed to read entry header");
            return false;
        }
        const char* name = archive_entry_pathname(entry);
        names.push_back(name ? name : "");
        if (archive_read_data_skip(reader.get()) != ARCHIVE_OK) {
            lastError = archiveError(reader.get(), "Failed to skip entry data");
            return false;
        }
    }
    return true;
}

const std::string& ZipPackager::getLastError() const {
    return lastError;
}

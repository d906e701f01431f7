#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>
#include "core/models/FileCandidate.hpp"
#include "utils/FileSystem.hpp"

namespace fs = std::filesystem;

// FileSystem和FileCandidate测试用例
class FileSystemTest : public ::testing::Test {
protected:
    fs::path testDir = fs::temp_directory_path() / "zipbackup_filesystem_test";
    fs::path sourceDir = testDir / "source";
    fs::path outsideDir = testDir / "outside";

    bool symlinksSupported = true;

    void SetUp() override {
        fs::remove_all(testDir);
        fs::create_directories(sourceDir / "sub" / "deeper");
        fs::create_directories(outsideDir);

        std::ofstream(sourceDir / "top.txt") << "top";
        std::ofstream(sourceDir / "sub" / "middle.txt") << "middle";
        std::ofstream(sourceDir / "sub" / "deeper" / "bottom.txt") << "bottom";
        std::ofstream(outsideDir / "secret.txt") << "secret";

        // 某些平台需要特权才能创建符号链接
        std::error_code ec;
        fs::create_symlink(sourceDir / "top.txt", sourceDir / "link.txt", ec);
        if (!ec) {
            fs::create_directory_symlink(outsideDir, sourceDir / "linked_dir", ec);
        }
        symlinksSupported = !ec;
    }

    void TearDown() override {
        fs::remove_all(testDir);
    }
};

// 递归列出普通文件，按路径排序
TEST_F(FileSystemTest, GetRegularFilesRecursesAndSorts) {
    std::vector<fs::path> files;
    std::string error;
    ASSERT_TRUE(FileSystem::getRegularFiles(sourceDir, files, error)) << error;

    std::vector<std::string> relative;
    for (const auto& file : files) {
        relative.push_back(FileSystem::getRelativePath(file, sourceDir));
    }
    EXPECT_EQ(relative, (std::vector<std::string>{"sub/deeper/bottom.txt", "sub/middle.txt", "top.txt"}));
}

// 符号链接不跟随，也不作为文件返回
TEST_F(FileSystemTest, GetRegularFilesSkipsSymlinks) {
    if (!symlinksSupported) {
        GTEST_SKIP() << "Symbolic links are not supported here";
    }

    std::vector<fs::path> files;
    std::string error;
    ASSERT_TRUE(FileSystem::getRegularFiles(sourceDir, files, error)) << error;

    for (const auto& file : files) {
        EXPECT_NE(file.filename(), "link.txt");
        EXPECT_NE(file.filename(), "secret.txt");
    }
    EXPECT_EQ(files.size(), 3u);
    EXPECT_FALSE(FileSystem::isRegularFile(sourceDir / "link.txt"));
    EXPECT_TRUE(FileSystem::exists(sourceDir / "link.txt"));
}

TEST_F(FileSystemTest, GetRegularFilesOnMissingDirectoryFails) {
    std::vector<fs::path> files;
    std::string error;
    EXPECT_FALSE(FileSystem::getRegularFiles(testDir / "missing", files, error));
    EXPECT_FALSE(error.empty());
}

TEST_F(FileSystemTest, CreateDirectories) {
    std::string error;
    fs::path nested = testDir / "a" / "b" / "c";
    EXPECT_TRUE(FileSystem::createDirectories(nested, error));
    EXPECT_TRUE(FileSystem::isDirectory(nested));
    // 已存在也算成功
    EXPECT_TRUE(FileSystem::createDirectories(nested, error));

    EXPECT_FALSE(FileSystem::createDirectories(sourceDir / "top.txt" / "child", error));
    EXPECT_FALSE(error.empty());
}

TEST_F(FileSystemTest, RenameFile) {
    std::string error;
    fs::path from = testDir / "archive.zip.part";
    fs::path to = testDir / "archive.zip";
    std::ofstream(from) << "data";

    ASSERT_TRUE(FileSystem::renameFile(from, to, error)) << error;
    EXPECT_FALSE(FileSystem::exists(from));
    EXPECT_TRUE(FileSystem::isRegularFile(to));

    EXPECT_FALSE(FileSystem::renameFile(testDir / "nothing.part", to, error));
    EXPECT_FALSE(error.empty());
}

// 条目名解析
TEST_F(FileSystemTest, ResolveWithinAcceptsNestedNames) {
    fs::path resolved;
    ASSERT_TRUE(FileSystem::resolveWithin(testDir, "dir/file.txt", resolved));
    EXPECT_EQ(resolved.filename(), "file.txt");
    EXPECT_EQ(resolved.parent_path().filename(), "dir");

    ASSERT_TRUE(FileSystem::resolveWithin(testDir, "dir\\windows.txt", resolved));
    EXPECT_EQ(resolved.filename(), "windows.txt");

    ASSERT_TRUE(FileSystem::resolveWithin(testDir, "./plain.txt", resolved));
    EXPECT_EQ(resolved.filename(), "plain.txt");

    ASSERT_TRUE(FileSystem::resolveWithin(testDir, "folder/", resolved));
    EXPECT_EQ(resolved.filename(), "folder");
}

TEST_F(FileSystemTest, ResolveWithinRejectsEscapingNames) {
    fs::path resolved;
    EXPECT_FALSE(FileSystem::resolveWithin(testDir, "", resolved));
    EXPECT_FALSE(FileSystem::resolveWithin(testDir, "../evil.txt", resolved));
    EXPECT_FALSE(FileSystem::resolveWithin(testDir, "dir/../../evil.txt", resolved));
    EXPECT_FALSE(FileSystem::resolveWithin(testDir, "dir/../inside.txt", resolved));
    EXPECT_FALSE(FileSystem::resolveWithin(testDir, "..\\evil.txt", resolved));
    EXPECT_FALSE(FileSystem::resolveWithin(testDir, "/etc/passwd", resolved));
    EXPECT_FALSE(FileSystem::resolveWithin(testDir, ".", resolved));
}

// 通过已存在的符号链接目录写到root之外
TEST_F(FileSystemTest, ResolveWithinRejectsSymlinkedParent) {
    if (!symlinksSupported) {
        GTEST_SKIP() << "Symbolic links are not supported here";
    }

    fs::path resolved;
    EXPECT_FALSE(FileSystem::resolveWithin(sourceDir, "linked_dir/secret.txt", resolved));
}

TEST_F(FileSystemTest, FormatFileTime) {
    auto now = fs::file_time_type::clock::now();
    std::string text = FileSystem::formatFileTime(now, "%Y%m%d_%H%M%S");
    ASSERT_EQ(text.size(), 15u);
    EXPECT_EQ(text[8], '_');

    auto later = now + std::chrono::seconds(60);
    EXPECT_EQ(FileSystem::toTimeT(later) - FileSystem::toTimeT(now), 60);
}

// FileCandidate
TEST_F(FileSystemTest, CandidateUsesForwardSlashRelativePath) {
    FileCandidate candidate(sourceDir / "sub" / "deeper" / "bottom.txt", sourceDir);
    EXPECT_EQ(candidate.getRelativePath(), "sub/deeper/bottom.txt");
    EXPECT_EQ(candidate.getFileSize(), 6u);
    EXPECT_EQ(candidate.getAbsolutePath(), sourceDir / "sub" / "deeper" / "bottom.txt");
    EXPECT_EQ(candidate.getLastModifiedTime(), fs::last_write_time(sourceDir / "sub" / "deeper" / "bottom.txt"));
}

TEST_F(FileSystemTest, CandidateLoadsData) {
    FileCandidate candidate(sourceDir / "top.txt", sourceDir);
    std::vector<char> data;
    ASSERT_TRUE(candidate.loadFileData(data));
    EXPECT_EQ(std::string(data.begin(), data.end()), "top");
    EXPECT_NE(candidate.toString().find("top.txt"), std::string::npos);
}

TEST_F(FileSystemTest, CandidateForMissingFileThrows) {
    EXPECT_THROW(FileCandidate(sourceDir / "gone.txt", sourceDir), fs::filesystem_error);
}

TEST_F(FileSystemTest, CandidateEquality) {
    FileCandidate a(sourceDir / "top.txt", sourceDir);
    FileCandidate b(sourceDir / "top.txt", sourceDir);
    FileCandidate c(sourceDir / "sub" / "middle.txt", sourceDir);
    EXPECT_TRUE(a == b);
    EXPECT_FALSE(a == c);
}

#include <gtest/gtest.h>
#include "ginseng/core/utils.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <unistd.h>

using namespace ginseng::core::utils;

TEST(StringUtilsTest, Trim) {
    EXPECT_EQ(StringUtils::trim("  ticket \n"), "ticket");
    EXPECT_EQ(StringUtils::trim("   "), "");
    EXPECT_EQ(StringUtils::trim(""), "");
}

TEST(StringUtilsTest, FormatBytes) {
    EXPECT_EQ(StringUtils::format_bytes(0), "0 B");
    EXPECT_EQ(StringUtils::format_bytes(500), "500.00 B");
    EXPECT_EQ(StringUtils::format_bytes(1536), "1.50 KB");
    EXPECT_EQ(StringUtils::format_bytes(35ULL * 1024 * 1024), "35.00 MB");
}

TEST(StringUtilsTest, FormatDuration) {
    EXPECT_EQ(StringUtils::format_duration(0), "0s");
    EXPECT_EQ(StringUtils::format_duration(59), "59s");
    EXPECT_EQ(StringUtils::format_duration(123), "2m 3s");
    EXPECT_EQ(StringUtils::format_duration(3723), "1h 2m 3s");
}

class FileUtilsTest : public ::testing::Test {
protected:
    void SetUp() override {
        root = std::filesystem::temp_directory_path() / ("ginseng_utils_" + std::to_string(::getpid()));
        std::filesystem::create_directories(root);
    }
    
    void TearDown() override {
        std::filesystem::remove_all(root);
    }
    
    std::filesystem::path root;
};

TEST_F(FileUtilsTest, FileQueries) {
    auto file = root / "data.bin";
    std::ofstream(file) << "hello";
    
    EXPECT_TRUE(FileUtils::exists(file));
    EXPECT_TRUE(FileUtils::is_file(file));
    EXPECT_FALSE(FileUtils::is_directory(file));
    ASSERT_TRUE(FileUtils::file_size(file).has_value());
    EXPECT_EQ(*FileUtils::file_size(file), 5u);
    EXPECT_FALSE(FileUtils::file_size(root / "missing").has_value());
}

TEST_F(FileUtilsTest, CreateDirectories) {
    auto nested = root / "a" / "b" / "c";
    EXPECT_TRUE(FileUtils::create_directories(nested));
    EXPECT_TRUE(FileUtils::is_directory(nested));
    EXPECT_TRUE(FileUtils::create_directories(nested));
}

TEST(FileUtilsNameTest, ExtractNames) {
    EXPECT_EQ(FileUtils::extract_file_name("/path/to/file.txt"), "file.txt");
    EXPECT_EQ(FileUtils::extract_file_name("file.txt"), "file.txt");
    EXPECT_EQ(FileUtils::extract_file_name("/path/to/"), "to");
    EXPECT_EQ(FileUtils::extract_file_name("/"), "unknown");
    EXPECT_EQ(FileUtils::extract_directory_name("/path/to/dir"), "dir");
    EXPECT_EQ(FileUtils::extract_directory_name("/"), "folder");
}

TEST(FileUtilsNameTest, RelativePath) {
    EXPECT_EQ(FileUtils::relative_path("/home/user/file.txt", "/home/user/file.txt"), "file.txt");
    EXPECT_EQ(FileUtils::relative_path("/home/user/docs/file.txt", "/home/user"), "docs/file.txt");
    EXPECT_FALSE(FileUtils::relative_path("/etc/passwd", "/home/user").has_value());
}

TEST(FileUtilsNameTest, SafeRelativePath) {
    EXPECT_TRUE(FileUtils::is_safe_relative_path("docs/file.txt"));
    EXPECT_TRUE(FileUtils::is_safe_relative_path("file.txt"));
    EXPECT_FALSE(FileUtils::is_safe_relative_path(""));
    EXPECT_FALSE(FileUtils::is_safe_relative_path("/etc/passwd"));
    EXPECT_FALSE(FileUtils::is_safe_relative_path("../outside.txt"));
    EXPECT_FALSE(FileUtils::is_safe_relative_path("docs/../../outside.txt"));
}

TEST(FileUtilsNameTest, ExpandHome) {
    auto home = FileUtils::get_home_dir();
    EXPECT_EQ(FileUtils::expand_home("~"), home);
    EXPECT_EQ(FileUtils::expand_home("~/.ginseng"), home / ".ginseng");
    EXPECT_EQ(FileUtils::expand_home("/abs/path"), std::filesystem::path("/abs/path"));
}

TEST(FileUtilsNameTest, DownloadsDirPrefersXdg) {
    ::setenv("XDG_DOWNLOAD_DIR", "/tmp/ginseng_xdg_downloads", 1);
    EXPECT_EQ(FileUtils::get_downloads_dir(), std::filesystem::path("/tmp/ginseng_xdg_downloads"));
    ::unsetenv("XDG_DOWNLOAD_DIR");
    
    EXPECT_FALSE(FileUtils::get_downloads_dir().empty());
}

TEST(TimeUtilsTest, UnixSeconds) {
    auto epoch = std::chrono::system_clock::time_point{};
    EXPECT_EQ(TimeUtils::unix_seconds(epoch), 0u);
    EXPECT_EQ(TimeUtils::unix_seconds(epoch + std::chrono::seconds(90)), 90u);
    EXPECT_GT(TimeUtils::unix_seconds(TimeUtils::now()), 1600000000u);
}

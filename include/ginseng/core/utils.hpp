#pragma once

#include <string>
#include <vector>
#include <optional>
#include <filesystem>
#include <chrono>
#include <cstdint>

namespace ginseng::core::utils {

class StringUtils {
public:
    static std::string trim(const std::string& str);
    static std::string to_lower(const std::string& str);
    static bool starts_with(const std::string& str, const std::string& prefix);
    
    // "0 B", "1.50 KB", "35.00 MB"
    static std::string format_bytes(uint64_t bytes);
    // "1h 2m 3s", "2m 3s", "3s"
    static std::string format_duration(uint64_t seconds);
};

class FileUtils {
public:
    static bool exists(const std::filesystem::path& path);
    static bool is_file(const std::filesystem::path& path);
    static bool is_directory(const std::filesystem::path& path);
    static std::optional<uint64_t> file_size(const std::filesystem::path& path);
    static bool create_directories(const std::filesystem::path& path);
    
    static std::filesystem::path get_home_dir();
    static std::filesystem::path expand_home(const std::string& path);
    
    // XDG download dir, then ~/Downloads, then ./ginseng_downloads
    static std::filesystem::path get_downloads_dir();
    
    static std::string extract_file_name(const std::filesystem::path& path);
    static std::string extract_directory_name(const std::filesystem::path& path);
    
    // Path of file_path below base_path; the file name when both are the same path
    static std::optional<std::string> relative_path(const std::filesystem::path& file_path,
                                                    const std::filesystem::path& base_path);
    
    // Rejects absolute paths and any ".." component
    static bool is_safe_relative_path(const std::string& relative_path);
};

class TimeUtils {
public:
    static std::chrono::system_clock::time_point now();
    static uint64_t unix_seconds(const std::chrono::system_clock::time_point& time);
    static std::string format_timestamp(const std::chrono::system_clock::time_point& time);
};

} // namespace ginseng::core::utils

#include "ginseng/core/utils.hpp"
#include <algorithm>
#include <sstream>
#include <iomanip>
#include <cstdlib>
#include <ctime>

namespace ginseng::core::utils {

std::string StringUtils::trim(const std::string& str) {
    auto start = str.begin();
    while (start != str.end() && std::isspace(static_cast<unsigned char>(*start))) {
        start++;
    }
    
    if (start == str.end()) {
        return "";
    }
    
    auto end = str.end();
    do {
        end--;
    } while (std::distance(start, end) > 0 && std::isspace(static_cast<unsigned char>(*end)));
    
    return std::string(start, end + 1);
}

std::string StringUtils::to_lower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(), ::tolower);
    return result;
}

bool StringUtils::starts_with(const std::string& str, const std::string& prefix) {
    return str.size() >= prefix.size() && 
           str.compare(0, prefix.size(), prefix) == 0;
}

std::string StringUtils::format_bytes(uint64_t bytes) {
    if (bytes == 0) {
        return "0 B";
    }
    
    const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    int unit = 0;
    double size = static_cast<double>(bytes);
    
    while (size >= 1024.0 && unit < 4) {
        size /= 1024.0;
        unit++;
    }
    
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << size << " " << units[unit];
    return oss.str();
}

std::string StringUtils::format_duration(uint64_t seconds) {
    auto hours = seconds / 3600;
    auto minutes = (seconds % 3600) / 60;
    auto secs = seconds % 60;
    
    if (hours > 0) {
        return std::to_string(hours) + "h " + std::to_string(minutes) + "m " + std::to_string(secs) + "s";
    }
    if (minutes > 0) {
        return std::to_string(minutes) + "m " + std::to_string(secs) + "s";
    }
    return std::to_string(secs) + "s";
}

bool FileUtils::exists(const std::filesystem::path& path) {
    std::error_code ec;
    return std::filesystem::exists(path, ec);
}

bool FileUtils::is_file(const std::filesystem::path& path) {
    std::error_code ec;
    return std::filesystem::is_regular_file(path, ec);
}

bool FileUtils::is_directory(const std::filesystem::path& path) {
    std::error_code ec;
    return std::filesystem::is_directory(path, ec);
}

std::optional<uint64_t> FileUtils::file_size(const std::filesystem::path& path) {
    std::error_code ec;
    auto size = std::filesystem::file_size(path, ec);
    if (ec) return std::nullopt;
    return size;
}

bool FileUtils::create_directories(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::create_directories(path, ec);
    return !ec && std::filesystem::is_directory(path, ec);
}

std::filesystem::path FileUtils::get_home_dir() {
    const char* home = std::getenv("HOME");
    if (!home) {
        home = std::getenv("USERPROFILE");
    }
    return home ? std::filesystem::path(home) : std::filesystem::path(".");
}

std::filesystem::path FileUtils::expand_home(const std::string& path) {
    if (path == "~") {
        return get_home_dir();
    }
    if (StringUtils::starts_with(path, "~/")) {
        return get_home_dir() / path.substr(2);
    }
    return std::filesystem::path(path);
}

std::filesystem::path FileUtils::get_downloads_dir() {
    const char* xdg = std::getenv("XDG_DOWNLOAD_DIR");
    if (xdg && *xdg) {
        return std::filesystem::path(xdg);
    }
    
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return std::filesystem::path(home) / "Downloads";
    }
    
    std::error_code ec;
    auto cwd = std::filesystem::current_path(ec);
    if (ec) {
        cwd = ".";
    }
    return cwd / "ginseng_downloads";
}

std::string FileUtils::extract_file_name(const std::filesystem::path& path) {
    auto trimmed = path.has_filename() ? path : path.parent_path();
    auto name = trimmed.filename().string();
    return name.empty() ? "unknown" : name;
}

std::string FileUtils::extract_directory_name(const std::filesystem::path& path) {
    auto trimmed = path.has_filename() ? path : path.parent_path();
    auto name = trimmed.filename().string();
    return name.empty() ? "folder" : name;
}

std::optional<std::string> FileUtils::relative_path(const std::filesystem::path& file_path,
                                                    const std::filesystem::path& base_path) {
    if (file_path == base_path) {
        return extract_file_name(file_path);
    }
    
    auto relative = file_path.lexically_relative(base_path);
    if (relative.empty() || !is_safe_relative_path(relative.generic_string())) {
        return std::nullopt;
    }
    return relative.generic_string();
}

bool FileUtils::is_safe_relative_path(const std::string& relative_path) {
    if (relative_path.empty()) {
        return false;
    }
    
    std::filesystem::path path(relative_path);
    if (path.is_absolute() || path.has_root_name() || path.has_root_directory()) {
        return false;
    }
    
    for (const auto& part : path) {
        if (part == "..") {
            return false;
        }
    }
    return true;
}

std::chrono::system_clock::time_point TimeUtils::now() {
    return std::chrono::system_clock::now();
}

uint64_t TimeUtils::unix_seconds(const std::chrono::system_clock::time_point& time) {
    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(time.time_since_epoch()).count();
    return seconds > 0 ? static_cast<uint64_t>(seconds) : 0;
}

std::string TimeUtils::format_timestamp(const std::chrono::system_clock::time_point& time) {
    auto time_t = std::chrono::system_clock::to_time_t(time);
    std::ostringstream oss;
    oss << std::put_time(std::localtime(&time_t), "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

}

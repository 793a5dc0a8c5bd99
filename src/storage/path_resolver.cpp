#include "ginseng/storage/path_resolver.hpp"
#include "ginseng/core/logger.hpp"
#include "ginseng/core/utils.hpp"
#include <algorithm>
#include <fstream>

namespace ginseng::storage {

namespace fs = std::filesystem;

core::TransferResult FilesystemPathResolver::resolve(const std::string& path, ResolvedPath& resolved) {
    if (path.empty()) {
        return core::TransferResult(core::TransferError::PATH_ERROR, "Empty path");
    }
    
    auto expanded = core::utils::FileUtils::expand_home(path);
    
    std::error_code ec;
    auto canonical = fs::canonical(expanded, ec);
    if (ec) {
        return core::TransferResult(core::TransferError::PATH_ERROR,
                                    "Invalid file path '" + path + "': " + ec.message());
    }
    
    auto status = fs::status(canonical, ec);
    if (ec) {
        return core::TransferResult(core::TransferError::PATH_ERROR,
                                    "Cannot stat '" + path + "': " + ec.message());
    }
    
    ResolvedPath result;
    result.exists = true;
    result.canonical_path = canonical;
    
    if (fs::is_directory(status)) {
        result.is_directory = true;
        std::vector<LocalFile> files;
        auto listed = enumerate(result, files);
        if (!listed) {
            return listed;
        }
        for (const auto& file : files) {
            result.size += file.size;
        }
    } else if (fs::is_regular_file(status)) {
        std::ifstream readable(canonical, std::ios::binary);
        if (!readable) {
            return core::TransferResult(core::TransferError::PATH_ERROR,
                                        "Cannot read '" + path + "'");
        }
        auto size = fs::file_size(canonical, ec);
        if (ec) {
            return core::TransferResult(core::TransferError::PATH_ERROR,
                                        "Cannot size '" + path + "': " + ec.message());
        }
        result.size = size;
    } else {
        return core::TransferResult(core::TransferError::PATH_ERROR,
                                    "Not a regular file or directory: " + path);
    }
    
    resolved = std::move(result);
    return core::TransferResult();
}

core::TransferResult FilesystemPathResolver::enumerate(const ResolvedPath& resolved,
                                                       std::vector<LocalFile>& files) {
    if (!resolved.exists) {
        return core::TransferResult(core::TransferError::PATH_ERROR,
                                    "Path does not exist: " + resolved.canonical_path.string());
    }
    
    const auto& base = resolved.canonical_path;
    
    if (!resolved.is_directory) {
        LocalFile file;
        file.path = base;
        file.name = core::utils::FileUtils::extract_file_name(base);
        file.relative_path = file.name;
        file.size = resolved.size;
        files.push_back(std::move(file));
        return core::TransferResult();
    }
    
    std::vector<LocalFile> found;
    std::error_code ec;
    fs::recursive_directory_iterator it(base, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        return core::TransferResult(core::TransferError::PATH_ERROR,
                                    "Cannot list '" + base.string() + "': " + ec.message());
    }
    
    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
        std::error_code entry_ec;
        if (!it->is_regular_file(entry_ec) || entry_ec) {
            continue;
        }
        
        auto relative = core::utils::FileUtils::relative_path(it->path(), base);
        if (!relative) {
            LOG_WARN("Skipping {} outside of {}", it->path().string(), base.string());
            continue;
        }
        
        auto size = it->file_size(entry_ec);
        if (entry_ec) {
            return core::TransferResult(core::TransferError::PATH_ERROR,
                                        "Cannot size '" + it->path().string() + "': " + entry_ec.message());
        }
        
        LocalFile file;
        file.path = it->path();
        file.name = core::utils::FileUtils::extract_file_name(it->path());
        file.relative_path = *relative;
        file.size = size;
        found.push_back(std::move(file));
    }
    
    if (ec) {
        return core::TransferResult(core::TransferError::PATH_ERROR,
                                    "Cannot list '" + base.string() + "': " + ec.message());
    }
    
    std::sort(found.begin(), found.end(), [](const LocalFile& a, const LocalFile& b) {
        return a.relative_path < b.relative_path;
    });
    
    files.insert(files.end(), std::make_move_iterator(found.begin()),
                 std::make_move_iterator(found.end()));
    return core::TransferResult();
}

} // namespace ginseng::storage

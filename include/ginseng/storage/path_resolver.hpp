#pragma once

#include "../core/error.hpp"
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace ginseng::storage {

struct ResolvedPath {
    bool exists = false;
    std::filesystem::path canonical_path;
    uint64_t size = 0;          // file size, or the sum of all files below a directory
    bool is_directory = false;
};

struct LocalFile {
    std::filesystem::path path;
    std::string name;
    std::string relative_path;  // generic form, '/' separated
    uint64_t size = 0;
};

class PathResolver {
public:
    virtual ~PathResolver() = default;
    
    // PATH_ERROR when the path is missing or cannot be read
    virtual core::TransferResult resolve(const std::string& path, ResolvedPath& resolved) = 0;
    
    // A file yields itself under its own name; a directory yields every regular
    // file below it with paths relative to the directory
    virtual core::TransferResult enumerate(const ResolvedPath& resolved,
                                           std::vector<LocalFile>& files) = 0;
};

class FilesystemPathResolver : public PathResolver {
public:
    core::TransferResult resolve(const std::string& path, ResolvedPath& resolved) override;
    core::TransferResult enumerate(const ResolvedPath& resolved,
                                   std::vector<LocalFile>& files) override;
};

} // namespace ginseng::storage

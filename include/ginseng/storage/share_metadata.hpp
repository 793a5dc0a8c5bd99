#pragma once

#include "../core/error.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace ginseng::storage {

enum class ShareType {
    SINGLE_FILE,
    DIRECTORY,
    MULTIPLE_FILES
};

const char* to_string(ShareType type);
std::optional<ShareType> share_type_from_string(const std::string& value);

struct SharedFile {
    std::string name;
    std::string relative_path;
    uint64_t size = 0;
    std::string hash;  // hex blob hash
    
    bool operator==(const SharedFile& other) const = default;
};

// Manifest published with a share and returned to the downloader
struct ShareMetadata {
    std::vector<SharedFile> files;
    uint64_t total_size = 0;
    ShareType share_type = ShareType::SINGLE_FILE;
    std::string name;
    
    // Canonical text; the share hash is computed over exactly these bytes
    std::string serialize() const;
    static core::TransferResult deserialize(const std::string& text, ShareMetadata& metadata);
    
    // Rejects empty manifests, unsafe relative paths, size mismatches
    core::TransferResult validate() const;
    
    // Root the share is written under: <dir>/<name> for directory shares, <dir> otherwise
    std::filesystem::path destination_root(const std::filesystem::path& download_dir) const;
    std::filesystem::path destination_for(const std::filesystem::path& download_dir,
                                          const SharedFile& file) const;
    
    bool operator==(const ShareMetadata& other) const = default;
};

void to_json(nlohmann::json& j, const SharedFile& file);
void from_json(const nlohmann::json& j, SharedFile& file);

} // namespace ginseng::storage

#include "ginseng/storage/share_metadata.hpp"
#include "ginseng/core/utils.hpp"
#include <set>

namespace ginseng::storage {

namespace {

bool is_plain_name(const std::string& name) {
    return core::utils::FileUtils::is_safe_relative_path(name) &&
           std::filesystem::path(name).filename().string() == name &&
           name != ".";
}

}

const char* to_string(ShareType type) {
    switch (type) {
        case ShareType::SINGLE_FILE: return "single_file";
        case ShareType::DIRECTORY: return "directory";
        case ShareType::MULTIPLE_FILES: return "multiple_files";
    }
    return "single_file";
}

std::optional<ShareType> share_type_from_string(const std::string& value) {
    if (value == "single_file") return ShareType::SINGLE_FILE;
    if (value == "directory") return ShareType::DIRECTORY;
    if (value == "multiple_files") return ShareType::MULTIPLE_FILES;
    return std::nullopt;
}

void to_json(nlohmann::json& j, const SharedFile& file) {
    j = nlohmann::json{
        {"name", file.name},
        {"relative_path", file.relative_path},
        {"size", file.size},
        {"hash", file.hash},
    };
}

void from_json(const nlohmann::json& j, SharedFile& file) {
    j.at("name").get_to(file.name);
    j.at("relative_path").get_to(file.relative_path);
    j.at("size").get_to(file.size);
    j.at("hash").get_to(file.hash);
}

std::string ShareMetadata::serialize() const {
    nlohmann::json j{
        {"files", files},
        {"total_size", total_size},
        {"share_type", to_string(share_type)},
        {"name", name},
    };
    return j.dump();
}

core::TransferResult ShareMetadata::deserialize(const std::string& text, ShareMetadata& metadata) {
    try {
        auto j = nlohmann::json::parse(text);
        
        ShareMetadata parsed;
        j.at("files").get_to(parsed.files);
        j.at("total_size").get_to(parsed.total_size);
        j.at("name").get_to(parsed.name);
        
        auto type = share_type_from_string(j.at("share_type").get<std::string>());
        if (!type) {
            return core::TransferResult(core::TransferError::METADATA_ERROR,
                                        "Unknown share type");
        }
        parsed.share_type = *type;
        
        auto valid = parsed.validate();
        if (!valid) {
            return valid;
        }
        
        metadata = std::move(parsed);
        return core::TransferResult();
    } catch (const nlohmann::json::exception& e) {
        return core::TransferResult(core::TransferError::METADATA_ERROR,
                                    std::string("Malformed share manifest: ") + e.what());
    }
}

core::TransferResult ShareMetadata::validate() const {
    if (files.empty()) {
        return core::TransferResult(core::TransferError::METADATA_ERROR, "Share contains no files");
    }
    
    if (share_type == ShareType::DIRECTORY && !is_plain_name(name)) {
        return core::TransferResult(core::TransferError::METADATA_ERROR,
                                    "Unsafe share name: " + name);
    }
    
    uint64_t sum = 0;
    std::set<std::string> seen;
    for (const auto& file : files) {
        if (!is_plain_name(file.name)) {
            return core::TransferResult(core::TransferError::METADATA_ERROR,
                                        "Unsafe file name in share: " + file.name);
        }
        if (!core::utils::FileUtils::is_safe_relative_path(file.relative_path)) {
            return core::TransferResult(core::TransferError::METADATA_ERROR,
                                        "Unsafe relative path in share: " + file.relative_path);
        }
        if (!seen.insert(std::filesystem::path(file.relative_path).lexically_normal().string()).second) {
            return core::TransferResult(core::TransferError::METADATA_ERROR,
                                        "Duplicate file in share: " + file.relative_path);
        }
        if (file.hash.empty()) {
            return core::TransferResult(core::TransferError::METADATA_ERROR,
                                        "Missing hash for " + file.relative_path);
        }
        sum += file.size;
    }
    
    if (sum != total_size) {
        return core::TransferResult(core::TransferError::METADATA_ERROR,
                                    "Share total size does not match its files");
    }
    
    return core::TransferResult();
}

std::filesystem::path ShareMetadata::destination_root(const std::filesystem::path& download_dir) const {
    if (share_type == ShareType::DIRECTORY) {
        return download_dir / name;
    }
    return download_dir;
}

std::filesystem::path ShareMetadata::destination_for(const std::filesystem::path& download_dir,
                                                     const SharedFile& file) const {
    if (share_type == ShareType::SINGLE_FILE) {
        return download_dir / file.name;
    }
    return destination_root(download_dir) / std::filesystem::path(file.relative_path);
}

} // namespace ginseng::storage

#pragma once

#include <filesystem>
#include <string>
#include <cstdint>

namespace ginseng::storage {

// On-disk layout of one node's store inside the swarm directory
struct StorageConfig {
    std::filesystem::path store_directory;
    std::filesystem::path blob_directory;
    std::filesystem::path incomplete_directory;
    std::filesystem::path database_path;
    
    uint32_t chunk_size = 65536; // 64KB
    
    StorageConfig() = default;
    
    explicit StorageConfig(const std::filesystem::path& store_dir);
    
    bool validate() const;
    
    bool create_directories() const;
    
    uint64_t get_available_space() const;
    
    bool has_sufficient_space(uint64_t required_bytes) const;
    
    std::filesystem::path get_blob_path(const std::string& blob_hash) const;
    
    std::filesystem::path get_incomplete_path(const std::string& name) const;
    
    void set_store_directory(const std::filesystem::path& store_dir);
};

} // namespace ginseng::storage

#include "ginseng/storage/storage_config.hpp"

namespace ginseng::storage {

StorageConfig::StorageConfig(const std::filesystem::path& store_dir) {
    set_store_directory(store_dir);
}

bool StorageConfig::validate() const {
    if (store_directory.empty() || blob_directory.empty() ||
        incomplete_directory.empty() || database_path.empty()) {
        return false;
    }
    
    // 1KB to 10MB
    if (chunk_size < 1024 || chunk_size > 1024 * 1024 * 10) {
        return false;
    }
    
    return true;
}

bool StorageConfig::create_directories() const {
    try {
        std::filesystem::create_directories(blob_directory);
        std::filesystem::create_directories(incomplete_directory);
        
        auto db_dir = database_path.parent_path();
        if (!db_dir.empty()) {
            std::filesystem::create_directories(db_dir);
        }
        
        return true;
    } catch (const std::filesystem::filesystem_error&) {
        return false;
    }
}

uint64_t StorageConfig::get_available_space() const {
    try {
        auto space_info = std::filesystem::space(store_directory);
        return space_info.available;
    } catch (const std::filesystem::filesystem_error&) {
        return 0;
    }
}

bool StorageConfig::has_sufficient_space(uint64_t required_bytes) const {
    return get_available_space() >= required_bytes;
}

std::filesystem::path StorageConfig::get_blob_path(const std::string& blob_hash) const {
    // Fan out on the first two hex characters
    std::string subdir = blob_hash.substr(0, 2);
    return blob_directory / subdir / blob_hash;
}

std::filesystem::path StorageConfig::get_incomplete_path(const std::string& name) const {
    return incomplete_directory / name;
}

void StorageConfig::set_store_directory(const std::filesystem::path& store_dir) {
    store_directory = store_dir;
    blob_directory = store_dir / "blobs";
    incomplete_directory = store_dir / "incomplete";
    database_path = store_dir / "index.db";
}

} // namespace ginseng::storage

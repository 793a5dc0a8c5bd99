#pragma once

#include "share_metadata.hpp"
#include "../core/error.hpp"
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

struct sqlite3;

namespace ginseng::storage {

struct ShareRecord {
    std::string share_hash;
    std::string name;
    ShareType share_type = ShareType::SINGLE_FILE;
    uint64_t total_size = 0;
    uint64_t file_count = 0;
    uint64_t created_at = 0;  // unix seconds
};

// Per-node sqlite index of stored blobs and published share manifests.
// Safe to share between worker threads.
class BlobIndex {
public:
    explicit BlobIndex(const std::filesystem::path& db_path);
    ~BlobIndex();
    
    BlobIndex(const BlobIndex&) = delete;
    BlobIndex& operator=(const BlobIndex&) = delete;
    
    bool initialize();
    bool is_open() const { return db_ != nullptr; }
    
    bool add_blob(const std::string& blob_hash, uint64_t size);
    bool has_blob(const std::string& blob_hash);
    std::optional<uint64_t> get_blob_size(const std::string& blob_hash);
    core::TransferResult remove_blob(const std::string& blob_hash);
    
    // Stores the manifest text verbatim so its hash can be re-checked later
    bool add_share(const std::string& share_hash, const std::string& manifest,
                   const ShareMetadata& metadata);
    core::TransferResult get_manifest(const std::string& share_hash, std::string& manifest);
    std::vector<ShareRecord> list_shares();
    
    size_t get_blob_count();
    uint64_t get_total_size();
    size_t get_share_count();

private:
    std::filesystem::path db_path_;
    sqlite3* db_;
    std::mutex mutex_;
    
    bool create_tables();
    uint64_t query_count(const char* sql);
};

} // namespace ginseng::storage

#pragma once

#include "crypto_types.hpp"
#include "../core/error.hpp"
#include <filesystem>
#include <memory>
#include <optional>
#include <span>
#include <string>

namespace ginseng::crypto {

// Streaming content hash for blobs and share manifests
class BlobHasher {
public:
    BlobHasher();
    ~BlobHasher();
    
    BlobHasher(const BlobHasher&) = delete;
    BlobHasher& operator=(const BlobHasher&) = delete;
    
    core::TransferResult initialize();
    core::TransferResult update(std::span<const std::uint8_t> data);
    core::TransferResult finalize(BlobHash& output);
    
    static BlobHash hash(std::span<const std::uint8_t> data);
    static core::TransferResult hash_file(const std::filesystem::path& file_path, BlobHash& output);
    
private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
    bool initialized_;
};

namespace hash_utils {
    BlobHash hash_string(const std::string& str);
    
    std::string to_hex(std::span<const std::uint8_t> bytes);
    
    std::optional<BlobHash> hash_from_hex(const std::string& hex_string);
    std::optional<NodeId> node_id_from_hex(const std::string& hex_string);
}

}

#include "ginseng/crypto/hash.hpp"
#include "ginseng/core/logger.hpp"
#include <sodium.h>
#include <fstream>
#include <vector>

namespace ginseng::crypto {

using core::TransferError;
using core::TransferResult;

struct BlobHasher::Impl {
    crypto_generichash_state state;
};

BlobHasher::BlobHasher() 
    : impl_(std::make_unique<Impl>())
    , initialized_(false) {
}

BlobHasher::~BlobHasher() = default;

TransferResult BlobHasher::initialize() {
    if (crypto_generichash_init(&impl_->state, nullptr, 0, BLOB_HASH_SIZE) != 0) {
        return TransferResult(TransferError::INVALID_STATE, "Failed to initialize blob hasher");
    }
    
    initialized_ = true;
    return TransferResult();
}

TransferResult BlobHasher::update(std::span<const std::uint8_t> data) {
    if (!initialized_) {
        return TransferResult(TransferError::INVALID_STATE, "Hasher not initialized");
    }
    
    if (crypto_generichash_update(&impl_->state, data.data(), data.size()) != 0) {
        return TransferResult(TransferError::INVALID_STATE, "Failed to update hash");
    }
    
    return TransferResult();
}

TransferResult BlobHasher::finalize(BlobHash& output) {
    if (!initialized_) {
        return TransferResult(TransferError::INVALID_STATE, "Hasher not initialized");
    }
    
    if (crypto_generichash_final(&impl_->state, output.data(), output.size()) != 0) {
        return TransferResult(TransferError::INVALID_STATE, "Failed to finalize hash");
    }
    
    initialized_ = false; // Hasher is consumed
    return TransferResult();
}

BlobHash BlobHasher::hash(std::span<const std::uint8_t> data) {
    BlobHash result;
    crypto_generichash(result.data(), result.size(), data.data(), data.size(), nullptr, 0);
    return result;
}

TransferResult BlobHasher::hash_file(const std::filesystem::path& file_path, BlobHash& output) {
    std::ifstream file(file_path, std::ios::binary);
    if (!file.is_open()) {
        return TransferResult(TransferError::IO_ERROR, "Cannot open file for hashing: " + file_path.string());
    }
    
    BlobHasher hasher;
    auto result = hasher.initialize();
    if (!result.success()) {
        return result;
    }
    
    constexpr size_t buffer_size = 65536; // 64KB buffer
    std::vector<std::uint8_t> buffer(buffer_size);
    
    while (file.good()) {
        file.read(reinterpret_cast<char*>(buffer.data()), buffer_size);
        size_t bytes_read = static_cast<size_t>(file.gcount());
        
        if (bytes_read > 0) {
            result = hasher.update(std::span(buffer.data(), bytes_read));
            if (!result.success()) {
                return result;
            }
        }
    }
    
    if (file.bad()) {
        return TransferResult(TransferError::IO_ERROR, "Read error while hashing: " + file_path.string());
    }
    
    return hasher.finalize(output);
}

namespace hash_utils {

BlobHash hash_string(const std::string& str) {
    std::span<const std::uint8_t> data(reinterpret_cast<const std::uint8_t*>(str.data()), str.size());
    return BlobHasher::hash(data);
}

std::string to_hex(std::span<const std::uint8_t> bytes) {
    std::string hex(bytes.size() * 2 + 1, '\0');
    sodium_bin2hex(hex.data(), hex.size(), bytes.data(), bytes.size());
    hex.pop_back(); // trailing NUL
    return hex;
}

namespace {

template<size_t N>
std::optional<std::array<std::uint8_t, N>> from_hex(const std::string& hex_string) {
    if (hex_string.length() != N * 2) {
        return std::nullopt;
    }
    
    std::array<std::uint8_t, N> bytes;
    size_t decoded = 0;
    const char* end = nullptr;
    if (sodium_hex2bin(bytes.data(), bytes.size(), hex_string.data(), hex_string.size(),
                       nullptr, &decoded, &end) != 0 || decoded != N) {
        return std::nullopt;
    }
    
    return bytes;
}

}

std::optional<BlobHash> hash_from_hex(const std::string& hex_string) {
    return from_hex<BLOB_HASH_SIZE>(hex_string);
}

std::optional<NodeId> node_id_from_hex(const std::string& hex_string) {
    return from_hex<NODE_ID_SIZE>(hex_string);
}

}

}

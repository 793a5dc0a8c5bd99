#include "ginseng/crypto/random.hpp"
#include "ginseng/core/logger.hpp"
#include "ginseng/crypto/hash.hpp"
#include <sodium.h>
#include <array>

namespace ginseng::crypto {

bool SecureRandom::initialize() {
    if (sodium_init() < 0) {
        LOG_ERROR("Failed to initialize libsodium");
        return false;
    }
    return true;
}

void SecureRandom::generate_bytes(std::span<std::uint8_t> output) {
    randombytes_buf(output.data(), output.size());
}

NodeId SecureRandom::generate_node_id() {
    NodeId id;
    generate_bytes(std::span(id));
    return id;
}

std::string SecureRandom::generate_uuid() {
    std::array<std::uint8_t, UUID_SIZE> bytes;
    generate_bytes(std::span(bytes));
    
    bytes[6] = static_cast<std::uint8_t>((bytes[6] & 0x0f) | 0x40); // version 4
    bytes[8] = static_cast<std::uint8_t>((bytes[8] & 0x3f) | 0x80); // variant 1
    
    auto hex = hash_utils::to_hex(std::span(bytes));
    return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) + "-" +
           hex.substr(16, 4) + "-" + hex.substr(20, 12);
}

}

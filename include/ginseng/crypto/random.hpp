#pragma once

#include "crypto_types.hpp"
#include <cstdint>
#include <span>
#include <string>

namespace ginseng::crypto {

class SecureRandom {
public:
    // Safe to call repeatedly; sodium_init() is idempotent
    static bool initialize();
    
    static void generate_bytes(std::span<std::uint8_t> output);
    
    static NodeId generate_node_id();
    
    // RFC 4122 version 4, lowercase hex with dashes
    static std::string generate_uuid();
};

}

#pragma once

#include "../core/error.hpp"
#include "../crypto/crypto_types.hpp"
#include <string>

namespace ginseng::transport {

// "ginseng1" + provider node id (hex) + share hash (hex)
struct Ticket {
    crypto::NodeId node_id{};
    crypto::BlobHash share_hash{};
    
    static constexpr const char* PREFIX = "ginseng1";
    
    std::string to_string() const;
    std::string node_id_hex() const;
    std::string share_hash_hex() const;
    
    static core::TransferResult parse(const std::string& text, Ticket& ticket);
    
    bool operator==(const Ticket& other) const = default;
};

}

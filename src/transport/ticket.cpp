#include "ginseng/transport/ticket.hpp"
#include "ginseng/core/utils.hpp"
#include "ginseng/crypto/hash.hpp"
#include <cstring>

namespace ginseng::transport {

std::string Ticket::to_string() const {
    return std::string(PREFIX) + node_id_hex() + share_hash_hex();
}

std::string Ticket::node_id_hex() const {
    return crypto::hash_utils::to_hex(node_id);
}

std::string Ticket::share_hash_hex() const {
    return crypto::hash_utils::to_hex(share_hash);
}

core::TransferResult Ticket::parse(const std::string& text, Ticket& ticket) {
    auto trimmed = core::utils::StringUtils::trim(text);
    const size_t prefix_len = std::strlen(PREFIX);
    const size_t expected = prefix_len + crypto::NODE_ID_SIZE * 2 + crypto::BLOB_HASH_SIZE * 2;
    
    if (!core::utils::StringUtils::starts_with(trimmed, PREFIX)) {
        return core::TransferResult(core::TransferError::METADATA_ERROR,
                                    "Invalid ticket: unknown format");
    }
    if (trimmed.size() != expected) {
        return core::TransferResult(core::TransferError::METADATA_ERROR,
                                    "Invalid ticket: wrong length");
    }
    
    auto node_id = crypto::hash_utils::node_id_from_hex(
        trimmed.substr(prefix_len, crypto::NODE_ID_SIZE * 2));
    auto share_hash = crypto::hash_utils::hash_from_hex(
        trimmed.substr(prefix_len + crypto::NODE_ID_SIZE * 2));
    if (!node_id || !share_hash) {
        return core::TransferResult(core::TransferError::METADATA_ERROR,
                                    "Invalid ticket: not hex encoded");
    }
    
    ticket.node_id = *node_id;
    ticket.share_hash = *share_hash;
    return core::TransferResult();
}

}

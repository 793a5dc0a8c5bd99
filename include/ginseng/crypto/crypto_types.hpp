#pragma once

#include <array>
#include <cstdint>
#include <cstddef>

namespace ginseng::crypto {

// BLAKE2b-256 via crypto_generichash
constexpr size_t BLOB_HASH_SIZE = 32;
constexpr size_t NODE_ID_SIZE = 32;
constexpr size_t UUID_SIZE = 16;

using BlobHash = std::array<std::uint8_t, BLOB_HASH_SIZE>;
using NodeId = std::array<std::uint8_t, NODE_ID_SIZE>;

}

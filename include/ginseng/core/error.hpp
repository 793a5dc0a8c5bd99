#pragma once

#include <string>
#include <utility>

namespace ginseng::core {

enum class TransferError {
    SUCCESS = 0,
    PATH_ERROR,        // missing or invalid local path
    METADATA_ERROR,    // malformed or unresolvable ticket / manifest
    TRANSPORT_ERROR,   // peer unreachable, stream severed
    IO_ERROR,          // local read/write failure
    CANCELLED_ERROR,   // reserved, nothing produces it yet
    INVALID_STATE
};

const char* to_string(TransferError error);

struct TransferResult {
    TransferError error;
    std::string message;
    
    TransferResult(TransferError err = TransferError::SUCCESS, std::string msg = "")
        : error(err), message(std::move(msg)) {}
    
    bool success() const { return error == TransferError::SUCCESS; }
    operator bool() const { return success(); }
    
    // "TransportError: peer unreachable"
    std::string describe() const;
};

} // namespace ginseng::core

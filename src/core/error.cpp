#include "ginseng/core/error.hpp"

namespace ginseng::core {

const char* to_string(TransferError error) {
    switch (error) {
        case TransferError::SUCCESS: return "Success";
        case TransferError::PATH_ERROR: return "PathError";
        case TransferError::METADATA_ERROR: return "MetadataError";
        case TransferError::TRANSPORT_ERROR: return "TransportError";
        case TransferError::IO_ERROR: return "IoError";
        case TransferError::CANCELLED_ERROR: return "CancelledError";
        case TransferError::INVALID_STATE: return "InvalidState";
    }
    return "Unknown";
}

std::string TransferResult::describe() const {
    if (message.empty()) {
        return to_string(error);
    }
    return std::string(to_string(error)) + ": " + message;
}

}

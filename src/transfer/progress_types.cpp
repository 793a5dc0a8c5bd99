#include "ginseng/transfer/progress_types.hpp"

namespace ginseng::transfer {

const char* to_string(TransferType type) {
    switch (type) {
        case TransferType::UPLOAD: return "upload";
        case TransferType::DOWNLOAD: return "download";
    }
    return "upload";
}

const char* to_string(TransferStage stage) {
    switch (stage) {
        case TransferStage::INITIALIZING: return "initializing";
        case TransferStage::CONNECTING: return "connecting";
        case TransferStage::TRANSFERRING: return "transferring";
        case TransferStage::FINALIZING: return "finalizing";
        case TransferStage::COMPLETED: return "completed";
        case TransferStage::FAILED: return "failed";
        case TransferStage::CANCELLED: return "cancelled";
    }
    return "initializing";
}

const char* to_string(FileStatus status) {
    switch (status) {
        case FileStatus::PENDING: return "pending";
        case FileStatus::TRANSFERRING: return "transferring";
        case FileStatus::COMPLETED: return "completed";
        case FileStatus::FAILED: return "failed";
        case FileStatus::SKIPPED: return "skipped";
    }
    return "pending";
}

std::optional<TransferType> transfer_type_from_string(const std::string& value) {
    if (value == "upload") return TransferType::UPLOAD;
    if (value == "download") return TransferType::DOWNLOAD;
    return std::nullopt;
}

std::optional<TransferStage> transfer_stage_from_string(const std::string& value) {
    for (auto stage : {TransferStage::INITIALIZING, TransferStage::CONNECTING,
                       TransferStage::TRANSFERRING, TransferStage::FINALIZING,
                       TransferStage::COMPLETED, TransferStage::FAILED,
                       TransferStage::CANCELLED}) {
        if (value == to_string(stage)) {
            return stage;
        }
    }
    return std::nullopt;
}

std::optional<FileStatus> file_status_from_string(const std::string& value) {
    for (auto status : {FileStatus::PENDING, FileStatus::TRANSFERRING, FileStatus::COMPLETED,
                        FileStatus::FAILED, FileStatus::SKIPPED}) {
        if (value == to_string(status)) {
            return status;
        }
    }
    return std::nullopt;
}

bool is_terminal(TransferStage stage) {
    return stage == TransferStage::COMPLETED ||
           stage == TransferStage::FAILED ||
           stage == TransferStage::CANCELLED;
}

bool is_terminal(FileStatus status) {
    return status == FileStatus::COMPLETED ||
           status == FileStatus::FAILED ||
           status == FileStatus::SKIPPED;
}

bool can_transition(FileStatus from, FileStatus to) {
    if (is_terminal(from)) {
        return false;
    }
    if (from == to) {
        return true;
    }
    return static_cast<int>(to) > static_cast<int>(from);
}

}

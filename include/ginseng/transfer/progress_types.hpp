#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace ginseng::transfer {

using TransferId = std::string;
using FileId = std::string;

enum class TransferType {
    UPLOAD,
    DOWNLOAD
};

// Declaration order is the only legal direction of travel
enum class TransferStage {
    INITIALIZING,
    CONNECTING,
    TRANSFERRING,
    FINALIZING,
    COMPLETED,
    FAILED,
    CANCELLED  // reserved: no cancellation path exists yet
};

enum class FileStatus {
    PENDING,
    TRANSFERRING,
    COMPLETED,
    FAILED,
    SKIPPED
};

const char* to_string(TransferType type);
const char* to_string(TransferStage stage);
const char* to_string(FileStatus status);

std::optional<TransferType> transfer_type_from_string(const std::string& value);
std::optional<TransferStage> transfer_stage_from_string(const std::string& value);
std::optional<FileStatus> file_status_from_string(const std::string& value);

bool is_terminal(TransferStage stage);
bool is_terminal(FileStatus status);

// Forward-only status moves; a terminal status never changes again
bool can_transition(FileStatus from, FileStatus to);

struct FileEntry {
    FileId file_id;
    std::string name;
    std::string relative_path;
    uint64_t total_bytes = 0;
    uint64_t transferred_bytes = 0;
    FileStatus status = FileStatus::PENDING;
    std::optional<uint64_t> transfer_rate;
    std::optional<std::string> error;
    
    bool operator==(const FileEntry& other) const = default;
};

struct Session {
    TransferId transfer_id;
    TransferType transfer_type = TransferType::UPLOAD;
    TransferStage stage = TransferStage::INITIALIZING;
    uint64_t total_files = 0;
    uint64_t completed_files = 0;
    uint64_t failed_files = 0;
    uint64_t total_bytes = 0;
    uint64_t transferred_bytes = 0;
    std::optional<uint64_t> transfer_rate;
    uint64_t start_time = 0;  // unix seconds
    std::optional<uint64_t> eta_seconds;
    std::vector<FileEntry> files;
    std::optional<std::string> error;
    
    bool is_terminal() const { return transfer::is_terminal(stage); }
    
    bool operator==(const Session& other) const = default;
};

// One unit of work handed to a worker: a local file to share or a remote blob to fetch
struct FileDescriptor {
    std::string name;
    std::string relative_path;
    std::filesystem::path source_path;   // upload only
    std::optional<uint64_t> size;        // unset when the size could not be determined
    std::string blob_hash;               // download only, hex
};

}

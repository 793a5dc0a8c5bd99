#pragma once

#include "../core/error.hpp"
#include "../storage/share_metadata.hpp"
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <variant>

namespace ginseng::transport {

// Upload primitives, in the order a transport produces them for one file
struct UploadSize { uint64_t size; };
struct CopyProgress { uint64_t offset; };
struct HashProgress { uint64_t offset; };
struct UploadDone { std::string hash; };

using UploadPrimitive = std::variant<UploadSize, CopyProgress, HashProgress, UploadDone>;

// Download primitives. Progress carries an absolute offset into the blob.
struct TryProvider { std::string provider; };
struct DownloadProgress { uint64_t offset; };
struct PartComplete {};
struct DownloadError { std::string reason; };

using DownloadPrimitive = std::variant<TryProvider, DownloadProgress, PartComplete, DownloadError>;

// Lazy pull stream. next() leaves item empty once the stream is exhausted;
// a failed result ends the stream.
template<typename T>
class PrimitiveStream {
public:
    virtual ~PrimitiveStream() = default;
    virtual core::TransferResult next(std::optional<T>& item) = 0;
};

using UploadStream = PrimitiveStream<UploadPrimitive>;
using DownloadStream = PrimitiveStream<DownloadPrimitive>;

// Content-addressed blob transport. Implementations must tolerate concurrent
// add_path / fetch calls from worker threads.
class TransportLibrary {
public:
    virtual ~TransportLibrary() = default;
    
    virtual core::TransferResult connect() = 0;
    virtual std::string node_id() const = 0;
    
    virtual core::TransferResult add_path(const std::filesystem::path& path,
                                          std::unique_ptr<UploadStream>& stream) = 0;
    virtual core::TransferResult publish_share(const storage::ShareMetadata& metadata,
                                               std::string& ticket) = 0;
    
    virtual core::TransferResult resolve_ticket(const std::string& ticket,
                                                storage::ShareMetadata& metadata) = 0;
    virtual bool has_blob(const std::string& blob_hash) = 0;
    virtual core::TransferResult fetch(const std::string& ticket,
                                       const storage::SharedFile& file,
                                       std::unique_ptr<DownloadStream>& stream) = 0;
    virtual core::TransferResult export_blob(const std::string& blob_hash,
                                             const std::filesystem::path& destination) = 0;
};

}

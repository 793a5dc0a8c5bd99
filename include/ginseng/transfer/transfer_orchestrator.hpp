#pragma once

#include "event_channel.hpp"
#include "progress_emitter.hpp"
#include "progress_tracker.hpp"
#include "../core/config.hpp"
#include "../core/error.hpp"
#include "../storage/path_resolver.hpp"
#include "../storage/share_metadata.hpp"
#include "../transport/transport.hpp"
#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace ginseng::transfer {

struct OrchestratorOptions {
    size_t upload_concurrency = 0;      // 0: min(hardware threads, 8)
    size_t download_concurrency = 0;    // 0: DEFAULT_DOWNLOAD_CONCURRENCY
    std::chrono::milliseconds emit_interval = RateLimiter::DEFAULT_INTERVAL;
    std::filesystem::path download_directory;  // empty: the user's Downloads directory
    
    static OrchestratorOptions from_config(const core::Config& config);
};

struct ShareOutcome {
    std::string ticket;
    Session session;
};

struct DownloadOutcome {
    storage::ShareMetadata metadata;
    std::filesystem::path download_path;
    Session session;
};

// Runs one share or download session at a time per call: enumerates the work,
// drives every file through the transport on a bounded pool and reports
// progress to the sink. Safe to call concurrently; sessions share nothing.
class TransferOrchestrator {
public:
    static constexpr size_t MAX_UPLOAD_CONCURRENCY = 8;
    static constexpr size_t DEFAULT_DOWNLOAD_CONCURRENCY = 6;
    
    TransferOrchestrator(transport::TransportLibrary& transport,
                         storage::PathResolver& resolver,
                         OrchestratorOptions options = {});
    
    core::TransferResult share_files(const std::vector<std::string>& paths,
                                     EventSink& sink, ShareOutcome& outcome);
    
    core::TransferResult download_files(const std::string& ticket,
                                        EventSink& sink, DownloadOutcome& outcome);
    
    size_t upload_concurrency() const;
    size_t download_concurrency() const;
    
    const OrchestratorOptions& get_options() const { return options_; }
    
private:
    struct UploadJob {
        FileId file_id;
        FileDescriptor descriptor;
        std::string blob_hash;  // filled in by the worker
    };
    
    struct DownloadJob {
        FileId file_id;
        storage::SharedFile file;
    };
    
    transport::TransportLibrary& transport_;
    storage::PathResolver& resolver_;
    OrchestratorOptions options_;
    
    core::TransferResult plan_share(const std::vector<std::string>& paths,
                                    std::vector<FileDescriptor>& descriptors,
                                    storage::ShareMetadata& shape);
    
    void upload_file(ProgressTracker& tracker, ProgressEmitter& emitter, UploadJob& job);
    void download_file(ProgressTracker& tracker, ProgressEmitter& emitter,
                       const std::string& ticket, const DownloadJob& job);
    
    core::TransferResult finalize_download(ProgressTracker& tracker,
                                           const storage::ShareMetadata& metadata,
                                           const std::vector<DownloadJob>& jobs,
                                           std::filesystem::path& download_path);
    
    static void finish_file(ProgressTracker& tracker, ProgressEmitter& emitter,
                            const FileId& file_id, const core::TransferResult& result);
    static core::TransferResult fail_session(ProgressTracker& tracker, ProgressEmitter& emitter,
                                             core::TransferResult error, Session& session);
};

}

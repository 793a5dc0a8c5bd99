#include "ginseng/transfer/transfer_orchestrator.hpp"
#include "ginseng/core/logger.hpp"
#include "ginseng/core/utils.hpp"
#include "ginseng/crypto/random.hpp"
#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <algorithm>
#include <deque>
#include <semaphore>
#include <set>
#include <thread>

namespace ginseng::transfer {

using core::TransferError;
using core::TransferResult;
using FileUtils = core::utils::FileUtils;

namespace {

template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

class PermitGuard {
public:
    explicit PermitGuard(std::counting_semaphore<>& permits) : permits_(permits) {}
    ~PermitGuard() { permits_.release(); }
    
    PermitGuard(const PermitGuard&) = delete;
    PermitGuard& operator=(const PermitGuard&) = delete;
    
private:
    std::counting_semaphore<>& permits_;
};

// Drains the queue with at most `limit` jobs in flight and waits for all of them
template<typename Job, typename Fn>
void run_bounded(std::vector<Job>& jobs, size_t limit, Fn work) {
    std::deque<Job*> queue;
    for (auto& job : jobs) {
        queue.push_back(&job);
    }
    
    boost::asio::thread_pool pool(limit);
    std::counting_semaphore<> permits(static_cast<std::ptrdiff_t>(limit));
    
    while (!queue.empty()) {
        permits.acquire();
        Job* job = queue.front();
        queue.pop_front();
        
        boost::asio::post(pool, [&permits, &work, job] {
            PermitGuard guard(permits);
            work(*job);
        });
    }
    
    pool.join();
}

}

OrchestratorOptions OrchestratorOptions::from_config(const core::Config& config) {
    OrchestratorOptions options;
    options.upload_concurrency = static_cast<size_t>(std::max(0, config.get_int("transfer.upload_concurrency", 0)));
    options.download_concurrency = static_cast<size_t>(std::max(0, config.get_int("transfer.download_concurrency", 0)));
    
    auto interval = config.get_int("progress.emit_interval_ms", static_cast<int>(RateLimiter::DEFAULT_INTERVAL.count()));
    options.emit_interval = std::chrono::milliseconds(std::max(0, interval));
    
    auto download_dir = config.get_string("download.directory", "");
    if (!download_dir.empty()) {
        options.download_directory = FileUtils::expand_home(download_dir);
    }
    return options;
}

TransferOrchestrator::TransferOrchestrator(transport::TransportLibrary& transport,
                                           storage::PathResolver& resolver,
                                           OrchestratorOptions options)
    : transport_(transport), resolver_(resolver), options_(std::move(options)) {
}

size_t TransferOrchestrator::upload_concurrency() const {
    if (options_.upload_concurrency > 0) {
        return options_.upload_concurrency;
    }
    size_t hardware = std::max(1u, std::thread::hardware_concurrency());
    return std::min(hardware, MAX_UPLOAD_CONCURRENCY);
}

size_t TransferOrchestrator::download_concurrency() const {
    return options_.download_concurrency > 0 ? options_.download_concurrency
                                             : DEFAULT_DOWNLOAD_CONCURRENCY;
}

TransferResult TransferOrchestrator::plan_share(const std::vector<std::string>& paths,
                                                std::vector<FileDescriptor>& descriptors,
                                                storage::ShareMetadata& shape) {
    if (paths.empty()) {
        return TransferResult(TransferError::PATH_ERROR, "No files provided");
    }
    
    std::set<std::string> seen;
    
    for (const auto& path : paths) {
        storage::ResolvedPath resolved;
        auto result = resolver_.resolve(path, resolved);
        if (!result) {
            return result;
        }
        
        std::vector<storage::LocalFile> files;
        result = resolver_.enumerate(resolved, files);
        if (!result) {
            return result;
        }
        
        // With several arguments, a directory keeps its own name as a prefix
        std::string prefix;
        if (paths.size() > 1 && resolved.is_directory) {
            prefix = FileUtils::extract_directory_name(resolved.canonical_path) + "/";
        }
        
        for (auto& file : files) {
            FileDescriptor descriptor;
            descriptor.name = file.name;
            descriptor.relative_path = prefix + file.relative_path;
            descriptor.source_path = file.path;
            descriptor.size = file.size;
            
            if (!seen.insert(descriptor.relative_path).second) {
                return TransferResult(TransferError::PATH_ERROR,
                                      "Duplicate file in share: " + descriptor.relative_path);
            }
            descriptors.push_back(std::move(descriptor));
        }
        
        if (paths.size() == 1) {
            if (resolved.is_directory) {
                shape.share_type = storage::ShareType::DIRECTORY;
                shape.name = FileUtils::extract_directory_name(resolved.canonical_path);
            } else {
                shape.share_type = storage::ShareType::SINGLE_FILE;
                shape.name = FileUtils::extract_file_name(resolved.canonical_path);
            }
        }
    }
    
    if (paths.size() > 1) {
        shape.share_type = storage::ShareType::MULTIPLE_FILES;
        shape.name = std::to_string(descriptors.size()) + " files";
    }
    
    if (descriptors.empty()) {
        return TransferResult(TransferError::PATH_ERROR, "No files found to share");
    }
    return TransferResult();
}

TransferResult TransferOrchestrator::share_files(const std::vector<std::string>& paths,
                                                 EventSink& sink, ShareOutcome& outcome) {
    ProgressTracker tracker(crypto::SecureRandom::generate_uuid(), TransferType::UPLOAD);
    ProgressEmitter emitter(tracker, sink, options_.emit_interval);
    
    LOG_INFO("Starting share {} of {} path(s)", tracker.get_transfer_id(), paths.size());
    
    std::vector<FileDescriptor> descriptors;
    storage::ShareMetadata shape;
    auto result = plan_share(paths, descriptors, shape);
    if (!result) {
        return fail_session(tracker, emitter, result, outcome.session);
    }
    
    tracker.set_stage(TransferStage::CONNECTING);
    result = transport_.connect();
    if (!result) {
        return fail_session(tracker, emitter, result, outcome.session);
    }
    
    result = tracker.initialize(descriptors);
    if (!result) {
        return fail_session(tracker, emitter, result, outcome.session);
    }
    
    auto ids = tracker.file_ids();
    std::vector<UploadJob> jobs;
    jobs.reserve(descriptors.size());
    for (size_t i = 0; i < descriptors.size(); ++i) {
        jobs.push_back(UploadJob{ids[i], descriptors[i], ""});
    }
    
    emitter.started();
    tracker.set_stage(TransferStage::TRANSFERRING);
    emitter.stage(TransferStage::TRANSFERRING);
    
    run_bounded(jobs, upload_concurrency(), [&](UploadJob& job) {
        upload_file(tracker, emitter, job);
    });
    
    tracker.set_stage(TransferStage::FINALIZING);
    emitter.stage(TransferStage::FINALIZING, std::string("Publishing share"));
    
    storage::ShareMetadata metadata;
    metadata.share_type = shape.share_type;
    metadata.name = shape.name;
    for (const auto& job : jobs) {
        auto entry = tracker.file(job.file_id);
        if (!entry || entry->status != FileStatus::COMPLETED) {
            continue;
        }
        metadata.files.push_back(storage::SharedFile{job.descriptor.name, job.descriptor.relative_path,
                                                     entry->total_bytes, job.blob_hash});
        metadata.total_size += entry->total_bytes;
    }
    
    if (metadata.files.empty()) {
        return fail_session(tracker, emitter,
                            TransferResult(TransferError::IO_ERROR, "No file could be added to the share"),
                            outcome.session);
    }
    
    std::string ticket;
    result = transport_.publish_share(metadata, ticket);
    if (!result) {
        return fail_session(tracker, emitter, result, outcome.session);
    }
    
    tracker.complete();
    emitter.completed();
    
    outcome.ticket = ticket;
    outcome.session = tracker.snapshot();
    LOG_INFO("Share {} completed: {}/{} files", tracker.get_transfer_id(),
             outcome.session.completed_files, outcome.session.total_files);
    return TransferResult();
}

TransferResult TransferOrchestrator::download_files(const std::string& ticket,
                                                    EventSink& sink, DownloadOutcome& outcome) {
    ProgressTracker tracker(crypto::SecureRandom::generate_uuid(), TransferType::DOWNLOAD);
    ProgressEmitter emitter(tracker, sink, options_.emit_interval);
    
    LOG_INFO("Starting download {}", tracker.get_transfer_id());
    
    if (core::utils::StringUtils::trim(ticket).empty()) {
        return fail_session(tracker, emitter,
                            TransferResult(TransferError::METADATA_ERROR, "Empty ticket"),
                            outcome.session);
    }
    
    tracker.set_stage(TransferStage::CONNECTING);
    auto result = transport_.connect();
    if (!result) {
        return fail_session(tracker, emitter, result, outcome.session);
    }
    
    storage::ShareMetadata metadata;
    result = transport_.resolve_ticket(ticket, metadata);
    if (!result) {
        return fail_session(tracker, emitter, result, outcome.session);
    }
    
    result = metadata.validate();
    if (!result) {
        return fail_session(tracker, emitter, result, outcome.session);
    }
    
    std::vector<FileDescriptor> descriptors;
    descriptors.reserve(metadata.files.size());
    for (const auto& file : metadata.files) {
        FileDescriptor descriptor;
        descriptor.name = file.name;
        descriptor.relative_path = file.relative_path;
        descriptor.size = file.size;
        descriptor.blob_hash = file.hash;
        descriptors.push_back(std::move(descriptor));
    }
    
    result = tracker.initialize(descriptors);
    if (!result) {
        return fail_session(tracker, emitter, result, outcome.session);
    }
    
    auto ids = tracker.file_ids();
    std::vector<DownloadJob> jobs;
    jobs.reserve(metadata.files.size());
    for (size_t i = 0; i < metadata.files.size(); ++i) {
        jobs.push_back(DownloadJob{ids[i], metadata.files[i]});
    }
    
    emitter.started();
    tracker.set_stage(TransferStage::TRANSFERRING);
    emitter.stage(TransferStage::TRANSFERRING);
    
    run_bounded(jobs, download_concurrency(), [&](DownloadJob& job) {
        download_file(tracker, emitter, ticket, job);
    });
    
    tracker.set_stage(TransferStage::FINALIZING);
    emitter.stage(TransferStage::FINALIZING, std::string("Writing files"));
    
    std::filesystem::path download_path;
    result = finalize_download(tracker, metadata, jobs, download_path);
    if (!result) {
        return fail_session(tracker, emitter, result, outcome.session);
    }
    
    tracker.complete();
    emitter.completed();
    
    outcome.metadata = std::move(metadata);
    outcome.download_path = download_path;
    outcome.session = tracker.snapshot();
    LOG_INFO("Download {} completed into {}: {}/{} files", tracker.get_transfer_id(),
             download_path.string(), outcome.session.completed_files, outcome.session.total_files);
    return TransferResult();
}

void TransferOrchestrator::upload_file(ProgressTracker& tracker, ProgressEmitter& emitter, UploadJob& job) {
    const auto& id = job.file_id;
    const uint64_t total = job.descriptor.size.value_or(0);
    
    try {
        tracker.update_file(id, 0, FileStatus::TRANSFERRING);
        emitter.file_progress(id);
        
        std::unique_ptr<transport::UploadStream> stream;
        auto result = transport_.add_path(job.descriptor.source_path, stream);
        if (!result) {
            finish_file(tracker, emitter, id, result);
            return;
        }
        
        uint64_t copied = 0;
        uint64_t hashed = 0;
        std::string hash;
        
        for (;;) {
            std::optional<transport::UploadPrimitive> item;
            result = stream->next(item);
            if (!result) {
                finish_file(tracker, emitter, id, result);
                return;
            }
            if (!item) {
                break;
            }
            
            uint64_t progress = std::visit(overloaded{
                [&](const transport::UploadSize& size) {
                    if (size.size != total) {
                        LOG_DEBUG("{} reported {} bytes, expected {}", job.descriptor.name, size.size, total);
                    }
                    return copied / 2 + hashed / 2;
                },
                [&](const transport::CopyProgress& copy) {
                    copied = copy.offset;
                    return copied / 2 + hashed / 2;
                },
                [&](const transport::HashProgress& progress) {
                    hashed = progress.offset;
                    return copied / 2 + hashed / 2;
                },
                [&](const transport::UploadDone& done) {
                    hash = done.hash;
                    return total;
                },
            }, *item);
            
            tracker.update_file(id, progress);
            emitter.file_progress(id);
        }
        
        if (hash.empty()) {
            finish_file(tracker, emitter, id,
                        TransferResult(TransferError::TRANSPORT_ERROR, "Upload ended without a blob hash"));
            return;
        }
        
        job.blob_hash = hash;
        tracker.update_file(id, total);
        finish_file(tracker, emitter, id, TransferResult());
    } catch (const std::exception& e) {
        finish_file(tracker, emitter, id, TransferResult(TransferError::TRANSPORT_ERROR, e.what()));
    }
}

void TransferOrchestrator::download_file(ProgressTracker& tracker, ProgressEmitter& emitter,
                                         const std::string& ticket, const DownloadJob& job) {
    const auto& id = job.file_id;
    const uint64_t total = job.file.size;
    
    try {
        if (transport_.has_blob(job.file.hash)) {
            LOG_DEBUG("{} already present locally", job.file.relative_path);
            tracker.update_file(id, total);
            tracker.mark_terminal(id, FileStatus::SKIPPED);
            emitter.file_finished(id);
            return;
        }
        
        tracker.update_file(id, 0, FileStatus::TRANSFERRING);
        emitter.file_progress(id);
        
        std::unique_ptr<transport::DownloadStream> stream;
        auto result = transport_.fetch(ticket, job.file, stream);
        if (!result) {
            finish_file(tracker, emitter, id, result);
            return;
        }
        
        for (;;) {
            std::optional<transport::DownloadPrimitive> item;
            result = stream->next(item);
            if (!result) {
                finish_file(tracker, emitter, id, result);
                return;
            }
            if (!item) {
                break;
            }
            
            if (auto* error = std::get_if<transport::DownloadError>(&*item)) {
                finish_file(tracker, emitter, id, TransferResult(TransferError::TRANSPORT_ERROR, error->reason));
                return;
            }
            
            std::visit(overloaded{
                [&](const transport::TryProvider& provider) {
                    LOG_DEBUG("Fetching {} from {}", job.file.relative_path, provider.provider);
                },
                [&](const transport::DownloadProgress& progress) {
                    tracker.update_file(id, progress.offset);
                },
                [&](const transport::PartComplete&) {
                    tracker.update_file(id, total);
                },
                [&](const transport::DownloadError&) {},
            }, *item);
            
            emitter.file_progress(id);
        }
        
        tracker.update_file(id, total);
        finish_file(tracker, emitter, id, TransferResult());
    } catch (const std::exception& e) {
        finish_file(tracker, emitter, id, TransferResult(TransferError::TRANSPORT_ERROR, e.what()));
    }
}

TransferResult TransferOrchestrator::finalize_download(ProgressTracker& tracker,
                                                       const storage::ShareMetadata& metadata,
                                                       const std::vector<DownloadJob>& jobs,
                                                       std::filesystem::path& download_path) {
    auto base = options_.download_directory.empty() ? FileUtils::get_downloads_dir()
                                                    : options_.download_directory;
    download_path = metadata.destination_root(base);
    
    if (!FileUtils::create_directories(download_path)) {
        return TransferResult(TransferError::IO_ERROR, "Cannot create " + download_path.string());
    }
    
    for (const auto& job : jobs) {
        auto entry = tracker.file(job.file_id);
        if (!entry || (entry->status != FileStatus::COMPLETED && entry->status != FileStatus::SKIPPED)) {
            continue;
        }
        
        auto destination = metadata.destination_for(base, job.file);
        auto result = transport_.export_blob(job.file.hash, destination);
        if (!result) {
            return result;
        }
        LOG_DEBUG("Exported {} to {}", job.file.relative_path, destination.string());
    }
    
    return TransferResult();
}

void TransferOrchestrator::finish_file(ProgressTracker& tracker, ProgressEmitter& emitter,
                                       const FileId& file_id, const TransferResult& result) {
    if (result) {
        tracker.mark_terminal(file_id, FileStatus::COMPLETED);
    } else {
        auto entry = tracker.file(file_id);
        LOG_WARN("File {} failed: {}", entry ? entry->relative_path : file_id, result.describe());
        tracker.mark_terminal(file_id, FileStatus::FAILED, result.describe());
    }
    emitter.file_finished(file_id);
}

TransferResult TransferOrchestrator::fail_session(ProgressTracker& tracker, ProgressEmitter& emitter,
                                                  TransferResult error, Session& session) {
    auto message = error.describe();
    LOG_ERROR("Transfer {} failed: {}", tracker.get_transfer_id(), message);
    
    tracker.fail(message);
    emitter.failed(message);
    session = tracker.snapshot();
    return error;
}

}

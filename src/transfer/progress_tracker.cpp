#include "ginseng/transfer/progress_tracker.hpp"
#include "ginseng/core/logger.hpp"
#include "ginseng/core/utils.hpp"
#include "ginseng/crypto/random.hpp"
#include <algorithm>

namespace ginseng::transfer {

using core::TransferError;
using core::TransferResult;

void ProgressTracker::RateEstimator::record(uint64_t bytes, Clock::time_point now) {
    if (!started || now - last_activity > RATE_STALL_TIMEOUT) {
        // Fresh start, or resuming after a stall: the old average no longer applies
        started = true;
        rate.reset();
        window_start = now;
        window_bytes = 0;
    }
    
    window_bytes += bytes;
    last_activity = now;
    
    auto elapsed = now - window_start;
    if (elapsed < RATE_SAMPLE_WINDOW) {
        return;
    }
    
    double seconds = std::chrono::duration<double>(elapsed).count();
    double instantaneous = static_cast<double>(window_bytes) / seconds;
    rate = rate ? RATE_SMOOTHING * instantaneous + (1.0 - RATE_SMOOTHING) * *rate
                : instantaneous;
    
    window_start = now;
    window_bytes = 0;
}

std::optional<uint64_t> ProgressTracker::RateEstimator::value(Clock::time_point now) const {
    if (!rate) {
        return std::nullopt;
    }
    if (now - last_activity > RATE_STALL_TIMEOUT) {
        return 0;
    }
    return static_cast<uint64_t>(*rate);
}

ProgressTracker::ProgressTracker(TransferId transfer_id, TransferType transfer_type)
    : transfer_id_(std::move(transfer_id))
    , transfer_type_(transfer_type)
    , start_time_(core::utils::TimeUtils::unix_seconds(core::utils::TimeUtils::now()))
    , initialized_(false)
    , total_bytes_(0)
    , stage_(TransferStage::INITIALIZING)
{
}

TransferResult ProgressTracker::initialize(const std::vector<FileDescriptor>& descriptors) {
    std::unique_lock<std::shared_mutex> state_lock(state_mutex_);
    
    auto empty_error = transfer_type_ == TransferType::UPLOAD ? TransferError::PATH_ERROR
                                                              : TransferError::METADATA_ERROR;
    
    if (initialized_) {
        return TransferResult(TransferError::INVALID_STATE, "Transfer already initialized");
    }
    
    if (descriptors.empty()) {
        return TransferResult(empty_error, "No files provided");
    }
    
    std::vector<std::unique_ptr<EntrySlot>> slots;
    std::unordered_map<FileId, size_t> index;
    uint64_t total_bytes = 0;
    slots.reserve(descriptors.size());
    
    for (const auto& descriptor : descriptors) {
        if (!descriptor.size) {
            return TransferResult(empty_error, "Size unavailable for " + descriptor.name);
        }
        
        auto slot = std::make_unique<EntrySlot>();
        slot->entry.file_id = crypto::SecureRandom::generate_uuid();
        slot->entry.name = descriptor.name;
        slot->entry.relative_path = descriptor.relative_path;
        slot->entry.total_bytes = *descriptor.size;
        
        index.emplace(slot->entry.file_id, slots.size());
        total_bytes += *descriptor.size;
        slots.push_back(std::move(slot));
    }
    
    slots_ = std::move(slots);
    index_ = std::move(index);
    total_bytes_ = total_bytes;
    initialized_ = true;
    
    LOG_DEBUG("Transfer {} initialized with {} files ({} bytes)",
              transfer_id_, slots_.size(), total_bytes_);
    return TransferResult();
}

bool ProgressTracker::is_initialized() const {
    std::shared_lock<std::shared_mutex> state_lock(state_mutex_);
    return initialized_;
}

bool ProgressTracker::update_file(const FileId& file_id, uint64_t transferred_bytes,
                                  std::optional<FileStatus> status) {
    auto now = Clock::now();
    std::shared_lock<std::shared_mutex> state_lock(state_mutex_);
    
    auto* slot = find_slot(file_id);
    if (!slot) {
        LOG_WARN("Progress update for unknown file {} in transfer {}", file_id, transfer_id_);
        return false;
    }
    
    uint64_t delta = 0;
    {
        std::lock_guard<std::mutex> entry_lock(slot->mutex);
        auto& entry = slot->entry;
        
        if (is_terminal(entry.status)) {
            return false;
        }
        
        auto clamped = std::min(transferred_bytes, entry.total_bytes);
        if (clamped < entry.transferred_bytes) {
            LOG_DEBUG("Ignoring regressing byte count {} < {} for {}",
                      clamped, entry.transferred_bytes, entry.name);
            return false;
        }
        
        if (status && !can_transition(entry.status, *status)) {
            return false;
        }
        
        delta = clamped - entry.transferred_bytes;
        entry.transferred_bytes = clamped;
        if (status) {
            entry.status = *status;
        }
        
        if (delta > 0) {
            slot->rate.record(delta, now);
            entry.transfer_rate = slot->rate.value(now);
        }
    }
    
    if (delta > 0) {
        record_session_bytes(delta, now);
    }
    return true;
}

bool ProgressTracker::mark_terminal(const FileId& file_id, FileStatus status,
                                    std::optional<std::string> error) {
    if (!is_terminal(status)) {
        return false;
    }
    
    std::shared_lock<std::shared_mutex> state_lock(state_mutex_);
    
    auto* slot = find_slot(file_id);
    if (!slot) {
        LOG_WARN("Terminal update for unknown file {} in transfer {}", file_id, transfer_id_);
        return false;
    }
    
    std::lock_guard<std::mutex> entry_lock(slot->mutex);
    auto& entry = slot->entry;
    
    if (!can_transition(entry.status, status)) {
        return false;
    }
    
    entry.status = status;
    if (error && !error->empty()) {
        entry.error = std::move(error);
    } else if (status == FileStatus::FAILED) {
        entry.error = "Transfer failed";
    }
    
    return true;
}

bool ProgressTracker::set_stage(TransferStage stage) {
    if (is_terminal(stage)) {
        LOG_WARN("Transfer {} can only become {} through complete() or fail()",
                 transfer_id_, to_string(stage));
        return false;
    }
    
    std::shared_lock<std::shared_mutex> state_lock(state_mutex_);
    std::lock_guard<std::mutex> aggregate_lock(aggregate_mutex_);
    return set_stage_locked(stage);
}

TransferStage ProgressTracker::get_stage() const {
    std::lock_guard<std::mutex> aggregate_lock(aggregate_mutex_);
    return stage_;
}

bool ProgressTracker::complete() {
    std::unique_lock<std::shared_mutex> state_lock(state_mutex_);
    
    for (const auto& slot : slots_) {
        if (!is_terminal(slot->entry.status)) {
            LOG_ERROR("Cannot complete transfer {}: {} is still {}",
                      transfer_id_, slot->entry.name, to_string(slot->entry.status));
            return false;
        }
    }
    
    std::lock_guard<std::mutex> aggregate_lock(aggregate_mutex_);
    return set_stage_locked(TransferStage::COMPLETED);
}

bool ProgressTracker::fail(const std::string& error) {
    std::unique_lock<std::shared_mutex> state_lock(state_mutex_);
    std::lock_guard<std::mutex> aggregate_lock(aggregate_mutex_);
    
    if (is_terminal(stage_)) {
        return false;
    }
    
    for (auto& slot : slots_) {
        if (!is_terminal(slot->entry.status)) {
            slot->entry.status = FileStatus::FAILED;
            slot->entry.error = error;
        }
    }
    
    error_ = error;
    stage_ = TransferStage::FAILED;
    return true;
}

Session ProgressTracker::snapshot() const {
    auto now = Clock::now();
    std::unique_lock<std::shared_mutex> state_lock(state_mutex_);
    
    Session session;
    session.transfer_id = transfer_id_;
    session.transfer_type = transfer_type_;
    session.start_time = start_time_;
    session.total_files = slots_.size();
    session.total_bytes = total_bytes_;
    session.files.reserve(slots_.size());
    
    for (const auto& slot : slots_) {
        auto entry = slot->entry;
        if (entry.status == FileStatus::TRANSFERRING && entry.transfer_rate) {
            entry.transfer_rate = slot->rate.value(now);
        }
        session.transferred_bytes += entry.transferred_bytes;
        if (entry.status == FileStatus::COMPLETED || entry.status == FileStatus::SKIPPED) {
            session.completed_files++;
        } else if (entry.status == FileStatus::FAILED) {
            session.failed_files++;
        }
        session.files.push_back(std::move(entry));
    }
    
    std::lock_guard<std::mutex> aggregate_lock(aggregate_mutex_);
    session.stage = stage_;
    session.error = error_;
    session.transfer_rate = session_rate_.value(now);
    if (session.transfer_rate && *session.transfer_rate > 0) {
        session.eta_seconds = (session.total_bytes - session.transferred_bytes) / *session.transfer_rate;
    }
    
    return session;
}

std::optional<FileEntry> ProgressTracker::file(const FileId& file_id) const {
    std::shared_lock<std::shared_mutex> state_lock(state_mutex_);
    
    auto* slot = find_slot(file_id);
    if (!slot) {
        return std::nullopt;
    }
    
    std::lock_guard<std::mutex> entry_lock(slot->mutex);
    auto entry = slot->entry;
    if (entry.status == FileStatus::TRANSFERRING && entry.transfer_rate) {
        entry.transfer_rate = slot->rate.value(Clock::now());
    }
    return entry;
}

std::vector<FileId> ProgressTracker::file_ids() const {
    std::shared_lock<std::shared_mutex> state_lock(state_mutex_);
    
    std::vector<FileId> ids;
    ids.reserve(slots_.size());
    for (const auto& slot : slots_) {
        ids.push_back(slot->entry.file_id);
    }
    return ids;
}

ProgressTracker::EntrySlot* ProgressTracker::find_slot(const FileId& file_id) const {
    auto it = index_.find(file_id);
    if (it == index_.end()) {
        return nullptr;
    }
    return slots_[it->second].get();
}

bool ProgressTracker::set_stage_locked(TransferStage stage) {
    if (is_terminal(stage_)) {
        LOG_WARN("Transfer {} already {}, ignoring stage {}",
                 transfer_id_, to_string(stage_), to_string(stage));
        return false;
    }
    
    if (static_cast<int>(stage) < static_cast<int>(stage_)) {
        LOG_WARN("Transfer {} cannot move back from {} to {}",
                 transfer_id_, to_string(stage_), to_string(stage));
        return false;
    }
    
    stage_ = stage;
    return true;
}

void ProgressTracker::record_session_bytes(uint64_t bytes, Clock::time_point now) {
    std::lock_guard<std::mutex> aggregate_lock(aggregate_mutex_);
    session_rate_.record(bytes, now);
}

}

#pragma once

#include "progress_types.hpp"
#include "../core/error.hpp"
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace ginseng::transfer {

// Sole owner of a session's state. Workers and consumers only ever see copies.
//
// Locking: every mutator holds state_mutex_ shared plus the mutex of the entry it
// touches, then aggregate_mutex_ briefly for session-wide fields. snapshot() holds
// state_mutex_ exclusively, so it never observes a half-applied update.
class ProgressTracker {
public:
    using Clock = std::chrono::steady_clock;
    
    ProgressTracker(TransferId transfer_id, TransferType transfer_type);
    
    ProgressTracker(const ProgressTracker&) = delete;
    ProgressTracker& operator=(const ProgressTracker&) = delete;
    
    // Builds pending entries with fixed sizes. Fails on an empty list, a missing
    // size, or a second call.
    core::TransferResult initialize(const std::vector<FileDescriptor>& descriptors);
    bool is_initialized() const;
    
    // Monotonic: a byte count below the recorded one is ignored and returns false.
    // Counts above the entry total are clamped to it.
    bool update_file(const FileId& file_id, uint64_t transferred_bytes,
                     std::optional<FileStatus> status = std::nullopt);
    
    bool mark_terminal(const FileId& file_id, FileStatus status,
                       std::optional<std::string> error = std::nullopt);
    
    // Stages only move forward. Terminal stages are rejected here and entered
    // once, through complete() or fail().
    bool set_stage(TransferStage stage);
    TransferStage get_stage() const;
    
    // Requires every entry to be terminal
    bool complete();
    
    // Fails the session and every entry that has not finished yet
    bool fail(const std::string& error);
    
    Session snapshot() const;
    std::optional<FileEntry> file(const FileId& file_id) const;
    std::vector<FileId> file_ids() const;
    
    const TransferId& get_transfer_id() const { return transfer_id_; }
    TransferType get_transfer_type() const { return transfer_type_; }
    
    static constexpr double RATE_SMOOTHING = 0.3;
    static constexpr std::chrono::milliseconds RATE_SAMPLE_WINDOW{250};
    // Rates read as zero once no bytes arrived for this long
    static constexpr std::chrono::milliseconds RATE_STALL_TIMEOUT{1000};
    
private:
    // Exponential moving average of bytes/s over fixed sample windows
    struct RateEstimator {
        std::optional<double> rate;
        Clock::time_point window_start;
        Clock::time_point last_activity;
        uint64_t window_bytes = 0;
        bool started = false;
        
        void record(uint64_t bytes, Clock::time_point now);
        std::optional<uint64_t> value(Clock::time_point now) const;
    };
    
    struct EntrySlot {
        mutable std::mutex mutex;
        FileEntry entry;
        RateEstimator rate;
    };
    
    TransferId transfer_id_;
    TransferType transfer_type_;
    uint64_t start_time_;
    
    mutable std::shared_mutex state_mutex_;
    bool initialized_;
    uint64_t total_bytes_;
    std::vector<std::unique_ptr<EntrySlot>> slots_;
    std::unordered_map<FileId, size_t> index_;
    
    mutable std::mutex aggregate_mutex_;
    TransferStage stage_;
    std::optional<std::string> error_;
    RateEstimator session_rate_;
    
    EntrySlot* find_slot(const FileId& file_id) const;
    bool set_stage_locked(TransferStage stage);
    void record_session_bytes(uint64_t bytes, Clock::time_point now);
};

}

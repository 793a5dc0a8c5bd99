#pragma once

#include "event_channel.hpp"
#include "progress_tracker.hpp"
#include "rate_limiter.hpp"
#include <atomic>
#include <mutex>
#include <optional>
#include <string>

namespace ginseng::transfer {

// Turns tracker state into events. Throttled events go through the limiter;
// lifecycle events always go out unless the consumer has gone away.
class ProgressEmitter {
public:
    ProgressEmitter(ProgressTracker& tracker, EventSink& sink,
                    std::chrono::milliseconds interval = RateLimiter::DEFAULT_INTERVAL);
    
    void started();
    void stage(TransferStage stage, std::optional<std::string> message = std::nullopt);
    
    // Throttled fileProgress + transferProgress
    void file_progress(const FileId& file_id);
    // Unthrottled fileProgress for a terminal entry, throttled transferProgress
    void file_finished(const FileId& file_id);
    
    void completed();
    void failed(const std::string& error);
    
private:
    ProgressTracker& tracker_;
    EventSink& sink_;
    RateLimiter limiter_;
    std::mutex emit_mutex_;
    std::atomic<bool> closed_;
    bool started_;
    
    void send_locked(const ProgressEvent& event);
    void send_file_locked(const FileId& file_id);
    void send_transfer_progress_locked();
    void send_session_locked(Session session);
};

}

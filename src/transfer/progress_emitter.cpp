#include "ginseng/transfer/progress_emitter.hpp"
#include "ginseng/core/logger.hpp"

namespace ginseng::transfer {

ProgressEmitter::ProgressEmitter(ProgressTracker& tracker, EventSink& sink,
                                 std::chrono::milliseconds interval)
    : tracker_(tracker), sink_(sink), limiter_(interval), closed_(false), started_(false) {
}

void ProgressEmitter::started() {
    std::lock_guard<std::mutex> lock(emit_mutex_);
    send_locked(TransferStartedEvent{tracker_.snapshot()});
    started_ = true;
}

void ProgressEmitter::stage(TransferStage stage, std::optional<std::string> message) {
    std::lock_guard<std::mutex> lock(emit_mutex_);
    if (!started_) {
        return;
    }
    send_locked(StageChangedEvent{tracker_.get_transfer_id(), stage, std::move(message)});
}

void ProgressEmitter::file_progress(const FileId& file_id) {
    std::lock_guard<std::mutex> lock(emit_mutex_);
    if (!started_ || !limiter_.should_emit()) {
        return;
    }
    send_file_locked(file_id);
    send_session_locked(tracker_.snapshot());
}

void ProgressEmitter::file_finished(const FileId& file_id) {
    std::lock_guard<std::mutex> lock(emit_mutex_);
    if (!started_) {
        return;
    }
    send_file_locked(file_id);
    send_transfer_progress_locked();
}

void ProgressEmitter::completed() {
    std::lock_guard<std::mutex> lock(emit_mutex_);
    send_locked(TransferCompletedEvent{tracker_.snapshot()});
}

void ProgressEmitter::failed(const std::string& error) {
    std::lock_guard<std::mutex> lock(emit_mutex_);
    auto session = tracker_.snapshot();
    if (!started_) {
        // Nothing was announced yet, so the consumer gets no file list either
        session.files.clear();
    }
    send_locked(TransferFailedEvent{std::move(session), error});
}

void ProgressEmitter::send_locked(const ProgressEvent& event) {
    if (closed_.load()) {
        return;
    }
    if (!sink_.send(event)) {
        closed_.store(true);
        LOG_WARN("Event consumer for transfer {} went away, continuing silently",
                 tracker_.get_transfer_id());
    }
}

void ProgressEmitter::send_file_locked(const FileId& file_id) {
    auto entry = tracker_.file(file_id);
    if (entry) {
        send_locked(FileProgressEvent{tracker_.get_transfer_id(), std::move(*entry)});
    }
}

void ProgressEmitter::send_transfer_progress_locked() {
    if (limiter_.should_emit()) {
        send_session_locked(tracker_.snapshot());
    }
}

void ProgressEmitter::send_session_locked(Session session) {
    // Settled counters are only announced together with a terminal stage
    if (session.completed_files + session.failed_files >= session.total_files &&
        !session.is_terminal()) {
        return;
    }
    send_locked(TransferProgressEvent{std::move(session)});
}

}

#include "ginseng/core/progress_display.hpp"
#include "ginseng/core/utils.hpp"
#include <cstdio>
#include <ostream>

namespace ginseng::core {

using namespace transfer;

ProgressDisplay::ProgressDisplay(EventChannel& channel, bool json_output, std::ostream& out)
    : channel_(channel), json_output_(json_output), out_(out),
      stop_requested_(false), progress_line_open_(false) {
}

ProgressDisplay::~ProgressDisplay() {
    finish();
}

void ProgressDisplay::start() {
    if (!thread_.joinable()) {
        stop_requested_ = false;
        thread_ = std::thread([this] { run(); });
    }
}

void ProgressDisplay::finish() {
    stop_requested_ = true;
    if (thread_.joinable()) {
        thread_.join();
    }
}

void ProgressDisplay::run() {
    for (;;) {
        ProgressEvent event;
        if (channel_.receive(event, std::chrono::milliseconds(100))) {
            print(event);
            if (is_terminal_event(event)) {
                break;
            }
        } else if (stop_requested_ || channel_.is_closed()) {
            break;
        }
    }
    
    if (progress_line_open_) {
        out_ << "\n";
        progress_line_open_ = false;
    }
    out_.flush();
}

void ProgressDisplay::print(const ProgressEvent& event) {
    if (json_output_) {
        out_ << to_json(event).dump() << "\n";
        return;
    }
    
    if (auto* progress = std::get_if<TransferProgressEvent>(&event)) {
        out_ << "\r" << progress_line(progress->transfer) << "   " << std::flush;
        progress_line_open_ = true;
        return;
    }
    
    auto line = describe(event);
    if (line.empty()) {
        return;
    }
    
    if (progress_line_open_) {
        out_ << "\n";
        progress_line_open_ = false;
    }
    out_ << line << "\n";
}

std::string ProgressDisplay::describe(const ProgressEvent& event) {
    using utils::StringUtils;
    
    if (auto* started = std::get_if<TransferStartedEvent>(&event)) {
        const auto& session = started->transfer;
        std::string verb = session.transfer_type == TransferType::UPLOAD ? "Sharing " : "Downloading ";
        return verb + std::to_string(session.total_files) +
               (session.total_files == 1 ? " file (" : " files (") +
               StringUtils::format_bytes(session.total_bytes) + ")";
    }
    
    if (auto* file = std::get_if<FileProgressEvent>(&event)) {
        const auto& entry = file->file;
        switch (entry.status) {
            case FileStatus::COMPLETED:
                return "  done     " + entry.relative_path;
            case FileStatus::SKIPPED:
                return "  present  " + entry.relative_path;
            case FileStatus::FAILED:
                return "  failed   " + entry.relative_path + ": " + entry.error.value_or("unknown error");
            default:
                return "";
        }
    }
    
    if (auto* stage = std::get_if<StageChangedEvent>(&event)) {
        std::string line = std::string("Stage: ") + to_string(stage->stage);
        if (stage->message) {
            line += " (" + *stage->message + ")";
        }
        return line;
    }
    
    if (auto* completed = std::get_if<TransferCompletedEvent>(&event)) {
        const auto& session = completed->transfer;
        auto elapsed = utils::TimeUtils::unix_seconds(utils::TimeUtils::now()) - session.start_time;
        std::string line = "Completed: " + std::to_string(session.completed_files) + "/" +
                           std::to_string(session.total_files) + " files, " +
                           StringUtils::format_bytes(session.transferred_bytes) + " in " +
                           StringUtils::format_duration(elapsed);
        if (session.failed_files > 0) {
            line += " (" + std::to_string(session.failed_files) + " failed)";
        }
        return line;
    }
    
    if (auto* failed = std::get_if<TransferFailedEvent>(&event)) {
        return "Failed: " + failed->error;
    }
    
    return "";
}

std::string ProgressDisplay::progress_line(const Session& session) {
    using utils::StringUtils;
    
    unsigned percent = session.total_bytes == 0
        ? 100u
        : static_cast<unsigned>(session.transferred_bytes * 100 / session.total_bytes);
    
    char prefix[16];
    std::snprintf(prefix, sizeof(prefix), "[%3u%%] ", percent);
    
    std::string line = prefix + StringUtils::format_bytes(session.transferred_bytes) + " / " +
                       StringUtils::format_bytes(session.total_bytes);
    if (session.transfer_rate) {
        line += "  " + StringUtils::format_bytes(*session.transfer_rate) + "/s";
    }
    if (session.eta_seconds) {
        line += "  ETA " + StringUtils::format_duration(*session.eta_seconds);
    }
    return line;
}

}

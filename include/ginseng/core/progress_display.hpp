#pragma once

#include "../transfer/event_channel.hpp"
#include <atomic>
#include <iosfwd>
#include <string>
#include <thread>

namespace ginseng::core {

// Consumer side of a transfer: drains the channel on its own thread and prints
// either JSON lines or a human readable progress view.
class ProgressDisplay {
public:
    ProgressDisplay(transfer::EventChannel& channel, bool json_output, std::ostream& out);
    ~ProgressDisplay();
    
    ProgressDisplay(const ProgressDisplay&) = delete;
    ProgressDisplay& operator=(const ProgressDisplay&) = delete;
    
    void start();
    // Prints whatever is still queued, then joins the consumer thread
    void finish();
    
    // One line of text for an event; empty for events the text view does not print
    static std::string describe(const transfer::ProgressEvent& event);
    // "[ 45%] 12.00 MB / 35.00 MB  3.00 MB/s  ETA 5s"
    static std::string progress_line(const transfer::Session& session);
    
private:
    transfer::EventChannel& channel_;
    bool json_output_;
    std::ostream& out_;
    std::thread thread_;
    std::atomic<bool> stop_requested_;
    bool progress_line_open_;
    
    void run();
    void print(const transfer::ProgressEvent& event);
};

}

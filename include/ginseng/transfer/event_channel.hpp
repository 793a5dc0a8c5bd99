#pragma once

#include "progress_event.hpp"
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>

namespace ginseng::transfer {

// Producer side of the consumer connection
class EventSink {
public:
    virtual ~EventSink() = default;
    
    // false once the consumer side has gone away
    virtual bool send(const ProgressEvent& event) = 0;
    virtual bool is_closed() const = 0;
};

// Unbounded FIFO with a single consumer. send() never blocks.
class EventChannel : public EventSink {
public:
    EventChannel() = default;
    
    EventChannel(const EventChannel&) = delete;
    EventChannel& operator=(const EventChannel&) = delete;
    
    bool send(const ProgressEvent& event) override;
    bool is_closed() const override;
    
    // Waits up to timeout; false on timeout or when closed and drained
    bool receive(ProgressEvent& event, std::chrono::milliseconds timeout);
    bool try_receive(ProgressEvent& event);
    
    // Queued events are discarded and later sends are refused
    void close();
    
    size_t pending() const;
    
private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<ProgressEvent> queue_;
    bool closed_ = false;
};

}

#include "ginseng/transfer/event_channel.hpp"

namespace ginseng::transfer {

bool EventChannel::send(const ProgressEvent& event) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return false;
        }
        queue_.push_back(event);
    }
    cv_.notify_one();
    return true;
}

bool EventChannel::is_closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

bool EventChannel::receive(ProgressEvent& event, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!cv_.wait_for(lock, timeout, [this] { return !queue_.empty() || closed_; })) {
        return false;
    }
    if (queue_.empty()) {
        return false;
    }
    
    event = std::move(queue_.front());
    queue_.pop_front();
    return true;
}

bool EventChannel::try_receive(ProgressEvent& event) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (queue_.empty()) {
        return false;
    }
    
    event = std::move(queue_.front());
    queue_.pop_front();
    return true;
}

void EventChannel::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        queue_.clear();
    }
    cv_.notify_all();
}

size_t EventChannel::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

}

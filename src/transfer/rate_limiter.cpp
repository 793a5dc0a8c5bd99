#include "ginseng/transfer/rate_limiter.hpp"

namespace ginseng::transfer {

RateLimiter::RateLimiter(std::chrono::milliseconds min_interval)
    : min_interval_(min_interval)
    , last_emit_time_(Clock::now())
    , forced_(false)
{
}

bool RateLimiter::should_emit(Clock::time_point now,
                              Clock::time_point& last_emit_time,
                              std::chrono::milliseconds min_interval) {
    // A clock reading older than the last emission never qualifies
    if (now < last_emit_time) {
        return false;
    }
    
    if (now - last_emit_time >= min_interval) {
        last_emit_time = now;
        return true;
    }
    return false;
}

bool RateLimiter::should_emit(Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    if (forced_) {
        forced_ = false;
        last_emit_time_ = now;
        return true;
    }
    
    return should_emit(now, last_emit_time_, min_interval_);
}

bool RateLimiter::should_emit() {
    return should_emit(Clock::now());
}

void RateLimiter::force_emit() {
    std::lock_guard<std::mutex> lock(mutex_);
    forced_ = true;
}

RateLimiter::Clock::time_point RateLimiter::get_last_emit_time() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_emit_time_;
}

}

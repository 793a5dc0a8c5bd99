#pragma once

#include <chrono>
#include <mutex>

namespace ginseng::transfer {

// Gates non-critical progress events so a consumer sees at most one per interval.
// Lifecycle events (start, terminal, per-file terminal) bypass it entirely.
class RateLimiter {
public:
    using Clock = std::chrono::steady_clock;
    
    static constexpr std::chrono::milliseconds DEFAULT_INTERVAL{100};
    
    explicit RateLimiter(std::chrono::milliseconds min_interval = DEFAULT_INTERVAL);
    
    // Pure decision; advances last_emit_time only when it returns true
    static bool should_emit(Clock::time_point now,
                            Clock::time_point& last_emit_time,
                            std::chrono::milliseconds min_interval);
    
    bool should_emit(Clock::time_point now);
    bool should_emit();
    
    // Makes the next should_emit() succeed regardless of timing
    void force_emit();
    
    std::chrono::milliseconds get_interval() const { return min_interval_; }
    Clock::time_point get_last_emit_time() const;
    
private:
    std::chrono::milliseconds min_interval_;
    Clock::time_point last_emit_time_;
    bool forced_;
    mutable std::mutex mutex_;
};

}

#pragma once
#include <atomic>
#include <chrono>

// Cooperative cancellation flag. request() only touches a lock-free atomic so
// it is safe to call from a signal handler.
class ShutdownToken {
public:
    ShutdownToken() = default;
    ShutdownToken(const ShutdownToken&) = delete;
    ShutdownToken& operator=(const ShutdownToken&) = delete;

    void request() { requested_.store(true); }
    bool requested() const { return requested_.load(); }

    // Sleeps for up to `duration`, polling the flag. Returns false if shutdown
    // was requested before the full duration elapsed.
    bool wait_for(std::chrono::milliseconds duration) const;

private:
    static_assert(std::atomic<bool>::is_always_lock_free);
    std::atomic<bool> requested_{false};
};

#include "shutdown_token.hpp"
#include <algorithm>
#include <thread>

bool ShutdownToken::wait_for(std::chrono::milliseconds duration) const {
    constexpr auto poll = std::chrono::milliseconds(100);
    auto wake_up_time = std::chrono::steady_clock::now() + duration;

    while (!requested()) {
        auto now = std::chrono::steady_clock::now();
        if (now >= wake_up_time) {
            return true;
        }
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(wake_up_time - now);
        std::this_thread::sleep_for(std::min(poll, remaining));
    }
    return false;
}

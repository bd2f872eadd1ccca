#include "backoff_policy.hpp"
#include "util.hpp"
#include <algorithm>
#include <cmath>

BackoffPolicy::BackoffPolicy(double base_delay_seconds, double max_delay_seconds, double multiplier, double jitter_factor)
    : base_delay_seconds_(base_delay_seconds),
      max_delay_seconds_(max_delay_seconds),
      multiplier_(multiplier),
      jitter_factor_(jitter_factor) {
}

std::chrono::milliseconds BackoffPolicy::delay_for_attempt(int attempt) const {
    if (attempt <= 0) {
        return std::chrono::milliseconds(0);
    }

    double delay_seconds = base_delay_seconds_ * std::pow(multiplier_, attempt - 1);
    delay_seconds = std::min(delay_seconds, max_delay_seconds_);
    delay_seconds = util::random_jitter(delay_seconds, jitter_factor_);

    return std::chrono::milliseconds(static_cast<long long>(delay_seconds * 1000));
}

std::chrono::milliseconds BackoffPolicy::max_delay() const {
    return std::chrono::milliseconds(static_cast<long long>(max_delay_seconds_ * 1000));
}

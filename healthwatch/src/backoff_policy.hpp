#pragma once
#include <chrono>

class BackoffPolicy {
public:
    BackoffPolicy(double base_delay_seconds = 1.0, double max_delay_seconds = 30.0,
                  double multiplier = 2.0, double jitter_factor = 0.0);

    // Delay to wait after the given failed attempt (1-based): base, base*m, base*m^2 ... capped
    std::chrono::milliseconds delay_for_attempt(int attempt) const;

    std::chrono::milliseconds max_delay() const;

private:
    double base_delay_seconds_;
    double max_delay_seconds_;
    double multiplier_;
    double jitter_factor_;
};

#pragma once
#include "types.hpp"
#include <optional>
#include <chrono>

struct Evaluation {
    InstanceState state;
    std::optional<NotificationEvent> event;
};

// Applies one probe outcome to an instance's state. Emits an alert only on the
// Healthy -> Unhealthy edge once the failure threshold is reached, and a
// recovery only on the Unhealthy -> Healthy edge. Pure: the caller commits the
// returned state and supplies the event timestamp.
class TransitionEvaluator {
public:
    static Evaluation evaluate(const MonitoredInstance& instance,
                               const InstanceState& state,
                               const ProbeOutcome& outcome,
                               int threshold,
                               std::chrono::system_clock::time_point now = std::chrono::system_clock::now());
};

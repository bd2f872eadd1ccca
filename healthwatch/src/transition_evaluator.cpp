#include "transition_evaluator.hpp"

namespace {

NotificationEvent make_event(const MonitoredInstance& instance, Health previous, const InstanceState& next,
                             const std::string& reason, std::chrono::system_clock::time_point now) {
    NotificationEvent event;
    event.kind = instance.kind;
    event.address = instance.address;
    event.label = instance.label;
    event.previous_health = previous;
    event.new_health = next.health;
    event.reason = reason;
    event.consecutive_failures = next.consecutive_failures;
    event.timestamp = now;
    return event;
}

} // namespace

Evaluation TransitionEvaluator::evaluate(const MonitoredInstance& instance,
                                         const InstanceState& state,
                                         const ProbeOutcome& outcome,
                                         int threshold,
                                         std::chrono::system_clock::time_point now) {
    Evaluation result{state, std::nullopt};
    InstanceState& next = result.state;

    if (outcome.success) {
        next.consecutive_failures = 0;
        if (state.health == Health::Unhealthy) {
            next.health = Health::Healthy;
            next.last_reason.clear();
            result.event = make_event(instance, state.health, next, outcome.reason, now);
        }
        return result;
    }

    next.consecutive_failures = state.consecutive_failures + 1;
    next.last_reason = outcome.reason;

    // Already Unhealthy: stay quiet until a success resets the counter
    if (state.health == Health::Healthy && next.consecutive_failures >= threshold) {
        next.health = Health::Unhealthy;
        result.event = make_event(instance, state.health, next, outcome.reason, now);
    }

    return result;
}

#pragma once
#include "backoff_policy.hpp"
#include "notifier.hpp"
#include "types.hpp"
#include <chrono>
#include <functional>
#include <string>
#include <nlohmann/json.hpp>

struct DispatchResult {
    enum class Kind {
        Delivered,
        FailedPermanently
    };

    Kind kind = Kind::FailedPermanently;
    int attempts = 0;
    std::string reason;

    bool delivered() const { return kind == Kind::Delivered; }

    static DispatchResult make_delivered(int attempts) { return {Kind::Delivered, attempts, ""}; }
    static DispatchResult make_failed(int attempts, std::string reason) {
        return {Kind::FailedPermanently, attempts, std::move(reason)};
    }
};

struct DispatchPolicy {
    int max_attempts = 3;
    BackoffPolicy backoff{1.0, 30.0};
    std::chrono::milliseconds max_rate_limit_wait{60000};
};

class NotificationDispatcher {
public:
    // Blocks for the given duration; returns false when interrupted by shutdown
    using WaitFn = std::function<bool(std::chrono::milliseconds)>;

    NotificationDispatcher(Notifier& notifier, DispatchPolicy policy, WaitFn wait, std::string host);

    // Formats the event and delivers it. Never throws for delivery failures.
    DispatchResult dispatch(const NotificationEvent& event);

    DispatchResult deliver(const nlohmann::json& payload, const std::string& description);

    const std::string& host() const { return host_; }

private:
    Notifier& notifier_;
    DispatchPolicy policy_;
    WaitFn wait_;
    std::string host_;
};

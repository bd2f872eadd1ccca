#include "notification_dispatcher.hpp"
#include "formatter.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <algorithm>

namespace {

double to_seconds(std::chrono::milliseconds ms) {
    return static_cast<double>(ms.count()) / 1000.0;
}

} // namespace

NotificationDispatcher::NotificationDispatcher(Notifier& notifier, DispatchPolicy policy, WaitFn wait, std::string host)
    : notifier_(notifier),
      policy_(std::move(policy)),
      wait_(std::move(wait)),
      host_(std::move(host)) {
}

DispatchResult NotificationDispatcher::dispatch(const NotificationEvent& event) {
    auto payload = Formatter::format_event(event, host_);
    auto kind = event.is_alert() ? "alert" : "recovery";
    auto result = deliver(payload, fmt::format("{} for {}", kind, event.label));

    if (result.delivered()) {
        if (event.is_alert()) {
            spdlog::warn("Alert sent: {} is UNHEALTHY - {}", event.label, event.reason);
        } else {
            spdlog::info("Recovery notification sent: {} is HEALTHY", event.label);
        }
    } else {
        // State already flipped; the missed notification is not retried next cycle
        spdlog::error("Failed to send {} for {}: {}", kind, event.label, result.reason);
    }
    return result;
}

DispatchResult NotificationDispatcher::deliver(const nlohmann::json& payload, const std::string& description) {
    std::string last_error;

    for (int attempt = 1; attempt <= policy_.max_attempts; ++attempt) {
        SendResult sent;
        try {
            sent = notifier_.send(payload);
        } catch (const std::exception& e) {
            sent.status = SendStatus::Transient;
            sent.detail = fmt::format("Notifier error: {}", e.what());
        }

        if (sent.ok()) {
            spdlog::debug("Delivered {} on attempt {}/{}", description, attempt, policy_.max_attempts);
            return DispatchResult::make_delivered(attempt);
        }

        last_error = sent.detail;

        if (sent.status == SendStatus::Permanent) {
            spdlog::error("Delivery of {} rejected permanently (attempt {}/{}): {}",
                          description, attempt, policy_.max_attempts, sent.detail);
            return DispatchResult::make_failed(attempt, sent.detail);
        }

        if (attempt == policy_.max_attempts) {
            spdlog::error("Delivery of {} failed (attempt {}/{}): {}",
                          description, attempt, policy_.max_attempts, sent.detail);
            break;
        }

        std::chrono::milliseconds delay;
        if (sent.status == SendStatus::RateLimited && sent.retry_after) {
            // Server-specified wait replaces the exponential delay for this attempt only
            delay = std::min(*sent.retry_after, policy_.max_rate_limit_wait);
            spdlog::warn("Rate-limited delivering {}; retrying after {:.1f} s (attempt {}/{})",
                         description, to_seconds(delay), attempt, policy_.max_attempts);
        } else {
            delay = policy_.backoff.delay_for_attempt(attempt);
            spdlog::warn("Delivery of {} failed (attempt {}/{}): {}; retrying in {:.1f} s",
                         description, attempt, policy_.max_attempts, sent.detail, to_seconds(delay));
        }

        if (!wait_(delay)) {
            spdlog::warn("Shutdown requested while retrying {}; abandoning delivery", description);
            return DispatchResult::make_failed(attempt, "interrupted by shutdown");
        }
    }

    return DispatchResult::make_failed(policy_.max_attempts,
        fmt::format("giving up after {} attempts: {}", policy_.max_attempts, last_error));
}

#include "notifier.hpp"
#include "util.hpp"
#include "version.hpp"
#include <cpr/cpr.h>
#include <fmt/format.h>
#include <algorithm>
#include <cmath>
#include <cstdlib>

namespace {

// Upper bound for a server-specified wait; larger values would overflow milliseconds
constexpr double kMaxRetryAfterSeconds = 86400.0;

std::optional<std::chrono::milliseconds> seconds_to_ms(double seconds) {
    if (!std::isfinite(seconds) || seconds < 0) {
        return std::nullopt;
    }
    seconds = std::min(seconds, kMaxRetryAfterSeconds);
    return std::chrono::milliseconds(static_cast<long long>(std::llround(seconds * 1000.0)));
}

std::optional<std::chrono::milliseconds> parse_retry_after(const std::string& body, const std::string& header) {
    auto data = nlohmann::json::parse(body, nullptr, false);
    if (!data.is_discarded() && data.is_object()) {
        auto it = data.find("retry_after");
        if (it != data.end() && it->is_number()) {
            return seconds_to_ms(it->get<double>());
        }
    }

    auto raw = util::trim(header);
    if (!raw.empty()) {
        char* end = nullptr;
        double seconds = std::strtod(raw.c_str(), &end);
        if (end == raw.c_str() + raw.size()) {
            return seconds_to_ms(seconds);
        }
    }
    return std::nullopt;
}

} // namespace

std::string to_string(SendStatus status) {
    switch (status) {
        case SendStatus::Delivered: return "delivered";
        case SendStatus::RateLimited: return "rate_limited";
        case SendStatus::Transient: return "transient";
        case SendStatus::Permanent: return "permanent";
    }
    return "unknown";
}

class DiscordNotifier::Impl {
public:
    explicit Impl(const Config& config) {
        session_.SetUrl(cpr::Url{config.discord_webhook_url});
        session_.SetTimeout(cpr::Timeout{config.notify_timeout_seconds * 1000});
        session_.SetHeader(cpr::Header{
            {"Content-Type", "application/json"},
            {"User-Agent", "healthwatch/" HEALTHWATCH_VERSION}
        });
    }

    SendResult send(const nlohmann::json& payload) {
        session_.SetBody(cpr::Body{util::dump_json(payload)});
        cpr::Response response = session_.Post();

        if (response.error) {
            SendResult result;
            result.status = SendStatus::Transient;
            result.detail = fmt::format("Webhook request failed: {}", response.error.message);
            return result;
        }

        std::string retry_after_header;
        auto it = response.header.find("Retry-After");
        if (it != response.header.end()) {
            retry_after_header = it->second;
        }

        return DiscordNotifier::classify_response(response.status_code, response.text, retry_after_header);
    }

private:
    cpr::Session session_;
};

DiscordNotifier::DiscordNotifier(const Config& config)
    : pImpl_(std::make_unique<Impl>(config)) {}

DiscordNotifier::~DiscordNotifier() = default;

SendResult DiscordNotifier::send(const nlohmann::json& payload) {
    return pImpl_->send(payload);
}

SendResult DiscordNotifier::classify_response(long status_code, const std::string& body,
                                              const std::string& retry_after_header) {
    SendResult result;
    result.status_code = status_code;

    if (status_code >= 200 && status_code < 300) {
        result.status = SendStatus::Delivered;
        return result;
    }

    result.detail = fmt::format("Webhook returned {}: {}", status_code, util::truncate(body, 200));

    if (status_code == 429) {
        result.status = SendStatus::RateLimited;
        result.retry_after = parse_retry_after(body, retry_after_header);
    } else if (status_code == 408 || status_code >= 500 || status_code < 400) {
        result.status = SendStatus::Transient;
    } else {
        result.status = SendStatus::Permanent;
    }
    return result;
}

#include "formatter.hpp"
#include "util.hpp"
#include "version.hpp"
#include <fmt/format.h>

using json = nlohmann::json;

namespace {

std::string join(const std::vector<std::string>& items, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) out += sep;
        out += items[i];
    }
    return out;
}

} // namespace

json Formatter::format_event(const NotificationEvent& event, const std::string& host) {
    auto when = util::format_utc(event.timestamp);

    if (event.is_alert()) {
        json fields = json::array({
            field("Service", event.label, true),
            field("Status", to_string(Health::Unhealthy), true),
            field("Timestamp", when, false),
            field("Reason", event.reason.empty() ? "No reason reported" : event.reason, false),
            field("Host", host, true)
        });
        return embed(
            fmt::format("⚠️ {} is DOWN", event.label),
            fmt::format("{} has failed {} consecutive health checks.", event.label, event.consecutive_failures),
            COLOR_ALERT, std::move(fields), host, event.timestamp);
    }

    json fields = json::array({
        field("Service", event.label, true),
        field("Status", to_string(Health::Healthy), true),
        field("Timestamp", when, false),
        field("Host", host, true)
    });
    return embed(
        fmt::format("✅ {} has RECOVERED", event.label),
        fmt::format("{} is back online and healthy.", event.label),
        COLOR_RECOVERY, std::move(fields), host, event.timestamp);
}

json Formatter::format_startup(const Config& config, const std::string& host,
                               std::chrono::system_clock::time_point now) {
    json fields = json::array({
        field("Host", host, true),
        field("Interval", fmt::format("{}s", config.check_interval_seconds), true),
        field("Failure Threshold", std::to_string(config.failure_threshold), true),
        field("Loki", join(config.loki_urls, ", "), false),
        field("Grafana", join(config.grafana_urls, ", "), false),
        field("Started At", util::format_utc(now), false)
    });
    return embed("\U0001f441️ healthwatch is now watching", HEALTHWATCH_BANNER,
                 COLOR_STARTUP, std::move(fields), host, now);
}

json Formatter::embed(const std::string& title, const std::string& description, int color,
                      json fields, const std::string& host, std::chrono::system_clock::time_point now) {
    return {
        {"embeds", json::array({
            {
                {"title", title},
                {"description", description},
                {"color", color},
                {"fields", std::move(fields)},
                {"timestamp", util::format_iso8601(now)},
                {"footer", {{"text", fmt::format("healthwatch v{} • {}", HEALTHWATCH_VERSION, host)}}}
            }
        })}
    };
}

json Formatter::field(const std::string& name, const std::string& value, bool inline_field) {
    return {
        {"name", name},
        {"value", util::truncate(value, MAX_FIELD_LENGTH)},
        {"inline", inline_field}
    };
}

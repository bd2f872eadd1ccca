#pragma once

#include <string>
#include <vector>
#include <optional>
#include <chrono>

enum class ServiceKind {
    Loki,
    Grafana
};

enum class Health {
    Healthy,
    Unhealthy
};

std::string to_string(ServiceKind kind);
std::string to_string(Health health);

struct MonitoredInstance {
    ServiceKind kind;
    std::string address;
    std::string label;

    // "Loki" for a single instance, "Loki (host:3100)" when the kind has several
    static std::string make_label(ServiceKind kind, const std::string& address, size_t total);

    static std::vector<MonitoredInstance> from_urls(ServiceKind kind, const std::vector<std::string>& urls);
};

struct InstanceState {
    Health health = Health::Healthy;  // optimistic until the threshold says otherwise
    int consecutive_failures = 0;
    std::string last_reason;
};

struct ProbeOutcome {
    bool success = false;
    std::string reason;

    static ProbeOutcome healthy(std::string reason = "") { return {true, std::move(reason)}; }
    static ProbeOutcome unhealthy(std::string reason) { return {false, std::move(reason)}; }
};

struct NotificationEvent {
    ServiceKind kind;
    std::string address;
    std::string label;
    Health previous_health;
    Health new_health;
    std::string reason;
    int consecutive_failures = 0;
    std::chrono::system_clock::time_point timestamp;

    bool is_alert() const { return new_health == Health::Unhealthy; }
    bool is_recovery() const { return new_health == Health::Healthy; }
};

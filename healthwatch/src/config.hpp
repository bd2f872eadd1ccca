#pragma once
#include <string>
#include <vector>
#include <stdexcept>

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class Config {
public:
    // Monitored services (comma-separated in the environment)
    std::vector<std::string> loki_urls;
    std::vector<std::string> grafana_urls;

    // Discord webhook
    std::string discord_webhook_url;

    // Polling
    int check_interval_seconds = 120;
    int failure_threshold = 2;
    int request_timeout_seconds = 10;

    // Notification delivery
    int notify_timeout_seconds = 15;
    int notify_max_attempts = 3;
    double notify_base_backoff_seconds = 1.0;
    double notify_max_backoff_seconds = 30.0;
    double notify_max_rate_limit_wait_seconds = 60.0;

    // Upper bound for any configured delay
    static constexpr double MAX_DELAY_SECONDS = 86400.0;

    // Logging
    std::string log_level = "info";
    std::string log_file = "/var/log/healthwatch/healthwatch.log";

    // Status endpoint, disabled when the port is 0
    std::string status_host = "127.0.0.1";
    int status_port = 0;

    static Config from_env();
    void validate() const;
};

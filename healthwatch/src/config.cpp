#include "config.hpp"
#include "util.hpp"
#include <fmt/format.h>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <utility>

namespace {

int get_env_int(const std::string& name, int default_value) {
    std::string raw = util::trim(util::get_env_var(name, std::to_string(default_value)));
    int value = 0;
    auto result = std::from_chars(raw.data(), raw.data() + raw.size(), value);
    if (result.ec != std::errc() || result.ptr != raw.data() + raw.size()) {
        throw ConfigError(fmt::format("'{}' must be an integer, got '{}'", name, raw));
    }
    return value;
}

double get_env_double(const std::string& name, double default_value) {
    std::string raw = util::trim(util::get_env_var(name));
    if (raw.empty()) {
        return default_value;
    }
    char* end = nullptr;
    double value = std::strtod(raw.c_str(), &end);
    if (end != raw.c_str() + raw.size()) {
        throw ConfigError(fmt::format("'{}' must be a number, got '{}'", name, raw));
    }
    return value;
}

std::vector<std::string> get_required_urls(const std::string& name) {
    std::string raw;
    try {
        raw = util::get_required_env_var(name);
    } catch (const std::runtime_error& e) {
        throw ConfigError(e.what());
    }
    auto urls = util::split_string(raw, ',');
    if (urls.empty()) {
        throw ConfigError(fmt::format("'{}' contains no valid URLs", name));
    }
    return urls;
}

} // namespace

Config Config::from_env() {
    Config config;

    config.loki_urls = get_required_urls("LOKI_URL");
    config.grafana_urls = get_required_urls("GRAFANA_URL");

    try {
        config.discord_webhook_url = util::trim(util::get_required_env_var("DISCORD_WEBHOOK_URL"));
    } catch (const std::runtime_error& e) {
        throw ConfigError(e.what());
    }

    config.check_interval_seconds = get_env_int("CHECK_INTERVAL_SECONDS", config.check_interval_seconds);
    config.failure_threshold = get_env_int("FAILURE_THRESHOLD", config.failure_threshold);
    config.request_timeout_seconds = get_env_int("REQUEST_TIMEOUT_SECONDS", config.request_timeout_seconds);

    config.notify_timeout_seconds = get_env_int("NOTIFY_TIMEOUT_SECONDS", config.notify_timeout_seconds);
    config.notify_max_attempts = get_env_int("NOTIFY_MAX_ATTEMPTS", config.notify_max_attempts);
    config.notify_base_backoff_seconds = get_env_double("NOTIFY_BASE_BACKOFF_SECONDS", config.notify_base_backoff_seconds);
    config.notify_max_backoff_seconds = get_env_double("NOTIFY_MAX_BACKOFF_SECONDS", config.notify_max_backoff_seconds);
    config.notify_max_rate_limit_wait_seconds =
        get_env_double("NOTIFY_MAX_RATE_LIMIT_WAIT_SECONDS", config.notify_max_rate_limit_wait_seconds);

    config.log_level = util::to_lower(util::trim(util::get_env_var("LOG_LEVEL", config.log_level)));
    config.log_file = util::get_env_var("LOG_FILE", config.log_file);

    config.status_host = util::get_env_var("STATUS_HOST", config.status_host);
    config.status_port = get_env_int("STATUS_PORT", config.status_port);

    return config;
}

void Config::validate() const {
    for (const auto& [name, urls] : {std::pair{"LOKI_URL", &loki_urls}, std::pair{"GRAFANA_URL", &grafana_urls}}) {
        if (urls->empty()) {
            throw ConfigError(fmt::format("'{}' contains no valid URLs", name));
        }
        for (const auto& url : *urls) {
            if (!util::is_valid_http_url(url)) {
                throw ConfigError(fmt::format("'{}' contains an invalid URL: {}", name, url));
            }
        }
    }

    if (!util::is_valid_http_url(discord_webhook_url)) {
        throw ConfigError(fmt::format("'DISCORD_WEBHOOK_URL' is not a valid URL: {}", discord_webhook_url));
    }

    if (check_interval_seconds < 1) {
        throw ConfigError("CHECK_INTERVAL_SECONDS must be >= 1");
    }

    if (failure_threshold < 1) {
        throw ConfigError("FAILURE_THRESHOLD must be >= 1");
    }

    if (request_timeout_seconds < 1) {
        throw ConfigError("REQUEST_TIMEOUT_SECONDS must be >= 1");
    }

    if (notify_timeout_seconds < 1) {
        throw ConfigError("NOTIFY_TIMEOUT_SECONDS must be >= 1");
    }

    if (notify_max_attempts < 1) {
        throw ConfigError("NOTIFY_MAX_ATTEMPTS must be >= 1");
    }

    for (const auto& [name, value] : {std::pair{"NOTIFY_BASE_BACKOFF_SECONDS", notify_base_backoff_seconds},
                                      std::pair{"NOTIFY_MAX_BACKOFF_SECONDS", notify_max_backoff_seconds},
                                      std::pair{"NOTIFY_MAX_RATE_LIMIT_WAIT_SECONDS", notify_max_rate_limit_wait_seconds}}) {
        if (!std::isfinite(value) || value <= 0 || value > MAX_DELAY_SECONDS) {
            throw ConfigError(fmt::format("{} must be > 0 and <= {}", name, MAX_DELAY_SECONDS));
        }
    }

    if (notify_max_backoff_seconds < notify_base_backoff_seconds) {
        throw ConfigError("NOTIFY_BASE_BACKOFF_SECONDS must not exceed NOTIFY_MAX_BACKOFF_SECONDS");
    }

    if (!util::parse_log_level(log_level)) {
        throw ConfigError(fmt::format("Invalid LOG_LEVEL '{}'", log_level));
    }

    if (status_port < 0 || status_port > 65535) {
        throw ConfigError("STATUS_PORT must be between 0 and 65535");
    }
}

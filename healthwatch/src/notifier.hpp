#pragma once
#include "config.hpp"
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

enum class SendStatus {
    Delivered,
    RateLimited,   // server asked us to wait before retrying
    Transient,     // network error, timeout, 5xx, 408
    Permanent      // remaining 4xx, retrying cannot help
};

std::string to_string(SendStatus status);

struct SendResult {
    SendStatus status = SendStatus::Transient;
    long status_code = 0;
    std::optional<std::chrono::milliseconds> retry_after;
    std::string detail;

    bool ok() const { return status == SendStatus::Delivered; }
};

// One delivery attempt of a payload to the outbound channel
class Notifier {
public:
    virtual ~Notifier() = default;
    virtual SendResult send(const nlohmann::json& payload) = 0;
};

class DiscordNotifier : public Notifier {
public:
    explicit DiscordNotifier(const Config& config);
    ~DiscordNotifier() override;

    DiscordNotifier(const DiscordNotifier&) = delete;
    DiscordNotifier& operator=(const DiscordNotifier&) = delete;

    SendResult send(const nlohmann::json& payload) override;

    // Maps an HTTP exchange to a SendResult; Retry-After comes from the JSON
    // body's "retry_after" (seconds) or the Retry-After header
    static SendResult classify_response(long status_code, const std::string& body,
                                        const std::string& retry_after_header);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};

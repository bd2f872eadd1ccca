#pragma once
#include "config.hpp"
#include "types.hpp"
#include <chrono>
#include <string>
#include <nlohmann/json.hpp>

// Builds Discord webhook embed payloads
class Formatter {
public:
    static constexpr int COLOR_ALERT = 0xFF0000;
    static constexpr int COLOR_RECOVERY = 0x00FF00;
    static constexpr int COLOR_STARTUP = 0x3498DB;

    static constexpr size_t MAX_FIELD_LENGTH = 1024;

    static nlohmann::json format_event(const NotificationEvent& event, const std::string& host);
    static nlohmann::json format_startup(const Config& config, const std::string& host,
                                         std::chrono::system_clock::time_point now);

private:
    static nlohmann::json embed(const std::string& title, const std::string& description, int color,
                                nlohmann::json fields, const std::string& host,
                                std::chrono::system_clock::time_point now);
    static nlohmann::json field(const std::string& name, const std::string& value, bool inline_field);
};

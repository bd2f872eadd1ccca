#pragma once
#include <string>
#include <vector>
#include <optional>
#include <chrono>
#include <spdlog/common.h>
#include <nlohmann/json_fwd.hpp>

namespace util {

// Environment variable helpers
std::string get_env_var(const std::string& name, const std::string& default_value = "");
std::string get_required_env_var(const std::string& name);

// Reads KEY=VALUE lines into the environment without overriding variables
// that are already set. Returns the number of variables applied.
int load_dotenv(const std::string& path = ".env");

// String utilities
std::vector<std::string> split_string(const std::string& str, char delimiter);
std::string trim(const std::string& str);
std::string to_lower(std::string str);
std::string truncate(const std::string& str, size_t max_len);

// Serializes JSON, replacing invalid UTF-8 instead of throwing
std::string dump_json(const nlohmann::json& value);

// URL utilities
bool is_valid_http_url(const std::string& url);
std::string url_authority(const std::string& url);
std::string join_url(const std::string& base, const std::string& path);

// Time utilities
std::string current_iso8601();
std::string format_iso8601(const std::chrono::system_clock::time_point& tp);
std::string format_utc(const std::chrono::system_clock::time_point& tp);

std::string hostname();

// Random utilities
double random_jitter(double base_value, double jitter_factor = 0.1);

// Logging
std::optional<spdlog::level::level_enum> parse_log_level(const std::string& level);
void setup_logging(const std::string& level, const std::string& log_file,
                   size_t max_bytes = 10 * 1024 * 1024, size_t max_files = 5);

} // namespace util

#include "util.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <cstdlib>
#include <stdexcept>
#include <sstream>
#include <fstream>
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <filesystem>
#include <random>
#include <unistd.h>

namespace util {

std::string get_env_var(const std::string& name, const std::string& default_value) {
    const char* value = std::getenv(name.c_str());
    return value ? std::string(value) : default_value;
}

std::string get_required_env_var(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (!value || std::string(value).empty()) {
        throw std::runtime_error("Required environment variable '" + name + "' is not set");
    }
    return std::string(value);
}

int load_dotenv(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return 0;
    }

    int applied = 0;
    std::string line;
    while (std::getline(file, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;
        if (line.rfind("export ", 0) == 0) {
            line = trim(line.substr(7));
        }

        auto eq = line.find('=');
        if (eq == std::string::npos) continue;

        std::string key = trim(line.substr(0, eq));
        std::string value = trim(line.substr(eq + 1));
        if (key.empty()) continue;

        // Strip matching quotes
        if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front()) {
            value = value.substr(1, value.size() - 2);
        }

        if (setenv(key.c_str(), value.c_str(), 0) == 0) {
            applied++;
        }
    }
    return applied;
}

std::vector<std::string> split_string(const std::string& str, char delimiter) {
    std::vector<std::string> tokens;
    std::stringstream ss(str);
    std::string token;

    while (std::getline(ss, token, delimiter)) {
        token = trim(token);
        if (!token.empty()) {
            tokens.push_back(token);
        }
    }

    return tokens;
}

std::string trim(const std::string& str) {
    auto start = str.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) return "";

    auto end = str.find_last_not_of(" \t\n\r");
    return str.substr(start, end - start + 1);
}

std::string to_lower(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return str;
}

std::string truncate(const std::string& str, size_t max_len) {
    if (str.size() <= max_len) return str;
    // Never cut inside a multi-byte UTF-8 sequence
    size_t cut = max_len;
    while (cut > 0 && (static_cast<unsigned char>(str[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    return str.substr(0, cut);
}

std::string dump_json(const nlohmann::json& value) {
    return value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

bool is_valid_http_url(const std::string& url) {
    auto scheme_end = url.find("://");
    if (scheme_end == std::string::npos) {
        return false;
    }

    std::string scheme = to_lower(url.substr(0, scheme_end));
    if (scheme != "http" && scheme != "https") {
        return false;
    }

    return !url_authority(url).empty();
}

std::string url_authority(const std::string& url) {
    auto scheme_end = url.find("://");
    size_t start = scheme_end == std::string::npos ? 0 : scheme_end + 3;
    auto end = url.find_first_of("/?#", start);
    return url.substr(start, end == std::string::npos ? std::string::npos : end - start);
}

std::string join_url(const std::string& base, const std::string& path) {
    auto end = base.find_last_not_of('/');
    std::string stripped = end == std::string::npos ? "" : base.substr(0, end + 1);
    return stripped + path;
}

std::string current_iso8601() {
    return format_iso8601(std::chrono::system_clock::now());
}

std::string format_iso8601(const std::chrono::system_clock::time_point& tp) {
    auto time_t = std::chrono::system_clock::to_time_t(tp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch() % std::chrono::seconds(1)).count();

    std::tm tm{};
    gmtime_r(&time_t, &tm);

    std::stringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
    ss << '.' << std::setfill('0') << std::setw(3) << ms << "+00:00";
    return ss.str();
}

std::string format_utc(const std::chrono::system_clock::time_point& tp) {
    auto time_t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&time_t, &tm);

    std::stringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << " UTC";
    return ss.str();
}

std::string hostname() {
    char buf[256] = {0};
    if (gethostname(buf, sizeof(buf) - 1) != 0) {
        return "unknown-host";
    }
    return std::string(buf);
}

double random_jitter(double base_value, double jitter_factor) {
    if (jitter_factor <= 0.0) {
        return base_value;
    }
    static thread_local std::mt19937 gen(std::random_device{}());
    std::uniform_real_distribution<> dis(-jitter_factor, jitter_factor);
    return base_value * (1.0 + dis(gen));
}

std::optional<spdlog::level::level_enum> parse_log_level(const std::string& level) {
    auto lower = to_lower(level);
    if (lower == "debug") return spdlog::level::debug;
    if (lower == "info") return spdlog::level::info;
    if (lower == "warn" || lower == "warning") return spdlog::level::warn;
    if (lower == "error") return spdlog::level::err;
    if (lower == "critical") return spdlog::level::critical;
    return std::nullopt;
}

void setup_logging(const std::string& level, const std::string& log_file, size_t max_bytes, size_t max_files) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

    std::string file_error;
    if (!log_file.empty()) {
        try {
            auto dir = std::filesystem::path(log_file).parent_path();
            if (!dir.empty()) {
                std::filesystem::create_directories(dir);
            }
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(log_file, max_bytes, max_files));
        } catch (const std::exception& e) {
            // Running outside the service account usually lacks write access
            file_error = e.what();
        }
    }

    auto logger = std::make_shared<spdlog::logger>("healthwatch", sinks.begin(), sinks.end());
    spdlog::set_default_logger(logger);
    spdlog::set_level(parse_log_level(level).value_or(spdlog::level::info));
    spdlog::set_pattern("%Y-%m-%dT%H:%M:%S%z [%l] %v");
    spdlog::flush_on(spdlog::level::info);

    if (!file_error.empty()) {
        spdlog::warn("Could not set up file logging at {}: {}", log_file, file_error);
    }
}

} // namespace util

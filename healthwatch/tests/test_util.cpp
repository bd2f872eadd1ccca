// ============================================================================
// UTILITY TESTS
// ============================================================================

#include <gtest/gtest.h>
#include "util.hpp"
#include <nlohmann/json.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <unistd.h>

TEST(Util, SplitStringTrimsAndSkipsEmptyPieces) {
    auto parts = util::split_string(" a , b,,c ,", ',');
    EXPECT_EQ(parts, (std::vector<std::string>{"a", "b", "c"}));
    EXPECT_TRUE(util::split_string("", ',').empty());
}

TEST(Util, TrimAndLower) {
    EXPECT_EQ(util::trim("\t hello \r\n"), "hello");
    EXPECT_EQ(util::trim("   "), "");
    EXPECT_EQ(util::to_lower("WaRn"), "warn");
}

TEST(Util, Truncate) {
    EXPECT_EQ(util::truncate("abcdef", 3), "abc");
    EXPECT_EQ(util::truncate("ab", 3), "ab");
}

TEST(Util, HttpUrlValidation) {
    EXPECT_TRUE(util::is_valid_http_url("http://loki:3100"));
    EXPECT_TRUE(util::is_valid_http_url("HTTPS://grafana.example/path"));
    EXPECT_FALSE(util::is_valid_http_url("loki:3100"));
    EXPECT_FALSE(util::is_valid_http_url("tcp://loki:3100"));
    EXPECT_FALSE(util::is_valid_http_url("http:///ready"));
}

TEST(Util, UrlAuthorityAndJoin) {
    EXPECT_EQ(util::url_authority("http://loki-2:3100/ready?x=1"), "loki-2:3100");
    EXPECT_EQ(util::url_authority("https://grafana.example"), "grafana.example");
    EXPECT_EQ(util::join_url("http://loki:3100//", "/ready"), "http://loki:3100/ready");
    EXPECT_EQ(util::join_url("http://loki:3100", "/ready"), "http://loki:3100/ready");
}

TEST(Util, TimeFormatting) {
    auto tp = std::chrono::system_clock::from_time_t(1700000000) + std::chrono::milliseconds(42);
    EXPECT_EQ(util::format_iso8601(tp), "2023-11-14T22:13:20.042+00:00");
    EXPECT_EQ(util::format_utc(tp), "2023-11-14 22:13:20 UTC");
}

TEST(Util, ParseLogLevel) {
    EXPECT_EQ(util::parse_log_level("DEBUG"), spdlog::level::debug);
    EXPECT_EQ(util::parse_log_level("warning"), spdlog::level::warn);
    EXPECT_EQ(util::parse_log_level("error"), spdlog::level::err);
    EXPECT_FALSE(util::parse_log_level("trace").has_value());
}

TEST(Util, RandomJitterWithoutFactorIsIdentity) {
    EXPECT_DOUBLE_EQ(util::random_jitter(2.5, 0.0), 2.5);
    double jittered = util::random_jitter(10.0, 0.2);
    EXPECT_GE(jittered, 8.0);
    EXPECT_LE(jittered, 12.0);
}

TEST(Util, LoadDotenvDoesNotOverrideExistingVariables) {
    auto path = std::filesystem::temp_directory_path() / ("healthwatch_dotenv_" + std::to_string(getpid()));
    {
        std::ofstream out(path);
        out << "# comment\n"
            << "HW_TEST_NEW=\"quoted value\"\n"
            << "export HW_TEST_EXPORTED=yes\n"
            << "HW_TEST_EXISTING=from-file\n"
            << "not a pair\n";
    }
    unsetenv("HW_TEST_NEW");
    unsetenv("HW_TEST_EXPORTED");
    setenv("HW_TEST_EXISTING", "from-env", 1);

    util::load_dotenv(path.string());

    EXPECT_EQ(util::get_env_var("HW_TEST_NEW"), "quoted value");
    EXPECT_EQ(util::get_env_var("HW_TEST_EXPORTED"), "yes");
    EXPECT_EQ(util::get_env_var("HW_TEST_EXISTING"), "from-env");

    std::filesystem::remove(path);
    unsetenv("HW_TEST_NEW");
    unsetenv("HW_TEST_EXPORTED");
    unsetenv("HW_TEST_EXISTING");
}

TEST(Util, MissingDotenvFileIsIgnored) {
    EXPECT_EQ(util::load_dotenv("/nonexistent/healthwatch/.env"), 0);
}

TEST(Util, RequiredEnvVarThrowsWhenUnset) {
    unsetenv("HW_TEST_REQUIRED");
    EXPECT_THROW(util::get_required_env_var("HW_TEST_REQUIRED"), std::runtime_error);
    EXPECT_EQ(util::get_env_var("HW_TEST_REQUIRED", "fallback"), "fallback");
}

TEST(Util, TruncateBacksOffToUtf8Boundary) {
    std::string text = "ab\xC3\xA9";  // "abé"
    EXPECT_EQ(util::truncate(text, 3), "ab");
    EXPECT_EQ(util::truncate(text, 4), text);
    EXPECT_EQ(util::truncate("\xE2\x80\xA6\xE2\x80\xA6", 4), "\xE2\x80\xA6");
}

TEST(Util, DumpJsonReplacesInvalidUtf8) {
    nlohmann::json value = {{"reason", "bad \xFF"}};
    EXPECT_EQ(util::dump_json(value), "{\"reason\":\"bad \xEF\xBF\xBD\"}");
}

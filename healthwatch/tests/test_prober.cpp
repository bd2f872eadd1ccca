// ============================================================================
// HTTP PROBER RESPONSE CHECKS
// ============================================================================

#include <gtest/gtest.h>
#include "prober.hpp"
#include <nlohmann/json.hpp>

TEST(HttpProber, HealthEndpointsPerServiceKind) {
    EXPECT_EQ(HttpProber::health_endpoint(ServiceKind::Loki, "http://loki:3100"), "http://loki:3100/ready");
    EXPECT_EQ(HttpProber::health_endpoint(ServiceKind::Loki, "http://loki:3100/"), "http://loki:3100/ready");
    EXPECT_EQ(HttpProber::health_endpoint(ServiceKind::Grafana, "https://grafana.example/"),
              "https://grafana.example/api/health");
}

TEST(HttpProber, LokiReadyBodyIsHealthy) {
    EXPECT_TRUE(HttpProber::check_loki_response("http://loki:3100/ready", 200, "ready\n").success);
    EXPECT_TRUE(HttpProber::check_loki_response("http://loki:3100/ready", 200, "Ready").success);
}

TEST(HttpProber, LokiNon200IsUnhealthy) {
    auto outcome = HttpProber::check_loki_response("http://loki:3100/ready", 503, "Ingester not ready");
    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.reason, "HTTP 503 from http://loki:3100/ready");
}

TEST(HttpProber, LokiBodyWithoutReadyIsUnhealthy) {
    auto outcome = HttpProber::check_loki_response("http://loki:3100/ready", 200, "starting up");
    EXPECT_FALSE(outcome.success);
    EXPECT_NE(outcome.reason.find("does not contain 'ready'"), std::string::npos);
}

TEST(HttpProber, GrafanaDatabaseOkIsHealthy) {
    auto outcome = HttpProber::check_grafana_response(
        "http://grafana:3000/api/health", 200, R"({"commit": "abc", "database": "ok", "version": "10.2.0"})");
    EXPECT_TRUE(outcome.success);
}

TEST(HttpProber, GrafanaDatabaseFailingIsUnhealthy) {
    auto outcome = HttpProber::check_grafana_response("http://grafana:3000/api/health", 200, R"({"database": "failing"})");
    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.reason, "Database field is 'failing', expected 'ok'");
}

TEST(HttpProber, GrafanaMissingDatabaseFieldIsUnhealthy) {
    auto outcome = HttpProber::check_grafana_response("http://grafana:3000/api/health", 200, R"({"version": "10"})");
    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.reason, "Database field is 'missing', expected 'ok'");
}

TEST(HttpProber, GrafanaInvalidJsonIsUnhealthy) {
    auto outcome = HttpProber::check_grafana_response("http://grafana:3000/api/health", 200, "<html>oops</html>");
    EXPECT_FALSE(outcome.success);
    EXPECT_NE(outcome.reason.find("Invalid JSON response"), std::string::npos);
}

TEST(HttpProber, GrafanaNon200IsUnhealthy) {
    auto outcome = HttpProber::check_grafana_response("http://grafana:3000/api/health", 502, "");
    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.reason, "HTTP 502 from http://grafana:3000/api/health");
}

TEST(HttpProber, UnreachableHostReportsConnectionFailure) {
    // Port 9 on loopback is discard and normally closed
    HttpProber prober(ServiceKind::Loki, 1);
    auto outcome = prober.probe("http://127.0.0.1:9");
    EXPECT_FALSE(outcome.success);
    EXPECT_FALSE(outcome.reason.empty());
}

TEST(HttpProber, NonAsciiBodyIsTruncatedOnCharacterBoundary) {
    // "é" straddles the 120 byte cut
    std::string body = std::string(119, 'x') + "\xC3\xA9\xE2\x80\xA6";
    auto outcome = HttpProber::check_loki_response("http://loki:3100/ready", 200, body);
    ASSERT_FALSE(outcome.success);
    EXPECT_EQ(outcome.reason, "Response body does not contain 'ready': " + std::string(119, 'x'));
    EXPECT_NO_THROW(nlohmann::json(outcome.reason).dump());
}

TEST(HttpProber, InvalidJsonWithMultiByteTextKeepsReasonValid) {
    std::string body = "<p>" + std::string(116, 'y') + "\xE2\x80\xA6</p>";
    auto outcome = HttpProber::check_grafana_response("http://grafana:3000/api/health", 200, body);
    ASSERT_FALSE(outcome.success);
    EXPECT_NO_THROW(nlohmann::json(outcome.reason).dump());
}

#include "prober.hpp"
#include "util.hpp"
#include "version.hpp"
#include <cpr/cpr.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <unordered_map>

class HttpProber::Impl {
public:
    Impl(ServiceKind kind, int timeout_seconds)
        : kind_(kind), timeout_ms_(timeout_seconds * 1000) {}

    ProbeOutcome probe(const std::string& address) {
        auto endpoint = HttpProber::health_endpoint(kind_, address);
        auto& session = session_for(address);
        session.SetUrl(cpr::Url{endpoint});

        cpr::Response response = session.Get();

        if (response.error) {
            if (response.error.code == cpr::ErrorCode::OPERATION_TIMEDOUT) {
                return ProbeOutcome::unhealthy(fmt::format("Request timed out after {}s", timeout_ms_ / 1000));
            }
            return ProbeOutcome::unhealthy(fmt::format("Connection error: {}", response.error.message));
        }

        switch (kind_) {
            case ServiceKind::Loki:
                return HttpProber::check_loki_response(endpoint, response.status_code, response.text);
            case ServiceKind::Grafana:
                return HttpProber::check_grafana_response(endpoint, response.status_code, response.text);
        }
        return ProbeOutcome::unhealthy("Unknown service kind");
    }

private:
    // One pooled session per address so connections never cross instances
    cpr::Session& session_for(const std::string& address) {
        auto it = sessions_.find(address);
        if (it == sessions_.end()) {
            auto session = std::make_unique<cpr::Session>();
            session->SetTimeout(cpr::Timeout{timeout_ms_});
            session->SetHeader(cpr::Header{{"User-Agent", "healthwatch/" HEALTHWATCH_VERSION}});
            it = sessions_.emplace(address, std::move(session)).first;
            spdlog::debug("Opened probe session for {}", address);
        }
        return *it->second;
    }

    ServiceKind kind_;
    int timeout_ms_;
    std::unordered_map<std::string, std::unique_ptr<cpr::Session>> sessions_;
};

HttpProber::HttpProber(ServiceKind kind, int timeout_seconds)
    : pImpl_(std::make_unique<Impl>(kind, timeout_seconds)) {}

HttpProber::~HttpProber() = default;

ProbeOutcome HttpProber::probe(const std::string& address) {
    return pImpl_->probe(address);
}

std::string HttpProber::health_endpoint(ServiceKind kind, const std::string& address) {
    switch (kind) {
        case ServiceKind::Loki: return util::join_url(address, "/ready");
        case ServiceKind::Grafana: return util::join_url(address, "/api/health");
    }
    return address;
}

ProbeOutcome HttpProber::check_loki_response(const std::string& endpoint, long status_code, const std::string& body) {
    if (status_code != 200) {
        return ProbeOutcome::unhealthy(fmt::format("HTTP {} from {}", status_code, endpoint));
    }
    if (util::to_lower(body).find("ready") == std::string::npos) {
        return ProbeOutcome::unhealthy(
            fmt::format("Response body does not contain 'ready': {}", util::truncate(body, 120)));
    }
    return ProbeOutcome::healthy("Loki is ready");
}

ProbeOutcome HttpProber::check_grafana_response(const std::string& endpoint, long status_code, const std::string& body) {
    if (status_code != 200) {
        return ProbeOutcome::unhealthy(fmt::format("HTTP {} from {}", status_code, endpoint));
    }

    auto data = nlohmann::json::parse(body, nullptr, false);
    if (data.is_discarded() || !data.is_object()) {
        return ProbeOutcome::unhealthy(fmt::format("Invalid JSON response: {}", util::truncate(body, 120)));
    }

    auto it = data.find("database");
    if (it == data.end() || !it->is_string() || it->get<std::string>() != "ok") {
        std::string actual = it == data.end() ? "missing" : (it->is_string() ? it->get<std::string>() : it->dump());
        return ProbeOutcome::unhealthy(fmt::format("Database field is '{}', expected 'ok'", actual));
    }
    return ProbeOutcome::healthy("Grafana is healthy");
}

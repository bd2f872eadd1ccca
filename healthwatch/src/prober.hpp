#pragma once
#include "types.hpp"
#include <memory>
#include <string>

class Prober {
public:
    virtual ~Prober() = default;

    // One health check against `address`; never hangs past the configured timeout
    virtual ProbeOutcome probe(const std::string& address) = 0;
};

class HttpProber : public Prober {
public:
    HttpProber(ServiceKind kind, int timeout_seconds);
    ~HttpProber() override;

    HttpProber(const HttpProber&) = delete;
    HttpProber& operator=(const HttpProber&) = delete;

    ProbeOutcome probe(const std::string& address) override;

    static std::string health_endpoint(ServiceKind kind, const std::string& address);

    // Loki: 200 and a body containing "ready"
    static ProbeOutcome check_loki_response(const std::string& endpoint, long status_code, const std::string& body);
    // Grafana: 200 and a JSON body with "database": "ok"
    static ProbeOutcome check_grafana_response(const std::string& endpoint, long status_code, const std::string& body);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};

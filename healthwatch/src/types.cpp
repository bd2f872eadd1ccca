#include "types.hpp"
#include "util.hpp"
#include <fmt/format.h>

std::string to_string(ServiceKind kind) {
    switch (kind) {
        case ServiceKind::Loki: return "Loki";
        case ServiceKind::Grafana: return "Grafana";
    }
    return "Unknown";
}

std::string to_string(Health health) {
    return health == Health::Healthy ? "HEALTHY" : "UNHEALTHY";
}

std::string MonitoredInstance::make_label(ServiceKind kind, const std::string& address, size_t total) {
    if (total == 1) {
        return to_string(kind);
    }
    return fmt::format("{} ({})", to_string(kind), util::url_authority(address));
}

std::vector<MonitoredInstance> MonitoredInstance::from_urls(ServiceKind kind, const std::vector<std::string>& urls) {
    std::vector<MonitoredInstance> instances;
    instances.reserve(urls.size());
    for (const auto& url : urls) {
        instances.push_back({kind, url, make_label(kind, url, urls.size())});
    }
    return instances;
}

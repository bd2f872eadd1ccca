#pragma once
#include "scheduler.hpp"
#include <memory>
#include <string>
#include <nlohmann/json.hpp>

// Read-only HTTP view of the scheduler: /health and /ready
class StatusServer {
public:
    StatusServer(const std::string& host, int port, const Scheduler& scheduler);
    ~StatusServer();

    void start();
    void stop();
    bool is_running() const;

    static nlohmann::json render_status(SchedulerPhase phase, const std::vector<InstanceStatus>& instances);

    // Non-copyable
    StatusServer(const StatusServer&) = delete;
    StatusServer& operator=(const StatusServer&) = delete;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};

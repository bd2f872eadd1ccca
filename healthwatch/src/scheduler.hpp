#pragma once

#include "config.hpp"
#include "notification_dispatcher.hpp"
#include "prober.hpp"
#include "shutdown_token.hpp"
#include "types.hpp"

#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

enum class SchedulerPhase {
    Starting,
    Running,
    ShuttingDown,
    Stopped
};

std::string to_string(SchedulerPhase phase);

struct InstanceStatus {
    MonitoredInstance instance;
    InstanceState state;
    bool checked = false;
    std::chrono::system_clock::time_point last_checked;
};

class Scheduler {
public:
    using ProberMap = std::map<ServiceKind, std::shared_ptr<Prober>>;

    Scheduler(const Config& config,
              std::vector<MonitoredInstance> instances,
              ProberMap probers,
              NotificationDispatcher& dispatcher,
              ShutdownToken& shutdown,
              std::chrono::milliseconds sleep_slice = std::chrono::seconds(1));

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    // Starting -> Running: fresh state per instance, best-effort startup notification
    void start();

    // Runs cycles until shutdown is requested; returns once Stopped
    void run();

    // One pass over every instance in configuration order
    void run_cycle();

    SchedulerPhase phase() const { return phase_.load(); }

    // Thread-safe copy of every instance's state
    std::vector<InstanceStatus> snapshot() const;

private:
    void process_instance(InstanceStatus& entry);
    bool sleep_until_next_cycle();

    const Config& config_;
    std::vector<MonitoredInstance> instances_;
    ProberMap probers_;
    NotificationDispatcher& dispatcher_;
    ShutdownToken& shutdown_;
    std::chrono::milliseconds sleep_slice_;

    std::atomic<SchedulerPhase> phase_{SchedulerPhase::Starting};

    // Mutated only by the cycle thread; the mutex guards readers of snapshot()
    std::vector<InstanceStatus> entries_;
    mutable std::mutex entries_mutex_;
};

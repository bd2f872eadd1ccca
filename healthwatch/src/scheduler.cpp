#include "scheduler.hpp"
#include "formatter.hpp"
#include "transition_evaluator.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <stdexcept>
#include <algorithm>

namespace {

std::string join_addresses(const std::vector<MonitoredInstance>& instances, ServiceKind kind) {
    std::string out;
    for (const auto& instance : instances) {
        if (instance.kind != kind) continue;
        if (!out.empty()) out += ", ";
        out += instance.address;
    }
    return out;
}

} // namespace

std::string to_string(SchedulerPhase phase) {
    switch (phase) {
        case SchedulerPhase::Starting: return "starting";
        case SchedulerPhase::Running: return "running";
        case SchedulerPhase::ShuttingDown: return "shutting_down";
        case SchedulerPhase::Stopped: return "stopped";
    }
    return "unknown";
}

Scheduler::Scheduler(const Config& config,
                     std::vector<MonitoredInstance> instances,
                     ProberMap probers,
                     NotificationDispatcher& dispatcher,
                     ShutdownToken& shutdown,
                     std::chrono::milliseconds sleep_slice)
    : config_(config),
      instances_(std::move(instances)),
      probers_(std::move(probers)),
      dispatcher_(dispatcher),
      shutdown_(shutdown),
      sleep_slice_(sleep_slice) {
}

void Scheduler::start() {
    if (phase_ != SchedulerPhase::Starting) return;

    {
        std::lock_guard<std::mutex> lock(entries_mutex_);
        entries_.clear();
        entries_.reserve(instances_.size());
        for (const auto& instance : instances_) {
            entries_.push_back({instance, InstanceState{}, false, {}});
        }
    }

    auto payload = Formatter::format_startup(config_, dispatcher_.host(), std::chrono::system_clock::now());
    auto result = dispatcher_.deliver(payload, "startup notification");
    if (result.delivered()) {
        spdlog::info("Startup notification sent.");
    } else {
        spdlog::error("Failed to send startup notification: {}", result.reason);
    }

    spdlog::info("Monitoring started - Loki: [{}] | Grafana: [{}] | Interval: {}s | Threshold: {}",
                 join_addresses(instances_, ServiceKind::Loki),
                 join_addresses(instances_, ServiceKind::Grafana),
                 config_.check_interval_seconds, config_.failure_threshold);

    phase_ = SchedulerPhase::Running;
}

void Scheduler::run() {
    start();

    while (!shutdown_.requested()) {
        run_cycle();
        if (!sleep_until_next_cycle()) {
            break;
        }
    }

    phase_ = SchedulerPhase::ShuttingDown;
    spdlog::info("Shutdown requested, leaving the polling loop.");
    phase_ = SchedulerPhase::Stopped;
}

void Scheduler::run_cycle() {
    auto start_time = std::chrono::steady_clock::now();

    for (auto& entry : entries_) {
        process_instance(entry);
        if (shutdown_.requested()) {
            spdlog::info("Shutdown requested mid-cycle, skipping remaining instances.");
            return;
        }
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time).count();
    spdlog::debug("Health-check cycle over {} instances completed in {} ms", entries_.size(), elapsed);
}

void Scheduler::process_instance(InstanceStatus& entry) {
    const auto& instance = entry.instance;
    try {
        auto it = probers_.find(instance.kind);
        if (it == probers_.end() || !it->second) {
            throw std::runtime_error(fmt::format("no prober registered for {}", to_string(instance.kind)));
        }

        ProbeOutcome outcome = it->second->probe(instance.address);
        spdlog::debug("{} check: healthy={} reason={}", instance.label, outcome.success, outcome.reason);

        auto evaluation = TransitionEvaluator::evaluate(instance, entry.state, outcome, config_.failure_threshold);

        // Commit before dispatching: a lost notification never rolls the state back
        {
            std::lock_guard<std::mutex> lock(entries_mutex_);
            entry.state = evaluation.state;
            entry.checked = true;
            entry.last_checked = std::chrono::system_clock::now();
        }

        if (evaluation.event) {
            if (evaluation.event->is_alert()) {
                spdlog::warn("{} is UNHEALTHY: {}", instance.label, evaluation.event->reason);
            } else {
                spdlog::info("{} recovered.", instance.label);
            }
            dispatcher_.dispatch(*evaluation.event);
        } else if (!outcome.success) {
            spdlog::debug("{} failure {}/{}: {}", instance.label, entry.state.consecutive_failures,
                          config_.failure_threshold, outcome.reason);
        }
    } catch (const std::exception& e) {
        spdlog::error("Unexpected error checking {} ({}), skipping this cycle: {}",
                      instance.label, instance.address, e.what());
    }
}

bool Scheduler::sleep_until_next_cycle() {
    // Short slices keep SIGTERM latency bounded by the slice, not the interval
    auto remaining = std::chrono::milliseconds(std::chrono::seconds(config_.check_interval_seconds));
    while (remaining.count() > 0) {
        auto slice = std::min(sleep_slice_, remaining);
        if (!shutdown_.wait_for(slice)) {
            return false;
        }
        remaining -= slice;
    }
    return !shutdown_.requested();
}

std::vector<InstanceStatus> Scheduler::snapshot() const {
    std::lock_guard<std::mutex> lock(entries_mutex_);
    return entries_;
}

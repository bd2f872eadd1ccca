#include "config.hpp"
#include "notification_dispatcher.hpp"
#include "notifier.hpp"
#include "prober.hpp"
#include "scheduler.hpp"
#include "shutdown_token.hpp"
#include "status_server.hpp"
#include "util.hpp"
#include "version.hpp"
#include <spdlog/spdlog.h>
#include <csignal>
#include <iostream>
#include <memory>

// Signal handlers may only touch lock-free state
ShutdownToken shutdown_token;
volatile std::sig_atomic_t last_signal = 0;

void signal_handler(int signum) {
    last_signal = signum;
    shutdown_token.request();
}

int main() {
    // 1. Load configuration; any problem here is fatal before monitoring starts
    util::load_dotenv();

    Config config;
    try {
        config = Config::from_env();
        config.validate();
    } catch (const ConfigError& e) {
        std::cerr << "FATAL: " << e.what() << std::endl;
        return 1;
    }

    // 2. Setup logging
    util::setup_logging(config.log_level, config.log_file);
    spdlog::info(HEALTHWATCH_BANNER);

    // 3. Register signal handlers for graceful shutdown
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    try {
        // 4. Wire the components
        DiscordNotifier notifier(config);

        DispatchPolicy policy;
        policy.max_attempts = config.notify_max_attempts;
        policy.backoff = BackoffPolicy(config.notify_base_backoff_seconds, config.notify_max_backoff_seconds);
        policy.max_rate_limit_wait = std::chrono::milliseconds(
            static_cast<long long>(config.notify_max_rate_limit_wait_seconds * 1000));

        NotificationDispatcher dispatcher(
            notifier, policy,
            [](std::chrono::milliseconds delay) { return shutdown_token.wait_for(delay); },
            util::hostname());

        Scheduler::ProberMap probers;
        probers[ServiceKind::Loki] = std::make_shared<HttpProber>(ServiceKind::Loki, config.request_timeout_seconds);
        probers[ServiceKind::Grafana] = std::make_shared<HttpProber>(ServiceKind::Grafana, config.request_timeout_seconds);

        auto instances = MonitoredInstance::from_urls(ServiceKind::Loki, config.loki_urls);
        auto grafana = MonitoredInstance::from_urls(ServiceKind::Grafana, config.grafana_urls);
        instances.insert(instances.end(), grafana.begin(), grafana.end());

        Scheduler scheduler(config, std::move(instances), std::move(probers), dispatcher, shutdown_token);

        std::unique_ptr<StatusServer> status_server;
        if (config.status_port > 0) {
            status_server = std::make_unique<StatusServer>(config.status_host, config.status_port, scheduler);
            status_server->start();
        }

        // 5. Run until SIGTERM/SIGINT
        scheduler.run();

        if (last_signal != 0) {
            spdlog::info("Received signal {}, shut down gracefully.", static_cast<int>(last_signal));
        }
        if (status_server) {
            status_server->stop();
        }

    } catch (const std::exception& e) {
        spdlog::critical("A critical error occurred: {}", e.what());
        return 1;
    }

    spdlog::info("healthwatch shutting down. Goodbye.");
    return 0;
}

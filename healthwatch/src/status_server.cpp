#include "status_server.hpp"
#include "util.hpp"
#include "version.hpp"
#include <spdlog/spdlog.h>
#include <httplib.h>
#include <thread>
#include <atomic>
#include <chrono>

class StatusServer::Impl {
public:
    Impl(const std::string& host, int port, const Scheduler& scheduler)
        : host_(host), port_(port), scheduler_(scheduler), running_(false) {}

    ~Impl() {
        stop();
    }

    void start() {
        if (running_) {
            spdlog::warn("Status server already running");
            return;
        }

        setup_routes();
        running_ = true;
        server_thread_ = std::thread([this]() {
            spdlog::info("Status server listening on {}:{}", host_, port_);
            if (!server_.listen(host_.c_str(), port_)) {
                spdlog::error("Failed to start status server on {}:{}", host_, port_);
            }
            running_ = false;
        });
    }

    void stop() {
        if (server_thread_.joinable()) {
            // stop() is a no-op until listen() has bound the socket
            while (running_ && !server_.is_running()) {
                std::this_thread::sleep_for(std::chrono::milliseconds(10));
            }
            server_.stop();
            server_thread_.join();
            spdlog::info("Status server stopped");
        }
        running_ = false;
    }

    bool is_running() const {
        return running_;
    }

private:
    void setup_routes() {
        server_.Get("/health", [this](const httplib::Request&, httplib::Response& res) {
            auto body = StatusServer::render_status(scheduler_.phase(), scheduler_.snapshot());
            res.set_content(util::dump_json(body), "application/json");
        });

        server_.Get("/ready", [this](const httplib::Request&, httplib::Response& res) {
            bool ready = scheduler_.phase() == SchedulerPhase::Running;
            res.status = ready ? 200 : 503;
            nlohmann::json body = {{"status", ready ? "ready" : to_string(scheduler_.phase())}};
            res.set_content(util::dump_json(body), "application/json");
        });
    }

    std::string host_;
    int port_;
    const Scheduler& scheduler_;
    httplib::Server server_;
    std::atomic<bool> running_;
    std::thread server_thread_;
};

StatusServer::StatusServer(const std::string& host, int port, const Scheduler& scheduler)
    : pImpl_(std::make_unique<Impl>(host, port, scheduler)) {}

StatusServer::~StatusServer() = default;

void StatusServer::start() {
    pImpl_->start();
}

void StatusServer::stop() {
    pImpl_->stop();
}

bool StatusServer::is_running() const {
    return pImpl_->is_running();
}

nlohmann::json StatusServer::render_status(SchedulerPhase phase, const std::vector<InstanceStatus>& instances) {
    nlohmann::json list = nlohmann::json::array();
    int unhealthy = 0;

    for (const auto& status : instances) {
        if (status.state.health == Health::Unhealthy) unhealthy++;

        nlohmann::json item = {
            {"service", to_string(status.instance.kind)},
            {"label", status.instance.label},
            {"address", status.instance.address},
            {"health", to_string(status.state.health)},
            {"consecutive_failures", status.state.consecutive_failures},
            {"last_reason", status.state.last_reason},
            {"last_checked", status.checked ? nlohmann::json(util::format_iso8601(status.last_checked)) : nlohmann::json()}
        };
        list.push_back(std::move(item));
    }

    return {
        {"service", "healthwatch"},
        {"version", HEALTHWATCH_VERSION},
        {"phase", to_string(phase)},
        {"unhealthy", unhealthy},
        {"instances", std::move(list)}
    };
}

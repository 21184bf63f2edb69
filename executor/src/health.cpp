#include "health.hpp"
#include "util.hpp"
#include <httplib.h>
#include <spdlog/spdlog.h>
#include <atomic>
#include <thread>

class HealthServer::Impl {
public:
    Impl(const Config& config, Probe health_probe, Probe stats_probe)
        : config_(config),
          health_probe_(std::move(health_probe)),
          stats_probe_(std::move(stats_probe)),
          running_(false) {
        server_.Get("/health", [this](const httplib::Request&, httplib::Response& res) {
            nlohmann::json health_status;
            try {
                health_status = health_probe_();
            } catch (const std::exception& e) {
                health_status["status"] = "unhealthy";
                health_status["error"] = e.what();
            }
            health_status["service"] = config_.service_name;
            health_status["timestamp"] = util::current_iso8601();

            res.status = health_status.value("status", "") == "healthy" ? 200 : 503;
            res.set_content(health_status.dump(2), "application/json");
        });

        server_.Get("/stats", [this](const httplib::Request&, httplib::Response& res) {
            nlohmann::json stats = stats_probe_();
            stats["timestamp"] = util::current_iso8601();
            res.status = 200;
            res.set_content(stats.dump(2), "application/json");
        });
    }

    ~Impl() {
        stop();
    }

    void start() {
        if (running_.exchange(true)) {
            return;
        }
        server_thread_ = std::thread([this]() {
            spdlog::info("Health check server starting on {}:{}", config_.health_host, config_.health_port);
            if (!server_.listen(config_.health_host.c_str(), config_.health_port)) {
                spdlog::error("Health check server failed to listen on {}:{}",
                              config_.health_host, config_.health_port);
            }
        });
    }

    void stop() {
        if (running_.exchange(false)) {
            server_.stop();
            if (server_thread_.joinable()) {
                server_thread_.join();
            }
            spdlog::info("Health check server stopped");
        }
    }

private:
    Config config_;
    Probe health_probe_;
    Probe stats_probe_;
    httplib::Server server_;
    std::atomic<bool> running_;
    std::thread server_thread_;
};

HealthServer::HealthServer(const Config& config, Probe health_probe, Probe stats_probe)
    : pImpl_(std::make_unique<Impl>(config, std::move(health_probe), std::move(stats_probe))) {}

HealthServer::~HealthServer() = default;

void HealthServer::start() {
    pImpl_->start();
}

void HealthServer::stop() {
    pImpl_->stop();
}

#pragma once
#include "config.hpp"
#include <functional>
#include <memory>
#include <nlohmann/json.hpp>

// HTTP /health and /stats. The probes are called per request; /health
// answers 503 when the probe reports status != "healthy".
class HealthServer {
public:
    using Probe = std::function<nlohmann::json()>;

    HealthServer(const Config& config, Probe health_probe, Probe stats_probe);
    ~HealthServer();

    void start();
    void stop();

    // Non-copyable
    HealthServer(const HealthServer&) = delete;
    HealthServer& operator=(const HealthServer&) = delete;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};

#include "config.hpp"
#include "trade_service.hpp"
#include <spdlog/spdlog.h>
#include <signal.h>
#include <memory>

std::unique_ptr<TradeService> service;

void signal_handler(int signum) {
    spdlog::info("Signal {} received, draining in-flight trades...", signum);
    if (service) {
        service->stop();
    }
}

int main() {
    Config config;
    try {
        config = Config::from_env();
        config.validate();
    } catch (const std::exception& e) {
        spdlog::critical("Invalid configuration: {}", e.what());
        return 2;
    }

    spdlog::set_level(spdlog::level::from_str(config.log_level));
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [tid %t] %v");
    spdlog::info("Starting {} in {} mode (price age <= {} ms, quote validity {} ms, {} workers)",
                 config.service_name, config.trade_mode, config.validator.max_price_age_ms,
                 config.quote.quote_validity_ms, config.worker_threads);

    // A peer closing a TLS socket mid-write must not kill the process
    signal(SIGPIPE, SIG_IGN);
    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    try {
        service = std::make_unique<TradeService>(config);
        service->run();
        service.reset();
    } catch (const std::exception& e) {
        spdlog::critical("Executor stopped on error: {}", e.what());
        return 1;
    }

    spdlog::info("{} has shut down.", config.service_name);
    return 0;
}

#include "trade_service.hpp"
#include "audit_store.hpp"
#include "birdeye_stream_source.hpp"
#include "circuit_breaker.hpp"
#include "coingecko_price_source.hpp"
#include "errors.hpp"
#include "event_sink.hpp"
#include "health.hpp"
#include "jupiter_price_source.hpp"
#include "jupiter_router.hpp"
#include "keypair_wallet.hpp"
#include "price_validator.hpp"
#include "quote_builder.hpp"
#include "rate_limiter.hpp"
#include "redis_bus.hpp"
#include "retry_coordinator.hpp"
#include "safety_gate.hpp"
#include "solana_client.hpp"
#include "token_registry.hpp"
#include "trade_executor.hpp"
#include "wallet_lock.hpp"
#include <spdlog/spdlog.h>

TradeService::TradeService(const Config& config)
    : config_(config) {

    auto clock = SystemClock::instance();

    auto tokens = std::make_shared<TokenRegistry>();
    tokens->add_from_entries(config_.extra_tokens);

    bus_ = std::make_shared<RedisBus>(config_);

    auto events = std::make_shared<FanoutEventSink>();
    events->add(std::make_shared<LogEventSink>());
    events->add(std::make_shared<RedisEventSink>(bus_));

    // Price sources share one limiter, keyed per endpoint
    auto source_limiter = std::make_shared<RateLimiter>(config_.source_requests_per_second,
                                                        config_.source_burst_capacity);
    birdeye_ = std::make_shared<BirdeyeStreamSource>(config_.birdeye_ws_url, config_.birdeye_api_key, clock);

    std::vector<std::shared_ptr<PriceSource>> sources;
    sources.push_back(std::make_shared<JupiterPriceSource>(config_.jupiter_price_url, source_limiter, clock));
    sources.push_back(std::make_shared<CoinGeckoPriceSource>(config_.coingecko_api_url,
                                                             config_.coingecko_api_key,
                                                             source_limiter, clock));
    sources.push_back(birdeye_);
    auto validator = std::make_shared<MultiSourcePriceValidator>(std::move(sources), clock, events);

    // Routing providers, tried in order; the first also builds transactions
    auto route_limiter = std::make_shared<RateLimiter>(config_.source_requests_per_second,
                                                       config_.source_burst_capacity);
    std::vector<std::shared_ptr<RoutingProvider>> providers;
    std::shared_ptr<JupiterRouter> primary_router;
    for (const auto& url : config_.jupiter_swap_urls) {
        JupiterRouterOptions options;
        options.api_url = url;
        options.api_key = config_.jupiter_api_key;
        options.restrict_intermediate_tokens = config_.quote.restrict_intermediate_tokens;
        options.priority_fee_lamports = config_.execution.priority_fee_lamports;
        options.swap_timeout_ms = config_.quote.provider_timeout_ms;
        auto router = std::make_shared<JupiterRouter>(options, route_limiter);
        if (!primary_router) {
            primary_router = router;
        }
        providers.push_back(router);
    }
    if (!primary_router) {
        throw std::runtime_error("no routing provider configured");
    }

    uint64_t network_fee_lamports = config_.execution.base_fee_lamports +
                                    config_.execution.priority_fee_lamports;
    auto quote_builder = std::make_shared<QuoteBuilder>(providers, tokens, config_.quote,
                                                        network_fee_lamports, clock, events);

    SolanaClientOptions chain_options;
    chain_options.rpc_urls = config_.solana_rpc_urls;
    chain_options.commitment = config_.execution.commitment;
    chain_ = std::make_shared<SolanaClient>(chain_options);

    std::shared_ptr<Wallet> wallet = std::make_shared<KeypairWallet>(config_.keypair_path, chain_);
    spdlog::info("Trading wallet {}", wallet->public_key());

    auto executor = std::make_shared<TradeExecutor>(primary_router, chain_, config_.execution, clock, events);

    breaker_ = std::make_shared<CircuitBreaker>(config_.retry.consecutive_failure_threshold,
                                                config_.retry.circuit_cooldown_ms, clock);

    TradePipeline pipeline;
    pipeline.validator = validator;
    pipeline.quote_builder = quote_builder;
    pipeline.safety_gate = std::make_shared<SafetyGate>(config_.safety);
    pipeline.executor = executor;
    pipeline.wallet = wallet;
    pipeline.wallet_locks = std::make_shared<WalletLockRegistry>();
    pipeline.breaker = breaker_;
    pipeline.clock = clock;
    pipeline.events = events;
    coordinator_ = std::make_unique<RetryCoordinator>(std::move(pipeline), config_.validator, config_.retry);

    if (!config_.db_conn_string.empty()) {
        audit_ = std::make_unique<TradeAuditStore>(config_.db_conn_string);
        try {
            audit_->ensure_schema();
        } catch (const std::exception& e) {
            spdlog::warn("Audit schema not ensured yet: {}", e.what());
        }
    } else {
        spdlog::info("DATABASE_URL not set, trade audit disabled");
    }

    health_server_ = std::make_unique<HealthServer>(
        config_,
        [this]() { return health(); },
        [this]() { return stats(); });
}

TradeService::~TradeService() {
    stop();
}

void TradeService::run() {
    spdlog::info("Starting {} in {} mode with {} workers...",
                 config_.service_name, config_.trade_mode, config_.worker_threads);
    running_ = true;

    health_server_->start();
    birdeye_->start();

    for (int i = 0; i < config_.worker_threads; ++i) {
        workers_.emplace_back([this, i]() { worker_loop(i); });
    }

    bus_->start_consumer([this](const TradeRequest& request) { enqueue(request); });
    spdlog::info("{} started successfully.", config_.service_name);

    while (running_) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    spdlog::info("Shutting down {}...", config_.service_name);
    bus_->stop_consumer();

    {
        std::lock_guard<std::mutex> lock(inflight_mutex_);
        for (auto& entry : inflight_) {
            entry.second.cancel();
        }
    }
    queue_cv_.notify_all();
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();

    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (!queue_.empty()) {
            spdlog::warn("{} queued trade requests dropped at shutdown", queue_.size());
            for (const auto& request : queue_) {
                publish_error(request.request_id, "service shutting down");
            }
            queue_.clear();
        }
    }

    birdeye_->stop();
    health_server_->stop();
    spdlog::info("{} event loop finished.", config_.service_name);
}

void TradeService::stop() {
    running_ = false;
}

void TradeService::enqueue(const TradeRequest& request) {
    counters_.received++;
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        queue_.push_back(request);
    }
    queue_cv_.notify_one();
}

void TradeService::worker_loop(int worker_id) {
    spdlog::debug("Worker {} started", worker_id);
    while (true) {
        TradeRequest request;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait_for(lock, std::chrono::milliseconds(500),
                               [this]() { return !queue_.empty() || !running_; });
            if (!running_) {
                break;
            }
            if (queue_.empty()) {
                continue;
            }
            request = std::move(queue_.front());
            queue_.pop_front();
        }
        process(request);
    }
    spdlog::debug("Worker {} stopped", worker_id);
}

void TradeService::process(const TradeRequest& request) {
    CancellationToken cancel = request.timeout_ms > 0
        ? CancellationToken::with_timeout(std::chrono::milliseconds(request.timeout_ms))
        : CancellationToken();

    uint64_t inflight_id;
    {
        std::lock_guard<std::mutex> lock(inflight_mutex_);
        inflight_id = next_inflight_id_++;
        inflight_.emplace(inflight_id, cancel);
    }

    spdlog::info("Trade {}: {} {} -> {} (max slippage {}%)",
                 request.request_id, request.amount, request.input_token,
                 request.output_token, request.max_slippage_pct);

    try {
        TradeResult result = coordinator_->execute_trade(request, cancel);

        switch (result.status) {
            case TradeStatus::Executed: counters_.executed++; break;
            case TradeStatus::Rejected: counters_.rejected++; break;
            case TradeStatus::Failed: counters_.failed++; break;
        }

        if (!bus_->publish_result(result)) {
            counters_.unpublished++;
            spdlog::error("Trade {}: result not published", result.request_id);
        }
        if (audit_ && !audit_->record(request, result)) {
            counters_.unaudited++;
        }
    } catch (const ExecutionError& e) {
        if (e.kind() == ExecutionErrorKind::CircuitOpen) {
            counters_.circuit_open++;
        } else {
            counters_.errors++;
        }
        spdlog::warn("Trade {} not attempted: {}", request.request_id, e.what());
        publish_error(request.request_id, e.what());
    } catch (const std::exception& e) {
        counters_.errors++;
        spdlog::error("Trade {} aborted: {}", request.request_id, e.what());
        publish_error(request.request_id, e.what());
    }

    std::lock_guard<std::mutex> lock(inflight_mutex_);
    inflight_.erase(inflight_id);
}

void TradeService::publish_error(const std::string& request_id, const std::string& error) {
    if (!bus_->publish_error(request_id, error)) {
        counters_.unpublished++;
        spdlog::error("Trade {}: error result not published", request_id);
    }
}

nlohmann::json TradeService::health() const {
    bool redis_ok = bus_->is_connected();
    bool solana_ok = chain_->is_healthy();
    bool audit_ok = !audit_ || audit_->is_connected();
    CircuitState circuit = breaker_->state();

    nlohmann::json health_status;
    health_status["redis"] = redis_ok ? "connected" : "disconnected";
    health_status["solana_rpc"] = solana_ok ? "healthy" : "unhealthy";
    health_status["birdeye_stream"] = birdeye_->is_connected() ? "connected" : "disconnected";
    health_status["audit_db"] = audit_ ? (audit_ok ? "connected" : "disconnected") : "disabled";
    health_status["circuit"] = to_string(circuit);
    health_status["status"] = (redis_ok && solana_ok && audit_ok) ? "healthy" : "unhealthy";
    return health_status;
}

nlohmann::json TradeService::stats() const {
    nlohmann::json stats;
    stats["trade_mode"] = config_.trade_mode;
    stats["received"] = counters_.received.load();
    stats["executed"] = counters_.executed.load();
    stats["rejected"] = counters_.rejected.load();
    stats["failed"] = counters_.failed.load();
    stats["circuit_open"] = counters_.circuit_open.load();
    stats["errors"] = counters_.errors.load();
    stats["unpublished"] = counters_.unpublished.load();
    stats["unaudited"] = counters_.unaudited.load();
    stats["consecutive_failures"] = breaker_->consecutive_failures();
    stats["circuit_cooldown_ms"] = breaker_->remaining_cooldown_ms();
    return stats;
}

#include "config.hpp"
#include "util.hpp"
#include <stdexcept>
#include <spdlog/spdlog.h>

using util::get_env_var;
using util::get_env_int;
using util::get_env_double;

Config Config::from_env() {
    Config config;

    // Service
    config.service_name = get_env_var("SERVICE_NAME", "executor");
    config.log_level = get_env_var("LOG_LEVEL", "info");
    config.trade_mode = util::to_lower(get_env_var("TRADE_MODE", "hft"));
    config.worker_threads = get_env_int("WORKER_THREADS", 4);

    // Database
    config.db_conn_string = get_env_var("DATABASE_URL");

    // Redis
    config.redis_host = get_env_var("REDIS_HOST", "localhost");
    config.redis_port = get_env_int("REDIS_PORT", 6379);
    config.redis_password = get_env_var("REDIS_PASSWORD");
    config.stream_requests = get_env_var("STREAM_TRADE_REQUESTS", "trade.requests");
    config.stream_results = get_env_var("STREAM_TRADE_RESULTS", "trade.results");
    config.stream_events = get_env_var("STREAM_TRADE_EVENTS", "trade.events");
    config.consumer_group = get_env_var("REDIS_CONSUMER_GROUP", "executor_group");

    // Solana RPC URLs (comma-separated)
    config.solana_rpc_urls = util::split_string(
        get_env_var("SOLANA_RPC_URLS", "https://api.mainnet-beta.solana.com"), ',');
    config.keypair_path = util::get_required_env_var("WALLET_KEYPAIR_PATH");

    // Price sources
    config.jupiter_price_url = get_env_var("JUPITER_PRICE_URL", "https://lite-api.jup.ag/price/v2");
    config.coingecko_api_url = get_env_var("COINGECKO_API_URL", "https://api.coingecko.com/api/v3");
    config.coingecko_api_key = get_env_var("COINGECKO_API_KEY");
    config.birdeye_ws_url = get_env_var("BIRDEYE_WS_URL", "wss://public-api.birdeye.so/socket/solana");
    config.birdeye_api_key = get_env_var("BIRDEYE_API_KEY");
    config.source_requests_per_second = get_env_int("SOURCE_REQUESTS_PER_SECOND", 10);
    config.source_burst_capacity = get_env_int("SOURCE_BURST_CAPACITY", 20);

    // Routing
    config.jupiter_swap_urls = util::split_string(
        get_env_var("JUPITER_SWAP_URLS", "https://lite-api.jup.ag/swap/v1"), ',');
    config.jupiter_api_key = get_env_var("JUPITER_API_KEY");
    config.extra_tokens = util::split_string(get_env_var("EXTRA_TOKENS"), ',');

    // Price validation; TRADE_MODE picks the freshness window unless it is set explicitly
    int64_t default_age = config.trade_mode == "normal" ? 1000 : 50;
    config.validator.max_price_age_ms = get_env_int("MAX_PRICE_AGE_MS", static_cast<int>(default_age));
    config.validator.min_price_sources = get_env_int("MIN_PRICE_SOURCES", 2);
    config.validator.fresh_data_timeout_ms = get_env_int("FRESH_DATA_TIMEOUT_MS", 1000);
    config.validator.price_tolerance_percent = get_env_double("PRICE_TOLERANCE_PERCENT", 0.5);

    // Quotes
    config.quote.routing_divergence_pct = get_env_double("ROUTING_DIVERGENCE_PCT", 1.0);
    config.quote.quote_validity_ms = get_env_int("QUOTE_VALIDITY_MS", 500);
    config.quote.restrict_intermediate_tokens = util::get_env_bool("RESTRICT_INTERMEDIATE_TOKENS", true);
    config.quote.provider_timeout_ms = get_env_int("ROUTE_PROVIDER_TIMEOUT_MS", 1500);

    // Safety
    config.safety.max_slippage_pct_cap = get_env_double("MAX_SLIPPAGE_PCT_CAP", 3.0);
    config.safety.max_trade_amount = get_env_double("MAX_TRADE_AMOUNT", 0.0);
    config.safety.balance_margin_pct = get_env_double("BALANCE_MARGIN_PCT", 0.0);

    // Execution
    config.execution.max_execution_time_ms = get_env_int("MAX_EXECUTION_TIME_MS", 2500);
    config.execution.confirmation_poll_ms = get_env_int("CONFIRMATION_POLL_MS", 200);
    config.execution.priority_fee_lamports = static_cast<uint64_t>(get_env_int("PRIORITY_FEE_LAMPORTS", 5000));
    config.execution.commitment = get_env_var("COMMITMENT", "confirmed");

    // Retry and circuit breaker
    config.retry.max_attempts = get_env_int("MAX_ATTEMPTS", 3);
    config.retry.base_backoff_ms = get_env_int("BASE_BACKOFF_MS", 200);
    config.retry.backoff_factor = get_env_double("BACKOFF_FACTOR", 2.0);
    config.retry.max_backoff_ms = get_env_int("MAX_BACKOFF_MS", 2000);
    config.retry.backoff_jitter = get_env_double("BACKOFF_JITTER", 0.1);
    config.retry.consecutive_failure_threshold = get_env_int("CONSECUTIVE_FAILURE_THRESHOLD", 3);
    config.retry.circuit_cooldown_ms = get_env_int("CIRCUIT_COOLDOWN_MS", 30000);

    // Health
    config.health_host = get_env_var("HEALTH_HOST", "0.0.0.0");
    config.health_port = get_env_int("HEALTH_PORT", 8085);

    return config;
}

void Config::validate() const {
    if (trade_mode != "hft" && trade_mode != "normal") {
        throw std::runtime_error("TRADE_MODE must be 'hft' or 'normal'");
    }

    if (solana_rpc_urls.empty()) {
        throw std::runtime_error("At least one Solana RPC URL is required");
    }

    if (jupiter_swap_urls.empty()) {
        throw std::runtime_error("At least one Jupiter swap URL is required");
    }

    if (worker_threads < 1 || worker_threads > 64) {
        throw std::runtime_error("WORKER_THREADS must be between 1 and 64");
    }

    if (validator.max_price_age_ms <= 0 || validator.max_price_age_ms > 1000) {
        throw std::runtime_error("MAX_PRICE_AGE_MS must be between 1 and 1000");
    }

    if (validator.min_price_sources < 1) {
        throw std::runtime_error("MIN_PRICE_SOURCES must be at least 1");
    }

    if (validator.fresh_data_timeout_ms <= 0) {
        throw std::runtime_error("FRESH_DATA_TIMEOUT_MS must be positive");
    }

    if (validator.price_tolerance_percent <= 0.0) {
        throw std::runtime_error("PRICE_TOLERANCE_PERCENT must be positive");
    }

    if (source_requests_per_second <= 0 || source_burst_capacity <= 0) {
        throw std::runtime_error("SOURCE_REQUESTS_PER_SECOND and SOURCE_BURST_CAPACITY must be positive");
    }

    if (quote.quote_validity_ms < 400 || quote.quote_validity_ms > 800) {
        throw std::runtime_error("QUOTE_VALIDITY_MS must be between 400 and 800");
    }

    if (execution.max_execution_time_ms <= 0 || execution.confirmation_poll_ms <= 0) {
        throw std::runtime_error("Execution timeouts must be positive");
    }

    if (retry.max_attempts < 1 || retry.max_attempts > 10) {
        throw std::runtime_error("MAX_ATTEMPTS must be between 1 and 10");
    }

    if (retry.consecutive_failure_threshold < 1) {
        throw std::runtime_error("CONSECUTIVE_FAILURE_THRESHOLD must be at least 1");
    }

    if (redis_port <= 0 || redis_port > 65535) {
        throw std::runtime_error("REDIS_PORT must be between 1 and 65535");
    }

    if (health_port <= 0 || health_port > 65535) {
        throw std::runtime_error("HEALTH_PORT must be between 1 and 65535");
    }

    spdlog::info("Configuration validated successfully");
}

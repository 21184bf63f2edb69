#pragma once
#include <string>
#include <vector>
#include <cstdint>

struct ValidatorConfig {
    int64_t max_price_age_ms = 50;       // high-frequency default; normal mode uses 1000
    int min_price_sources = 2;
    int64_t fresh_data_timeout_ms = 1000;
    double price_tolerance_percent = 0.5;
};

struct QuoteConfig {
    double routing_divergence_pct = 1.0;
    int64_t quote_validity_ms = 500;
    bool restrict_intermediate_tokens = true;
    int64_t provider_timeout_ms = 1500;
};

struct SafetyConfig {
    double max_slippage_pct_cap = 3.0;   // upper bound on any request's own limit
    double max_trade_amount = 0.0;       // 0 = unlimited
    double balance_margin_pct = 0.0;
};

struct ExecutionConfig {
    int64_t max_execution_time_ms = 2500;
    int64_t confirmation_poll_ms = 200;
    uint64_t base_fee_lamports = 5000;
    uint64_t priority_fee_lamports = 5000;
    std::string commitment = "confirmed";
};

struct RetryConfig {
    int max_attempts = 3;
    int64_t base_backoff_ms = 200;
    double backoff_factor = 2.0;
    int64_t max_backoff_ms = 2000;
    double backoff_jitter = 0.1;
    int consecutive_failure_threshold = 3;
    int64_t circuit_cooldown_ms = 30000;
};

class Config {
public:
    // Service info
    std::string service_name = "executor";
    std::string log_level = "info";
    std::string trade_mode = "hft";      // "hft" or "normal"
    int worker_threads = 4;

    // Database (trade audit); empty disables the audit store
    std::string db_conn_string;

    // Redis
    std::string redis_host = "localhost";
    int redis_port = 6379;
    std::string redis_password;
    std::string stream_requests = "trade.requests";
    std::string stream_results = "trade.results";
    std::string stream_events = "trade.events";
    std::string consumer_group = "executor_group";

    // Solana RPC endpoints (rotation on failure)
    std::vector<std::string> solana_rpc_urls = {
        "https://api.mainnet-beta.solana.com"
    };
    std::string keypair_path;

    // Price sources
    std::string jupiter_price_url = "https://lite-api.jup.ag/price/v2";
    std::string coingecko_api_url = "https://api.coingecko.com/api/v3";
    std::string coingecko_api_key;
    std::string birdeye_ws_url = "wss://public-api.birdeye.so/socket/solana";
    std::string birdeye_api_key;
    int source_requests_per_second = 10;
    int source_burst_capacity = 20;

    // Routing providers, tried in order
    std::vector<std::string> jupiter_swap_urls = {
        "https://lite-api.jup.ag/swap/v1"
    };
    std::string jupiter_api_key;

    // Extra token decimals, "mint:decimals" pairs
    std::vector<std::string> extra_tokens;

    // Pipeline
    ValidatorConfig validator;
    QuoteConfig quote;
    SafetyConfig safety;
    ExecutionConfig execution;
    RetryConfig retry;

    // Health check
    std::string health_host = "0.0.0.0";
    int health_port = 8085;

    static Config from_env();
    void validate() const;
};

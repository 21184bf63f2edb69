#pragma once
#include "clock.hpp"
#include <string>
#include <vector>
#include <set>
#include <optional>
#include <nlohmann/json.hpp>

struct TokenPair {
    std::string base_mint;
    std::string quote_mint;

    TokenPair inverted() const { return {quote_mint, base_mint}; }
    std::string to_string() const { return base_mint + "/" + quote_mint; }

    bool operator==(const TokenPair& other) const {
        return base_mint == other.base_mint && quote_mint == other.quote_mint;
    }
    bool operator!=(const TokenPair& other) const { return !(*this == other); }
};

// Quote units per one base unit, as reported by a single source
struct PriceQuote {
    TokenPair token_pair;
    double price = 0.0;
    std::string source_id;
    TimePoint observed_at;
    int64_t latency_ms = 0;
};

enum class PriceConfidence { High, Medium, Low };

struct ConsensusPrice {
    TokenPair token_pair;
    double price = 0.0;
    std::set<std::string> contributing_sources;
    double max_deviation_pct = 0.0;
    TimePoint computed_at;
    PriceConfidence confidence = PriceConfidence::Low;
    std::vector<PriceQuote> quotes;

    // Price of one unit of input_mint in output_mint, inverting if needed
    double price_for(const std::string& input_mint, const std::string& output_mint) const;
};

struct SwapQuote {
    std::string request_id;
    std::string input_token;
    std::string output_token;
    double input_amount = 0.0;
    double expected_output_amount = 0.0;
    double estimated_fee = 0.0;          // input-token units
    double estimated_slippage_pct = 0.0;
    int route_hops = 0;
    TimePoint built_at;
    TimePoint expires_at;

    double anchor_price = 0.0;           // consensus output per input
    double slippage_tolerance_pct = 0.0;
    std::string provider;
    nlohmann::json route_payload;
};

struct TradeRequest {
    std::string request_id;
    std::string requester_wallet;
    std::string input_token;
    std::string output_token;
    double amount = 0.0;
    double max_slippage_pct = 1.0;
    double min_profit_threshold = 0.0;   // output-token units, may be negative
    int64_t timeout_ms = 0;

    static std::optional<TradeRequest> from_json(const nlohmann::json& j);
    nlohmann::json to_json() const;
};

enum class TradeStatus { Executed, Rejected, Failed };

struct TradeResult {
    std::string request_id;
    TradeStatus status = TradeStatus::Failed;
    std::optional<std::string> tx_signature;
    std::optional<double> actual_output_amount;
    std::optional<double> fee_paid;
    std::optional<std::string> rejection_reason;
    int attempts = 0;
    TimePoint completed_at;

    nlohmann::json to_json() const;
};

const char* to_string(PriceConfidence confidence);
const char* to_string(TradeStatus status);

nlohmann::json to_json(const ConsensusPrice& price);
nlohmann::json to_json(const SwapQuote& quote);

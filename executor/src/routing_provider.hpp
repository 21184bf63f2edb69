#pragma once
#include "price_source.hpp"
#include "types.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

struct RouteRequest {
    std::string request_id;
    std::string input_mint;
    std::string output_mint;
    uint64_t amount_raw = 0;
    int slippage_bps = 50;
};

struct RouteFee {
    std::string mint;
    uint64_t amount_raw = 0;
};

// A concrete swap route in raw token units
struct Route {
    std::string provider;
    uint64_t in_amount_raw = 0;
    uint64_t out_amount_raw = 0;
    double price_impact_pct = 0.0;
    int hops = 0;
    std::vector<RouteFee> fees;
    nlohmann::json payload;
};

class RoutingProvider {
public:
    virtual ~RoutingProvider() = default;

    virtual std::string name() const = 0;

    // std::nullopt when the provider has no route for the pair.
    // Throws QuoteError(ProviderError) on transport or provider failure.
    virtual std::optional<Route> find_route(const RouteRequest& request, Deadline deadline) = 0;
};

// Unsigned, serialized transaction. Its blockhash stops being accepted once
// the chain passes last_valid_block_height (0 when the builder did not say).
struct SwapTransaction {
    std::vector<uint8_t> bytes;
    uint64_t last_valid_block_height = 0;
};

// Turns an accepted quote into an unsigned, serialized transaction.
class SwapTransactionBuilder {
public:
    virtual ~SwapTransactionBuilder() = default;

    // Throws ExecutionError(SubmissionFailed) when the provider cannot build it
    virtual SwapTransaction build_swap_transaction(const SwapQuote& quote,
                                                   const std::string& user_public_key) = 0;
};

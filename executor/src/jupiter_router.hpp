#pragma once
#include "routing_provider.hpp"
#include "rate_limiter.hpp"
#include <memory>
#include <string>

struct JupiterRouterOptions {
    std::string api_url = "https://lite-api.jup.ag/swap/v1";
    std::string api_key;
    bool restrict_intermediate_tokens = true;
    uint64_t priority_fee_lamports = 5000;
    int64_t swap_timeout_ms = 1500;
};

// Jupiter Swap API v1: /quote for routes, /swap for the unsigned transaction
class JupiterRouter : public RoutingProvider, public SwapTransactionBuilder {
public:
    JupiterRouter(JupiterRouterOptions options, std::shared_ptr<RateLimiter> rate_limiter);
    ~JupiterRouter() override;

    std::string name() const override;
    std::optional<Route> find_route(const RouteRequest& request, Deadline deadline) override;
    SwapTransaction build_swap_transaction(const SwapQuote& quote,
                                           const std::string& user_public_key) override;

    // Parses a /quote response body; exposed for tests
    static Route parse_route(const nlohmann::json& body, const std::string& provider);

    // Parses a /swap response body. Throws ExecutionError(SubmissionFailed).
    static SwapTransaction parse_swap_response(const nlohmann::json& body, const std::string& provider);

    // Non-copyable
    JupiterRouter(const JupiterRouter&) = delete;
    JupiterRouter& operator=(const JupiterRouter&) = delete;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};

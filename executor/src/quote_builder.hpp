#pragma once
#include "cancellation.hpp"
#include "clock.hpp"
#include "config.hpp"
#include "event_sink.hpp"
#include "routing_provider.hpp"
#include "token_registry.hpp"
#include "types.hpp"
#include <memory>
#include <vector>

// Requests a concrete route for a trade and anchors it to the consensus
// price. Providers are tried in order until one returns a usable route.
class QuoteBuilder {
public:
    QuoteBuilder(std::vector<std::shared_ptr<RoutingProvider>> providers,
                 std::shared_ptr<TokenRegistry> tokens,
                 QuoteConfig config,
                 uint64_t network_fee_lamports,
                 std::shared_ptr<Clock> clock,
                 std::shared_ptr<EventSink> events = nullptr);

    // Throws QuoteError, or OperationCancelled before a provider call
    SwapQuote build_quote(const TradeRequest& request,
                          const ConsensusPrice& price,
                          const CancellationToken& cancel = CancellationToken());

    // |route - anchor| / anchor, in percent
    static double divergence_pct(double route_price, double anchor_price);

private:
    SwapQuote make_quote(const TradeRequest& request, const Route& route, double anchor_price,
                         int input_decimals, int output_decimals) const;

    std::vector<std::shared_ptr<RoutingProvider>> providers_;
    std::shared_ptr<TokenRegistry> tokens_;
    QuoteConfig config_;
    uint64_t network_fee_lamports_;
    std::shared_ptr<Clock> clock_;
    std::shared_ptr<EventSink> events_;
};

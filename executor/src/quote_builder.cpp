#include "quote_builder.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <cmath>

QuoteBuilder::QuoteBuilder(std::vector<std::shared_ptr<RoutingProvider>> providers,
                           std::shared_ptr<TokenRegistry> tokens,
                           QuoteConfig config,
                           uint64_t network_fee_lamports,
                           std::shared_ptr<Clock> clock,
                           std::shared_ptr<EventSink> events)
    : providers_(std::move(providers)),
      tokens_(std::move(tokens)),
      config_(config),
      network_fee_lamports_(network_fee_lamports),
      clock_(std::move(clock)),
      events_(events ? std::move(events) : std::make_shared<NullEventSink>()) {
    if (providers_.empty()) {
        throw std::invalid_argument("QuoteBuilder requires at least one routing provider");
    }
}

SwapQuote QuoteBuilder::build_quote(const TradeRequest& request,
                                    const ConsensusPrice& price,
                                    const CancellationToken& cancel) {
    double anchor = price.price_for(request.input_token, request.output_token);

    auto input_info = tokens_->find(request.input_token);
    auto output_info = tokens_->find(request.output_token);
    if (!input_info || !output_info) {
        throw QuoteError(QuoteErrorKind::NoRoute,
                         "no decimals known for " + (input_info ? request.output_token : request.input_token));
    }

    RouteRequest route_request;
    route_request.request_id = request.request_id;
    route_request.input_mint = request.input_token;
    route_request.output_mint = request.output_token;
    route_request.amount_raw = util::to_raw_amount(request.amount, input_info->decimals);
    route_request.slippage_bps = static_cast<int>(std::llround(request.max_slippage_pct * 100.0));

    if (route_request.amount_raw == 0) {
        throw QuoteError(QuoteErrorKind::NoRoute, "amount is below the input token precision");
    }

    std::string divergence_error;
    std::string provider_error;

    for (const auto& provider : providers_) {
        if (cancel.is_cancelled()) {
            throw OperationCancelled("quote building");
        }

        Deadline deadline = std::chrono::steady_clock::now() +
                            std::chrono::milliseconds(config_.provider_timeout_ms);

        std::optional<Route> route;
        try {
            route = provider->find_route(route_request, deadline);
        } catch (const QuoteError& e) {
            spdlog::warn("Routing provider {} failed: {}", provider->name(), e.what());
            provider_error = e.what();
            continue;
        }

        if (!route || route->in_amount_raw == 0 || route->out_amount_raw == 0) {
            spdlog::debug("Routing provider {} has no route for {} -> {}", provider->name(),
                          request.input_token, request.output_token);
            continue;
        }

        SwapQuote quote = make_quote(request, *route, anchor, input_info->decimals, output_info->decimals);
        double route_price = quote.expected_output_amount / quote.input_amount;
        double divergence = divergence_pct(route_price, anchor);

        if (divergence > config_.routing_divergence_pct) {
            divergence_error = fmt::format("{} route price {} diverges {:.3f}% from consensus {} (limit {}%)",
                                           provider->name(), route_price, divergence, anchor,
                                           config_.routing_divergence_pct);
            spdlog::warn("{}", divergence_error);
            continue;
        }

        TradeEvent event{TradeEventType::QuoteBuilt, request.request_id,
                         fmt::format("{} quote: {} -> {} via {}", quote.provider, quote.input_amount,
                                     quote.expected_output_amount, quote.route_hops)};
        event.data = to_json(quote);
        events_->emit(event);

        spdlog::info("Quote for {}: {} {} -> {} {} ({} hops, impact {:.3f}%, divergence {:.3f}%)",
                     request.request_id, quote.input_amount, tokens_->symbol(quote.input_token),
                     quote.expected_output_amount, tokens_->symbol(quote.output_token),
                     quote.route_hops, quote.estimated_slippage_pct, divergence);
        return quote;
    }

    if (!divergence_error.empty()) {
        throw QuoteError(QuoteErrorKind::RouteDivergence, divergence_error);
    }
    if (!provider_error.empty()) {
        throw QuoteError(QuoteErrorKind::ProviderError, provider_error);
    }
    throw QuoteError(QuoteErrorKind::NoRoute,
                     "no route for " + request.input_token + " -> " + request.output_token);
}

SwapQuote QuoteBuilder::make_quote(const TradeRequest& request, const Route& route, double anchor_price,
                                   int input_decimals, int output_decimals) const {
    SwapQuote quote;
    quote.request_id = request.request_id;
    quote.input_token = request.input_token;
    quote.output_token = request.output_token;
    quote.input_amount = util::from_raw_amount(route.in_amount_raw, input_decimals);
    quote.expected_output_amount = util::from_raw_amount(route.out_amount_raw, output_decimals);
    quote.estimated_slippage_pct = route.price_impact_pct;
    quote.route_hops = route.hops;
    quote.anchor_price = anchor_price;
    quote.slippage_tolerance_pct = request.max_slippage_pct;
    quote.provider = route.provider;
    quote.route_payload = route.payload;

    // Fees are expressed in input-token units
    uint64_t input_fee_raw = 0;
    for (const auto& fee : route.fees) {
        if (fee.mint == request.input_token) {
            input_fee_raw += fee.amount_raw;
        }
    }
    if (TokenRegistry::is_native_sol(request.input_token)) {
        input_fee_raw += network_fee_lamports_;
    }
    quote.estimated_fee = util::from_raw_amount(input_fee_raw, input_decimals);

    quote.built_at = clock_->now();
    quote.expires_at = quote.built_at + std::chrono::milliseconds(config_.quote_validity_ms);
    return quote;
}

double QuoteBuilder::divergence_pct(double route_price, double anchor_price) {
    return std::fabs(route_price - anchor_price) / anchor_price * 100.0;
}

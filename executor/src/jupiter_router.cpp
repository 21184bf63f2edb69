#include "jupiter_router.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <cpr/cpr.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>

namespace {

uint64_t parse_raw_amount(const nlohmann::json& field) {
    if (field.is_string()) {
        return std::stoull(field.get<std::string>());
    }
    return field.get<uint64_t>();
}

bool is_no_route_error(const nlohmann::json& body) {
    std::string code = body.value("errorCode", "");
    return code == "COULD_NOT_FIND_ANY_ROUTE" || code == "TOKEN_NOT_TRADABLE" ||
           code == "NO_ROUTES_FOUND";
}

} // namespace

class JupiterRouter::Impl {
public:
    Impl(JupiterRouterOptions options, std::shared_ptr<RateLimiter> rate_limiter)
        : options_(std::move(options)),
          rate_limiter_(std::move(rate_limiter)),
          name_("jupiter@" + util::parse_url(options_.api_url).host) {
        spdlog::info("Jupiter router configured: {}", options_.api_url);
    }

    const std::string& name() const { return name_; }

    std::optional<Route> find_route(const RouteRequest& request, Deadline deadline) {
        if (rate_limiter_ && !rate_limiter_->acquire_before(name_, deadline)) {
            throw QuoteError(QuoteErrorKind::ProviderError, name_ + ": rate limited past the deadline");
        }

        int64_t budget_ms = millis_until(deadline);
        if (budget_ms <= 0) {
            throw QuoteError(QuoteErrorKind::ProviderError, name_ + ": no time budget left");
        }

        spdlog::debug("Jupiter quote {} -> {}, raw amount {}", request.input_mint,
                      request.output_mint, request.amount_raw);

        auto response = cpr::Get(
            cpr::Url{options_.api_url + "/quote"},
            cpr::Parameters{
                {"inputMint", request.input_mint},
                {"outputMint", request.output_mint},
                {"amount", std::to_string(request.amount_raw)},
                {"slippageBps", std::to_string(request.slippage_bps)},
                {"restrictIntermediateTokens", options_.restrict_intermediate_tokens ? "true" : "false"}
            },
            headers(),
            cpr::Timeout{static_cast<int32_t>(budget_ms)}
        );

        if (response.error) {
            throw QuoteError(QuoteErrorKind::ProviderError, name_ + ": " + response.error.message);
        }

        nlohmann::json body = nlohmann::json::parse(response.text, nullptr, false);

        if (response.status_code != 200) {
            if (!body.is_discarded() && is_no_route_error(body)) {
                spdlog::info("{} has no route for {} -> {}", name_, request.input_mint, request.output_mint);
                return std::nullopt;
            }
            throw QuoteError(QuoteErrorKind::ProviderError,
                             name_ + ": HTTP status " + std::to_string(response.status_code));
        }

        if (body.is_discarded()) {
            throw QuoteError(QuoteErrorKind::ProviderError, name_ + ": unparseable quote response");
        }

        Route route = parse_route(body, name_);
        if (route.out_amount_raw == 0 || route.hops == 0) {
            return std::nullopt;
        }
        return route;
    }

    SwapTransaction build_swap_transaction(const SwapQuote& quote, const std::string& user_public_key) {
        nlohmann::json request_data = {
            {"quoteResponse", quote.route_payload},
            {"userPublicKey", user_public_key},
            {"dynamicComputeUnitLimit", true},
            {"prioritizationFeeLamports", options_.priority_fee_lamports}
        };

        auto header = headers();
        header["Content-Type"] = "application/json";

        auto response = cpr::Post(
            cpr::Url{options_.api_url + "/swap"},
            header,
            cpr::Body{request_data.dump()},
            cpr::Timeout{static_cast<int32_t>(options_.swap_timeout_ms)}
        );

        if (response.error) {
            throw ExecutionError(ExecutionErrorKind::SubmissionFailed,
                                 name_ + " swap build failed: " + response.error.message);
        }
        if (response.status_code != 200) {
            throw ExecutionError(ExecutionErrorKind::SubmissionFailed,
                                 name_ + " swap build failed, status: " + std::to_string(response.status_code));
        }

        auto json_res = nlohmann::json::parse(response.text, nullptr, false);
        if (json_res.is_discarded()) {
            throw ExecutionError(ExecutionErrorKind::SubmissionFailed, name_ + " swap response is not JSON");
        }
        return JupiterRouter::parse_swap_response(json_res, name_);
    }

private:
    cpr::Header headers() const {
        cpr::Header header{{"User-Agent", "solforge-executor/1.0"}};
        if (!options_.api_key.empty()) {
            header["x-api-key"] = options_.api_key;
        }
        return header;
    }

    JupiterRouterOptions options_;
    std::shared_ptr<RateLimiter> rate_limiter_;
    std::string name_;
};

JupiterRouter::JupiterRouter(JupiterRouterOptions options, std::shared_ptr<RateLimiter> rate_limiter)
    : pImpl_(std::make_unique<Impl>(std::move(options), std::move(rate_limiter))) {}

JupiterRouter::~JupiterRouter() = default;

std::string JupiterRouter::name() const {
    return pImpl_->name();
}

std::optional<Route> JupiterRouter::find_route(const RouteRequest& request, Deadline deadline) {
    return pImpl_->find_route(request, deadline);
}

SwapTransaction JupiterRouter::build_swap_transaction(const SwapQuote& quote,
                                                      const std::string& user_public_key) {
    return pImpl_->build_swap_transaction(quote, user_public_key);
}

SwapTransaction JupiterRouter::parse_swap_response(const nlohmann::json& body, const std::string& provider) {
    if (!body.contains("swapTransaction") || !body["swapTransaction"].is_string()) {
        throw ExecutionError(ExecutionErrorKind::SubmissionFailed, provider + " swap response has no transaction");
    }

    SwapTransaction transaction;
    transaction.bytes = util::base64_decode(body["swapTransaction"].get<std::string>());
    if (transaction.bytes.empty()) {
        throw ExecutionError(ExecutionErrorKind::SubmissionFailed, provider + " returned an empty transaction");
    }

    if (body.contains("lastValidBlockHeight")) {
        try {
            transaction.last_valid_block_height = parse_raw_amount(body["lastValidBlockHeight"]);
        } catch (const std::exception& e) {
            throw ExecutionError(ExecutionErrorKind::SubmissionFailed,
                                 provider + " swap response has a bad lastValidBlockHeight: " + e.what());
        }
    }
    return transaction;
}

Route JupiterRouter::parse_route(const nlohmann::json& body, const std::string& provider) {
    Route route;
    route.provider = provider;

    try {
        route.in_amount_raw = parse_raw_amount(body.at("inAmount"));
        route.out_amount_raw = parse_raw_amount(body.at("outAmount"));

        // priceImpactPct is a fraction, e.g. "0.0012" for 0.12%
        if (body.contains("priceImpactPct")) {
            const auto& impact = body["priceImpactPct"];
            double fraction = impact.is_string()
                ? util::safe_parse_double(impact.get<std::string>(), 0.0)
                : impact.get<double>();
            route.price_impact_pct = std::fabs(fraction) * 100.0;
        }

        if (body.contains("routePlan") && body["routePlan"].is_array()) {
            route.hops = static_cast<int>(body["routePlan"].size());
            for (const auto& step : body["routePlan"]) {
                if (!step.contains("swapInfo")) {
                    continue;
                }
                const auto& info = step["swapInfo"];
                if (info.contains("feeAmount") && info.contains("feeMint")) {
                    RouteFee fee;
                    fee.mint = info["feeMint"].get<std::string>();
                    fee.amount_raw = parse_raw_amount(info["feeAmount"]);
                    route.fees.push_back(fee);
                }
            }
        }
    } catch (const std::exception& e) {
        throw QuoteError(QuoteErrorKind::ProviderError, provider + ": malformed quote: " + e.what());
    }

    route.payload = body;
    return route;
}

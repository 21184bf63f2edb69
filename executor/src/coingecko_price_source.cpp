#include "coingecko_price_source.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <cpr/cpr.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <cmath>

namespace {

// CoinGecko may echo contract addresses lower-cased
const nlohmann::json* find_entry(const nlohmann::json& body, const std::string& mint) {
    if (body.contains(mint)) {
        return &body[mint];
    }
    auto lowered = util::to_lower(mint);
    for (auto it = body.begin(); it != body.end(); ++it) {
        if (util::to_lower(it.key()) == lowered) {
            return &it.value();
        }
    }
    return nullptr;
}

double usd_price(const nlohmann::json& body, const std::string& mint) {
    const auto* entry = find_entry(body, mint);
    if (!entry) {
        throw SourceError(SourceErrorKind::Unavailable, "coingecko: no price for " + mint);
    }
    if (!entry->contains("usd") || !(*entry)["usd"].is_number()) {
        throw SourceError(SourceErrorKind::Malformed, "coingecko: entry for " + mint + " has no usd price");
    }
    double price = (*entry)["usd"].get<double>();
    if (!std::isfinite(price) || price <= 0.0) {
        throw SourceError(SourceErrorKind::Malformed, "coingecko: invalid usd price for " + mint);
    }
    return price;
}

} // namespace

CoinGeckoPriceSource::CoinGeckoPriceSource(std::string api_url, std::string api_key,
                                           std::shared_ptr<RateLimiter> rate_limiter,
                                           std::shared_ptr<Clock> clock)
    : api_url_(std::move(api_url)),
      api_key_(std::move(api_key)),
      rate_limiter_(std::move(rate_limiter)),
      clock_(std::move(clock)) {
}

PriceQuote CoinGeckoPriceSource::fetch_price(const TokenPair& pair, Deadline deadline) {
    if (rate_limiter_ && !rate_limiter_->try_acquire("coingecko")) {
        throw SourceError(SourceErrorKind::Unavailable, "coingecko: rate limit reached");
    }

    int64_t budget_ms = millis_until(deadline);
    if (budget_ms <= 0) {
        throw SourceError(SourceErrorKind::Timeout, "coingecko: no time budget left");
    }

    auto started = std::chrono::steady_clock::now();

    cpr::Header headers{{"User-Agent", "solforge-executor/1.0"}};
    if (!api_key_.empty()) {
        headers["x-cg-pro-api-key"] = api_key_;
    }

    auto response = cpr::Get(
        cpr::Url{api_url_ + "/simple/token_price/solana"},
        cpr::Parameters{
            {"contract_addresses", pair.base_mint + "," + pair.quote_mint},
            {"vs_currencies", "usd"}
        },
        headers,
        cpr::Timeout{static_cast<int32_t>(budget_ms)}
    );

    if (response.error) {
        if (response.error.code == cpr::ErrorCode::OPERATION_TIMEDOUT) {
            throw SourceError(SourceErrorKind::Timeout, "coingecko: request timed out");
        }
        throw SourceError(SourceErrorKind::Unavailable, "coingecko: " + response.error.message);
    }

    if (response.status_code != 200) {
        throw SourceError(SourceErrorKind::Unavailable,
                          "coingecko: HTTP status " + std::to_string(response.status_code));
    }

    nlohmann::json body;
    try {
        body = nlohmann::json::parse(response.text);
    } catch (const nlohmann::json::exception& e) {
        throw SourceError(SourceErrorKind::Malformed, std::string("coingecko: ") + e.what());
    }

    double base_usd = usd_price(body, pair.base_mint);
    double quote_usd = usd_price(body, pair.quote_mint);

    PriceQuote quote;
    quote.token_pair = pair;
    quote.price = base_usd / quote_usd;
    quote.source_id = "coingecko";
    quote.observed_at = clock_->now();
    quote.latency_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started).count();

    spdlog::debug("CoinGecko price for {}: {} ({} ms)", pair.to_string(), quote.price, quote.latency_ms);
    return quote;
}

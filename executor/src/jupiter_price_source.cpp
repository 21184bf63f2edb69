#include "jupiter_price_source.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <cmath>

class JupiterPriceSource::Impl {
public:
    Impl(const std::string& price_api_url,
         std::shared_ptr<RateLimiter> rate_limiter,
         std::shared_ptr<Clock> clock)
        : endpoint_(util::parse_url(price_api_url)),
          rate_limiter_(std::move(rate_limiter)),
          clock_(std::move(clock)) {
        spdlog::info("Jupiter price source configured for host: {}, path: {}",
                     endpoint_.host, endpoint_.path);
    }

    PriceQuote fetch_price(const TokenPair& pair, Deadline deadline) {
        if (rate_limiter_ && !rate_limiter_->try_acquire("jupiter")) {
            throw SourceError(SourceErrorKind::Unavailable, "jupiter: rate limit reached");
        }

        int64_t budget_ms = millis_until(deadline);
        if (budget_ms <= 0) {
            throw SourceError(SourceErrorKind::Timeout, "jupiter: no time budget left");
        }

        auto started = std::chrono::steady_clock::now();

        httplib::SSLClient client(endpoint_.host, endpoint_.port);
        client.set_connection_timeout(budget_ms / 1000, (budget_ms % 1000) * 1000);
        client.set_read_timeout(budget_ms / 1000, (budget_ms % 1000) * 1000);

        std::string path = endpoint_.path + "?ids=" + pair.base_mint + "&vsToken=" + pair.quote_mint;
        auto response = client.Get(path.c_str());

        if (!response) {
            if (std::chrono::steady_clock::now() >= deadline) {
                throw SourceError(SourceErrorKind::Timeout, "jupiter: request timed out");
            }
            throw SourceError(SourceErrorKind::Unavailable,
                              "jupiter: " + httplib::to_string(response.error()));
        }

        if (response->status != 200) {
            throw SourceError(SourceErrorKind::Unavailable,
                              "jupiter: HTTP status " + std::to_string(response->status));
        }

        double price = parse_price(response->body, pair.base_mint);

        PriceQuote quote;
        quote.token_pair = pair;
        quote.price = price;
        quote.source_id = "jupiter";
        quote.observed_at = clock_->now();
        quote.latency_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started).count();

        spdlog::debug("Jupiter price for {}: {} ({} ms)", pair.to_string(), price, quote.latency_ms);
        return quote;
    }

private:
    static double parse_price(const std::string& body, const std::string& base_mint) {
        nlohmann::json json_response;
        try {
            json_response = nlohmann::json::parse(body);
        } catch (const nlohmann::json::exception& e) {
            throw SourceError(SourceErrorKind::Malformed, std::string("jupiter: ") + e.what());
        }

        if (!json_response.contains("data") || !json_response["data"].contains(base_mint)) {
            throw SourceError(SourceErrorKind::Malformed, "jupiter: response has no entry for " + base_mint);
        }

        const auto& entry = json_response["data"][base_mint];
        if (entry.is_null()) {
            throw SourceError(SourceErrorKind::Unavailable, "jupiter: no price for " + base_mint);
        }
        if (!entry.contains("price")) {
            throw SourceError(SourceErrorKind::Malformed, "jupiter: entry has no price");
        }

        // Price is returned as a decimal string
        const auto& price_field = entry["price"];
        double price = price_field.is_string()
            ? util::safe_parse_double(price_field.get<std::string>(), -1.0)
            : price_field.get<double>();

        if (!std::isfinite(price) || price <= 0.0) {
            throw SourceError(SourceErrorKind::Malformed, "jupiter: invalid price value");
        }
        return price;
    }

    util::UrlParts endpoint_;
    std::shared_ptr<RateLimiter> rate_limiter_;
    std::shared_ptr<Clock> clock_;
};

JupiterPriceSource::JupiterPriceSource(const std::string& price_api_url,
                                       std::shared_ptr<RateLimiter> rate_limiter,
                                       std::shared_ptr<Clock> clock)
    : pImpl_(std::make_unique<Impl>(price_api_url, std::move(rate_limiter), std::move(clock))) {}

JupiterPriceSource::~JupiterPriceSource() = default;

PriceQuote JupiterPriceSource::fetch_price(const TokenPair& pair, Deadline deadline) {
    return pImpl_->fetch_price(pair, deadline);
}

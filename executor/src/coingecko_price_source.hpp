#pragma once
#include "price_source.hpp"
#include "clock.hpp"
#include "rate_limiter.hpp"
#include <memory>
#include <string>

// CoinGecko token_price endpoint. The pair price is derived from the USD
// prices of both mints returned by the same response.
class CoinGeckoPriceSource : public PriceSource {
public:
    CoinGeckoPriceSource(std::string api_url, std::string api_key,
                         std::shared_ptr<RateLimiter> rate_limiter,
                         std::shared_ptr<Clock> clock);

    std::string id() const override { return "coingecko"; }
    PriceQuote fetch_price(const TokenPair& pair, Deadline deadline) override;

private:
    std::string api_url_;
    std::string api_key_;
    std::shared_ptr<RateLimiter> rate_limiter_;
    std::shared_ptr<Clock> clock_;
};

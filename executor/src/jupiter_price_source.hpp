#pragma once
#include "price_source.hpp"
#include "clock.hpp"
#include "rate_limiter.hpp"
#include <memory>
#include <string>

// Jupiter Price API v2 over HTTPS
class JupiterPriceSource : public PriceSource {
public:
    JupiterPriceSource(const std::string& price_api_url,
                       std::shared_ptr<RateLimiter> rate_limiter,
                       std::shared_ptr<Clock> clock);
    ~JupiterPriceSource() override;

    std::string id() const override { return "jupiter"; }
    PriceQuote fetch_price(const TokenPair& pair, Deadline deadline) override;

    // Non-copyable
    JupiterPriceSource(const JupiterPriceSource&) = delete;
    JupiterPriceSource& operator=(const JupiterPriceSource&) = delete;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};

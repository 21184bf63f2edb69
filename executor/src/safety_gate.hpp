#pragma once
#include "clock.hpp"
#include "config.hpp"
#include "types.hpp"
#include <string>
#include <utility>

enum class GateReason {
    None,
    QuoteExpired,
    SlippageTooHigh,
    TradeTooLarge,
    ProfitBelowThreshold,
    InsufficientBalance
};

const char* to_string(GateReason reason);

struct GateDecision {
    bool approved = false;
    GateReason reason = GateReason::None;
    std::string message;

    static GateDecision approve() { return {true, GateReason::None, ""}; }
    static GateDecision reject(GateReason reason, std::string message) {
        return {false, reason, std::move(message)};
    }

    bool operator==(const GateDecision& other) const {
        return approved == other.approved && reason == other.reason && message == other.message;
    }
};

// Last check before a quote reaches the chain. evaluate() depends only on its
// arguments and the config, so identical inputs give identical decisions.
class SafetyGate {
public:
    explicit SafetyGate(SafetyConfig config);

    // wallet_balance is in input-token units
    GateDecision evaluate(const SwapQuote& quote,
                          const TradeRequest& request,
                          double wallet_balance,
                          TimePoint now) const;

    // Output-token value left after paying input and fees at the anchor price
    static double expected_profit(const SwapQuote& quote);

    // Input-token amount the wallet must hold, margin included
    double required_balance(const SwapQuote& quote, const TradeRequest& request) const;

    const SafetyConfig& config() const { return config_; }

private:
    SafetyConfig config_;
};

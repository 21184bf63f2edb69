#include "safety_gate.hpp"
#include <fmt/format.h>
#include <algorithm>

const char* to_string(GateReason reason) {
    switch (reason) {
        case GateReason::None: return "none";
        case GateReason::QuoteExpired: return "quote_expired";
        case GateReason::SlippageTooHigh: return "slippage_too_high";
        case GateReason::TradeTooLarge: return "trade_too_large";
        case GateReason::ProfitBelowThreshold: return "profit_below_threshold";
        case GateReason::InsufficientBalance: return "insufficient_balance";
    }
    return "unknown";
}

SafetyGate::SafetyGate(SafetyConfig config) : config_(config) {}

GateDecision SafetyGate::evaluate(const SwapQuote& quote,
                                  const TradeRequest& request,
                                  double wallet_balance,
                                  TimePoint now) const {
    if (now > quote.expires_at) {
        return GateDecision::reject(GateReason::QuoteExpired, "quote expired");
    }

    double slippage_limit = request.max_slippage_pct;
    if (config_.max_slippage_pct_cap > 0.0) {
        slippage_limit = std::min(slippage_limit, config_.max_slippage_pct_cap);
    }
    if (quote.estimated_slippage_pct > slippage_limit) {
        return GateDecision::reject(GateReason::SlippageTooHigh,
            fmt::format("estimated slippage {:.3f}% exceeds limit {:.3f}%",
                        quote.estimated_slippage_pct, slippage_limit));
    }

    if (config_.max_trade_amount > 0.0 && request.amount > config_.max_trade_amount) {
        return GateDecision::reject(GateReason::TradeTooLarge,
            fmt::format("trade amount {} exceeds maximum {}", request.amount, config_.max_trade_amount));
    }

    double profit = expected_profit(quote);
    if (profit < request.min_profit_threshold) {
        return GateDecision::reject(GateReason::ProfitBelowThreshold,
            fmt::format("expected profit {:.6f} below threshold {:.6f}", profit, request.min_profit_threshold));
    }

    double required = required_balance(quote, request);
    if (wallet_balance < required) {
        return GateDecision::reject(GateReason::InsufficientBalance,
            fmt::format("insufficient balance: have {}, need {}", wallet_balance, required));
    }

    return GateDecision::approve();
}

double SafetyGate::expected_profit(const SwapQuote& quote) {
    double input_value = (quote.input_amount + quote.estimated_fee) * quote.anchor_price;
    return quote.expected_output_amount - input_value;
}

double SafetyGate::required_balance(const SwapQuote& quote, const TradeRequest& request) const {
    return (request.amount + quote.estimated_fee) * (1.0 + config_.balance_margin_pct / 100.0);
}

#pragma once
#include "cancellation.hpp"
#include "circuit_breaker.hpp"
#include "clock.hpp"
#include "config.hpp"
#include "event_sink.hpp"
#include "price_validator.hpp"
#include "quote_builder.hpp"
#include "safety_gate.hpp"
#include "trade_executor.hpp"
#include "types.hpp"
#include "wallet.hpp"
#include "wallet_lock.hpp"
#include <chrono>
#include <memory>
#include <optional>
#include <string>

enum class RetryState { Idle, Attempting, Retrying, Success, Exhausted };

enum class RetryEvent {
    Start,             // begin the next attempt
    Succeeded,
    TransientFailure,
    PermanentFailure
};

const char* to_string(RetryState state);
const char* to_string(RetryEvent event);

// Pure transition function. attempts_made counts attempts already started.
// Throws std::logic_error for events that make no sense in `current`.
RetryState next_retry_state(RetryState current, RetryEvent event, int attempts_made, int max_attempts);

// Everything one trade needs, shared across workers
struct TradePipeline {
    std::shared_ptr<MultiSourcePriceValidator> validator;
    std::shared_ptr<QuoteBuilder> quote_builder;
    std::shared_ptr<SafetyGate> safety_gate;
    std::shared_ptr<TradeExecutor> executor;
    std::shared_ptr<Wallet> wallet;
    std::shared_ptr<WalletLockRegistry> wallet_locks;
    std::shared_ptr<CircuitBreaker> breaker;
    std::shared_ptr<Clock> clock;
    std::shared_ptr<EventSink> events;
};

// Drives one trade request through validate -> quote -> gate -> execute,
// retrying transient failures with exponential backoff. Each attempt starts
// from a fresh consensus price and a fresh quote.
class RetryCoordinator {
public:
    RetryCoordinator(TradePipeline pipeline, ValidatorConfig validator_config, RetryConfig retry_config);

    // Always returns a terminal result, except when the circuit is open:
    // then throws ExecutionError(CircuitOpen) without touching the pipeline.
    TradeResult execute_trade(const TradeRequest& request,
                              const CancellationToken& cancel = CancellationToken());

    // Backoff before the retry that follows `failed_attempts` failures
    std::chrono::milliseconds backoff_delay(int failed_attempts) const;

    const CircuitBreaker& breaker() const { return *pipeline_.breaker; }

private:
    struct AttemptReport {
        RetryEvent event = RetryEvent::PermanentFailure;
        TradeStatus status = TradeStatus::Failed;
        std::optional<TradeResult> result;
        std::string reason;
        std::string signature;            // broadcast but unresolved
        std::optional<SwapQuote> quote;   // quote behind `signature`
        uint64_t last_valid_block_height = 0;
    };

    AttemptReport run_attempt(const TradeRequest& request, const CancellationToken& cancel);
    void resolve_previous_broadcast(AttemptReport& report);
    TradeResult finish(const TradeRequest& request, RetryState state, AttemptReport report, int attempts);

    TradePipeline pipeline_;
    ValidatorConfig validator_config_;
    RetryConfig retry_config_;
};

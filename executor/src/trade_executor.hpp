#pragma once
#include "cancellation.hpp"
#include "chain_client.hpp"
#include "clock.hpp"
#include "config.hpp"
#include "event_sink.hpp"
#include "routing_provider.hpp"
#include "types.hpp"
#include "wallet.hpp"
#include <memory>
#include <optional>
#include <string>

enum class ReconcileState {
    Landed,     // confirmed; result holds the settled outcome
    Failed,     // landed with an error; nothing moved, safe to retry
    NotFound,   // unseen and its blockhash has expired; can no longer land
    InFlight    // pending, or unseen with a blockhash that may still be valid
};

const char* to_string(ReconcileState state);

struct ReconcileOutcome {
    ReconcileState state = ReconcileState::NotFound;
    std::optional<TradeResult> result;
};

// Builds, signs and broadcasts one transaction per call, then waits for
// confirmation and settles it against the quote.
class TradeExecutor {
public:
    TradeExecutor(std::shared_ptr<SwapTransactionBuilder> builder,
                  std::shared_ptr<ChainClient> chain,
                  ExecutionConfig config,
                  std::shared_ptr<Clock> clock,
                  std::shared_ptr<EventSink> events = nullptr);

    // Throws ExecutionError. OperationCancelled if cancelled before broadcast;
    // cancellation after broadcast ends the wait with Unconfirmed.
    TradeResult execute(const SwapQuote& quote, Wallet& wallet,
                        const CancellationToken& cancel = CancellationToken());

    // Resolves an earlier broadcast without sending anything. An unseen
    // signature counts as dropped only once the finalized block height has
    // passed last_valid_block_height; with no known height it stays InFlight.
    ReconcileOutcome reconcile(const std::string& signature, uint64_t last_valid_block_height,
                               const SwapQuote& quote, Wallet& wallet);

    // |actual - expected| / expected, in percent
    static double settlement_slippage_pct(double expected_output, double actual_output);

private:
    void ensure_not_expired(const SwapQuote& quote, const char* stage);
    Settlement await_settlement(const std::string& signature, uint64_t last_valid_block_height,
                                const SwapQuote& quote, const std::string& owner,
                                const CancellationToken& cancel);
    bool blockhash_expired(uint64_t last_valid_block_height);
    TradeResult settle(const std::string& signature, const SwapQuote& quote, const Settlement& settlement);

    std::shared_ptr<SwapTransactionBuilder> builder_;
    std::shared_ptr<ChainClient> chain_;
    ExecutionConfig config_;
    std::shared_ptr<Clock> clock_;
    std::shared_ptr<EventSink> events_;
};

#include "trade_executor.hpp"
#include "errors.hpp"
#include "solana_tx.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <cmath>

const char* to_string(ReconcileState state) {
    switch (state) {
        case ReconcileState::Landed: return "landed";
        case ReconcileState::Failed: return "failed";
        case ReconcileState::NotFound: return "not_found";
        case ReconcileState::InFlight: return "in_flight";
    }
    return "unknown";
}

TradeExecutor::TradeExecutor(std::shared_ptr<SwapTransactionBuilder> builder,
                             std::shared_ptr<ChainClient> chain,
                             ExecutionConfig config,
                             std::shared_ptr<Clock> clock,
                             std::shared_ptr<EventSink> events)
    : builder_(std::move(builder)),
      chain_(std::move(chain)),
      config_(std::move(config)),
      clock_(std::move(clock)),
      events_(events ? std::move(events) : std::make_shared<NullEventSink>()) {
}

TradeResult TradeExecutor::execute(const SwapQuote& quote, Wallet& wallet, const CancellationToken& cancel) {
    ensure_not_expired(quote, "before build");

    SwapTransaction transaction = builder_->build_swap_transaction(quote, wallet.public_key());
    auto signed_transaction = wallet.sign(transaction.bytes);
    std::string local_signature = solana_tx::first_signature(signed_transaction);

    if (cancel.is_cancelled()) {
        throw OperationCancelled("execution");
    }
    // Signing and the swap build take real time; the quote may have lapsed meanwhile
    ensure_not_expired(quote, "before broadcast");

    std::string signature;
    try {
        signature = chain_->send_transaction(signed_transaction);
    } catch (const ExecutionError& e) {
        if (e.kind() == ExecutionErrorKind::SubmissionFailed) {
            // The node may have accepted it before the transport failed
            throw ExecutionError(e.kind(), e.what(), local_signature, transaction.last_valid_block_height);
        }
        throw;
    }

    spdlog::info("Transaction submitted for {}: {}", quote.request_id, signature);
    TradeEvent submitted{TradeEventType::TransactionSubmitted, quote.request_id, signature};
    submitted.data = {{"signature", signature}, {"provider", quote.provider}};
    events_->emit(submitted);

    Settlement settlement = await_settlement(signature, transaction.last_valid_block_height, quote,
                                             wallet.public_key(), cancel);
    return settle(signature, quote, settlement);
}

ReconcileOutcome TradeExecutor::reconcile(const std::string& signature, uint64_t last_valid_block_height,
                                          const SwapQuote& quote, Wallet& wallet) {
    ReconcileOutcome outcome;
    SignatureStatus status = chain_->get_signature_status(signature);

    switch (status.state) {
        case SignatureState::NotFound:
            outcome.state = blockhash_expired(last_valid_block_height) ? ReconcileState::NotFound
                                                                       : ReconcileState::InFlight;
            break;
        case SignatureState::Pending:
            outcome.state = ReconcileState::InFlight;
            break;
        case SignatureState::Failed:
            outcome.state = ReconcileState::Failed;
            break;
        case SignatureState::Confirmed: {
            auto settlement = chain_->get_settlement(signature, wallet.public_key(), quote.output_token);
            if (!settlement) {
                outcome.state = ReconcileState::InFlight;
            } else if (settlement->failed) {
                outcome.state = ReconcileState::Failed;
            } else {
                outcome.state = ReconcileState::Landed;
                outcome.result = settle(signature, quote, *settlement);
            }
            break;
        }
    }

    spdlog::info("Reconciled {} for {}: {}", signature, quote.request_id, to_string(outcome.state));
    return outcome;
}

bool TradeExecutor::blockhash_expired(uint64_t last_valid_block_height) {
    if (last_valid_block_height == 0) {
        return false;
    }
    uint64_t height = chain_->get_block_height();
    spdlog::debug("Finalized block height {}, transaction valid through {}", height, last_valid_block_height);
    return height > last_valid_block_height;
}

double TradeExecutor::settlement_slippage_pct(double expected_output, double actual_output) {
    if (expected_output <= 0.0) {
        return actual_output > 0.0 ? 0.0 : 100.0;
    }
    return std::fabs(actual_output - expected_output) / expected_output * 100.0;
}

void TradeExecutor::ensure_not_expired(const SwapQuote& quote, const char* stage) {
    TimePoint now = clock_->now();
    if (now > quote.expires_at) {
        auto late_ms = millis_between(quote.expires_at, now);
        std::string message = fmt::format("quote expired {} ms ago ({})", late_ms, stage);

        TradeEvent event{TradeEventType::QuoteExpired, quote.request_id, message};
        event.data = {{"late_ms", late_ms}, {"stage", stage}};
        events_->emit(event);

        throw ExecutionError(ExecutionErrorKind::QuoteExpired, message);
    }
}

Settlement TradeExecutor::await_settlement(const std::string& signature, uint64_t last_valid_block_height,
                                           const SwapQuote& quote, const std::string& owner,
                                           const CancellationToken& cancel) {
    const TimePoint started = clock_->now();
    const auto poll_interval = std::chrono::milliseconds(config_.confirmation_poll_ms);

    while (true) {
        try {
            SignatureStatus status = chain_->get_signature_status(signature);

            if (status.state == SignatureState::Failed) {
                throw ExecutionError(ExecutionErrorKind::OnChainFailure,
                                     "transaction failed on chain: " + status.error, signature);
            }

            if (status.state == SignatureState::Confirmed) {
                auto settlement = chain_->get_settlement(signature, owner, quote.output_token);
                if (settlement) {
                    if (settlement->failed) {
                        throw ExecutionError(ExecutionErrorKind::OnChainFailure,
                                             "transaction failed on chain: " + settlement->error, signature);
                    }
                    return *settlement;
                }
            }
        } catch (const ExecutionError&) {
            throw;
        } catch (const std::exception& e) {
            // A failed status poll is not a verdict on the transaction
            spdlog::warn("Confirmation poll for {} failed: {}", signature, e.what());
        }

        if (cancel.is_cancelled()) {
            throw ExecutionError(ExecutionErrorKind::Unconfirmed,
                                 "confirmation wait abandoned by caller; transaction may still land",
                                 signature, last_valid_block_height);
        }

        if (millis_between(started, clock_->now()) >= config_.max_execution_time_ms) {
            throw ExecutionError(ExecutionErrorKind::Unconfirmed,
                                 fmt::format("not confirmed within {} ms; transaction may still land",
                                             config_.max_execution_time_ms),
                                 signature, last_valid_block_height);
        }

        clock_->sleep_for(poll_interval);
    }
}

TradeResult TradeExecutor::settle(const std::string& signature, const SwapQuote& quote,
                                  const Settlement& settlement) {
    TradeResult result;
    result.request_id = quote.request_id;
    result.tx_signature = signature;
    result.actual_output_amount = settlement.output_amount;
    result.fee_paid = settlement.fee_paid;
    result.attempts = 1;
    result.completed_at = clock_->now();

    double slippage = settlement_slippage_pct(quote.expected_output_amount, settlement.output_amount);

    if (slippage > quote.slippage_tolerance_pct) {
        result.status = TradeStatus::Failed;
        result.rejection_reason = "slippage exceeded at settlement";

        spdlog::warn("Settlement slippage for {}: expected {}, got {} ({:.3f}% > {:.3f}%)",
                     quote.request_id, quote.expected_output_amount, settlement.output_amount,
                     slippage, quote.slippage_tolerance_pct);

        TradeEvent event{TradeEventType::TradeFailed, quote.request_id, "slippage exceeded at settlement"};
        event.data = {{"signature", signature}, {"slippage_pct", slippage},
                      {"expected_output", quote.expected_output_amount},
                      {"actual_output", settlement.output_amount}};
        events_->emit(event);
        return result;
    }

    result.status = TradeStatus::Executed;
    spdlog::info("Trade {} executed: {} -> {} (slippage {:.3f}%, fee {} SOL)",
                 quote.request_id, quote.input_amount, settlement.output_amount, slippage, settlement.fee_paid);

    TradeEvent event{TradeEventType::TradeExecuted, quote.request_id, signature};
    event.data = {{"signature", signature}, {"slippage_pct", slippage},
                  {"actual_output", settlement.output_amount}, {"fee_paid", settlement.fee_paid}};
    events_->emit(event);
    return result;
}

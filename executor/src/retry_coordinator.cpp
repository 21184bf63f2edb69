#include "retry_coordinator.hpp"
#include "backoff_manager.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <stdexcept>

const char* to_string(RetryState state) {
    switch (state) {
        case RetryState::Idle: return "idle";
        case RetryState::Attempting: return "attempting";
        case RetryState::Retrying: return "retrying";
        case RetryState::Success: return "success";
        case RetryState::Exhausted: return "exhausted";
    }
    return "unknown";
}

const char* to_string(RetryEvent event) {
    switch (event) {
        case RetryEvent::Start: return "start";
        case RetryEvent::Succeeded: return "succeeded";
        case RetryEvent::TransientFailure: return "transient_failure";
        case RetryEvent::PermanentFailure: return "permanent_failure";
    }
    return "unknown";
}

RetryState next_retry_state(RetryState current, RetryEvent event, int attempts_made, int max_attempts) {
    switch (current) {
        case RetryState::Idle:
            if (event == RetryEvent::Start) {
                return RetryState::Attempting;
            }
            break;

        case RetryState::Attempting:
            switch (event) {
                case RetryEvent::Succeeded:
                    return RetryState::Success;
                case RetryEvent::PermanentFailure:
                    return RetryState::Exhausted;
                case RetryEvent::TransientFailure:
                    return attempts_made < max_attempts ? RetryState::Retrying : RetryState::Exhausted;
                case RetryEvent::Start:
                    break;
            }
            break;

        case RetryState::Retrying:
            switch (event) {
                case RetryEvent::Start:
                    return RetryState::Attempting;
                // An earlier broadcast resolved while waiting
                case RetryEvent::Succeeded:
                    return RetryState::Success;
                case RetryEvent::PermanentFailure:
                    return RetryState::Exhausted;
                case RetryEvent::TransientFailure:
                    break;
            }
            break;

        case RetryState::Success:
        case RetryState::Exhausted:
            break;
    }

    throw std::logic_error(fmt::format("invalid retry transition: {} on {}", to_string(event), to_string(current)));
}

RetryCoordinator::RetryCoordinator(TradePipeline pipeline, ValidatorConfig validator_config, RetryConfig retry_config)
    : pipeline_(std::move(pipeline)),
      validator_config_(validator_config),
      retry_config_(retry_config) {
    if (!pipeline_.events) {
        pipeline_.events = std::make_shared<NullEventSink>();
    }
    if (!pipeline_.validator || !pipeline_.quote_builder || !pipeline_.safety_gate || !pipeline_.executor ||
        !pipeline_.wallet || !pipeline_.wallet_locks || !pipeline_.breaker || !pipeline_.clock) {
        throw std::invalid_argument("RetryCoordinator requires a complete trade pipeline");
    }
}

TradeResult RetryCoordinator::execute_trade(const TradeRequest& request, const CancellationToken& cancel) {
    const std::string wallet_key = pipeline_.wallet->public_key();
    if (!request.requester_wallet.empty() && request.requester_wallet != wallet_key) {
        TradeResult result;
        result.request_id = request.request_id;
        result.status = TradeStatus::Rejected;
        result.rejection_reason = "requester wallet " + request.requester_wallet + " is not managed by this executor";
        result.completed_at = pipeline_.clock->now();
        return result;
    }

    if (!pipeline_.breaker->allow_request()) {
        std::string message = fmt::format("circuit open, retry in {} ms", pipeline_.breaker->remaining_cooldown_ms());
        TradeEvent event{TradeEventType::CircuitOpened, request.request_id, message};
        event.data = {{"consecutive_failures", pipeline_.breaker->consecutive_failures()}};
        pipeline_.events->emit(event);
        throw ExecutionError(ExecutionErrorKind::CircuitOpen, message);
    }

    RetryState state = RetryState::Idle;
    AttemptReport report;
    int attempts = 0;

    while (state != RetryState::Success && state != RetryState::Exhausted) {
        switch (state) {
            case RetryState::Idle:
                state = next_retry_state(state, RetryEvent::Start, attempts, retry_config_.max_attempts);
                break;

            case RetryState::Attempting: {
                ++attempts;
                TradeEvent event{TradeEventType::AttemptStarted, request.request_id,
                                 fmt::format("attempt {} of {}", attempts, retry_config_.max_attempts)};
                event.data = {{"attempt", attempts}};
                pipeline_.events->emit(event);

                report = run_attempt(request, cancel);
                state = next_retry_state(state, report.event, attempts, retry_config_.max_attempts);
                break;
            }

            case RetryState::Retrying: {
                auto delay = backoff_delay(attempts);
                spdlog::info("Retrying {} in {} ms after: {}", request.request_id, delay.count(), report.reason);

                TradeEvent event{TradeEventType::RetryScheduled, request.request_id, report.reason};
                event.data = {{"attempt", attempts}, {"delay_ms", delay.count()}};
                pipeline_.events->emit(event);

                pipeline_.clock->sleep_for(delay);

                if (!report.signature.empty()) {
                    resolve_previous_broadcast(report);
                    if (report.event != RetryEvent::TransientFailure) {
                        state = next_retry_state(state, report.event, attempts, retry_config_.max_attempts);
                        break;
                    }
                }

                if (cancel.is_cancelled()) {
                    report.event = RetryEvent::PermanentFailure;
                    report.status = TradeStatus::Failed;
                    report.reason = "cancelled while waiting to retry";
                    state = next_retry_state(state, RetryEvent::PermanentFailure, attempts, retry_config_.max_attempts);
                    break;
                }

                state = next_retry_state(state, RetryEvent::Start, attempts, retry_config_.max_attempts);
                break;
            }

            case RetryState::Success:
            case RetryState::Exhausted:
                break;
        }
    }

    if (state == RetryState::Success) {
        pipeline_.breaker->record_success();
    } else {
        pipeline_.breaker->record_failure();
    }

    return finish(request, state, std::move(report), attempts);
}

std::chrono::milliseconds RetryCoordinator::backoff_delay(int failed_attempts) const {
    return BackoffManager::compute_delay(std::chrono::milliseconds(retry_config_.base_backoff_ms),
                                         std::chrono::milliseconds(retry_config_.max_backoff_ms),
                                         retry_config_.backoff_factor,
                                         failed_attempts,
                                         retry_config_.backoff_jitter);
}

RetryCoordinator::AttemptReport RetryCoordinator::run_attempt(const TradeRequest& request,
                                                               const CancellationToken& cancel) {
    AttemptReport report;
    std::optional<SwapQuote> quote;

    try {
        // Held from before price validation until the transaction settles or
        // is abandoned, so a waiting request always prices fresh
        auto wallet_lock = pipeline_.wallet_locks->acquire(pipeline_.wallet->public_key(), cancel);

        TokenPair pair{request.input_token, request.output_token};
        ConsensusPrice consensus = pipeline_.validator->get_consensus_price(
            pair, validator_config_, cancel, request.request_id);

        quote = pipeline_.quote_builder->build_quote(request, consensus, cancel);

        double balance = pipeline_.wallet->get_balance(request.input_token);
        GateDecision decision = pipeline_.safety_gate->evaluate(*quote, request, balance, pipeline_.clock->now());
        if (!decision.approved) {
            if (decision.reason == GateReason::QuoteExpired) {
                TradeEvent expired{TradeEventType::QuoteExpired, request.request_id, decision.message};
                expired.data = {{"stage", "safety gate"}};
                pipeline_.events->emit(expired);
            }
            TradeEvent event{TradeEventType::GateRejected, request.request_id, decision.message};
            event.data = {{"reason", to_string(decision.reason)}};
            pipeline_.events->emit(event);

            report.event = RetryEvent::PermanentFailure;
            report.status = TradeStatus::Rejected;
            report.reason = decision.message;
            return report;
        }

        TradeResult result = pipeline_.executor->execute(*quote, *pipeline_.wallet, cancel);
        report.event = result.status == TradeStatus::Executed ? RetryEvent::Succeeded : RetryEvent::PermanentFailure;
        report.status = result.status;
        report.reason = result.rejection_reason.value_or("");
        report.result = std::move(result);
        return report;

    } catch (const ValidationError& e) {
        report.event = e.is_transient() ? RetryEvent::TransientFailure : RetryEvent::PermanentFailure;
        report.status = TradeStatus::Rejected;
        report.reason = std::string("price validation failed (") + to_string(e.kind()) + "): " + e.what();
    } catch (const QuoteError& e) {
        report.event = e.is_transient() ? RetryEvent::TransientFailure : RetryEvent::PermanentFailure;
        report.status = TradeStatus::Rejected;
        report.reason = std::string("quote failed (") + to_string(e.kind()) + "): " + e.what();
    } catch (const ExecutionError& e) {
        report.event = e.is_transient() ? RetryEvent::TransientFailure : RetryEvent::PermanentFailure;
        report.status = TradeStatus::Failed;
        report.reason = std::string("execution failed (") + to_string(e.kind()) + "): " + e.what();
        report.signature = e.signature();
        report.quote = quote;
        report.last_valid_block_height = e.last_valid_block_height();
    } catch (const OperationCancelled& e) {
        report.event = RetryEvent::PermanentFailure;
        report.status = TradeStatus::Failed;
        report.reason = e.what();
    } catch (const std::exception& e) {
        report.event = RetryEvent::PermanentFailure;
        report.status = TradeStatus::Failed;
        report.reason = std::string("unexpected error: ") + e.what();
    }

    spdlog::warn("Attempt for {} failed ({}): {}", request.request_id, to_string(report.event), report.reason);
    return report;
}

void RetryCoordinator::resolve_previous_broadcast(AttemptReport& report) {
    ReconcileOutcome outcome;
    {
        auto wallet_lock = pipeline_.wallet_locks->acquire(pipeline_.wallet->public_key());
        try {
            outcome = pipeline_.executor->reconcile(report.signature, report.last_valid_block_height,
                                                    *report.quote, *pipeline_.wallet);
        } catch (const std::exception& e) {
            spdlog::error("Could not reconcile {}: {}", report.signature, e.what());
            outcome.state = ReconcileState::InFlight;
        }
    }

    switch (outcome.state) {
        case ReconcileState::Landed:
            report.status = outcome.result->status;
            report.event = report.status == TradeStatus::Executed ? RetryEvent::Succeeded
                                                                  : RetryEvent::PermanentFailure;
            report.reason = outcome.result->rejection_reason.value_or("");
            report.result = std::move(outcome.result);
            break;

        case ReconcileState::Failed:
        case ReconcileState::NotFound:
            report.signature.clear();
            report.quote.reset();
            report.last_valid_block_height = 0;
            break;

        case ReconcileState::InFlight:
            report.event = RetryEvent::PermanentFailure;
            report.status = TradeStatus::Failed;
            report.reason = "transaction " + report.signature +
                            " is still unresolved and may land; not retried to avoid a duplicate swap";
            break;
    }
}

TradeResult RetryCoordinator::finish(const TradeRequest& request, RetryState state, AttemptReport report,
                                     int attempts) {
    TradeResult result;
    bool from_executor = report.result.has_value();

    if (from_executor) {
        result = std::move(*report.result);
    } else {
        result.status = report.status;
        if (!report.signature.empty()) {
            result.tx_signature = report.signature;
        }

        std::string reason = report.reason;
        if (report.event == RetryEvent::TransientFailure) {
            result.status = TradeStatus::Failed;
            reason = fmt::format("retries exhausted after {} attempts: {}", attempts, reason);
        }
        result.rejection_reason = reason;
    }

    result.request_id = request.request_id;
    result.attempts = attempts;
    result.completed_at = pipeline_.clock->now();

    if (state == RetryState::Success) {
        spdlog::info("Trade {} executed after {} attempt(s): {}", request.request_id, attempts,
                     result.tx_signature.value_or(""));
    } else {
        spdlog::warn("Trade {} {} after {} attempt(s): {}", request.request_id, to_string(result.status),
                     attempts, result.rejection_reason.value_or(""));
        if (!from_executor) {
            TradeEvent event{TradeEventType::TradeFailed, request.request_id,
                             result.rejection_reason.value_or("")};
            event.data = result.to_json();
            pipeline_.events->emit(event);
        }
    }
    return result;
}

#include "event_sink.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

const char* to_string(TradeEventType type) {
    switch (type) {
        case TradeEventType::AttemptStarted: return "attempt_started";
        case TradeEventType::SourceRejected: return "source_rejected";
        case TradeEventType::ConsensusReached: return "consensus_reached";
        case TradeEventType::QuoteBuilt: return "quote_built";
        case TradeEventType::QuoteExpired: return "quote_expired";
        case TradeEventType::GateRejected: return "gate_rejected";
        case TradeEventType::TransactionSubmitted: return "transaction_submitted";
        case TradeEventType::TradeExecuted: return "trade_executed";
        case TradeEventType::TradeFailed: return "trade_failed";
        case TradeEventType::RetryScheduled: return "retry_scheduled";
        case TradeEventType::CircuitOpened: return "circuit_opened";
    }
    return "unknown";
}

nlohmann::json TradeEvent::to_json() const {
    return {
        {"type", to_string(type)},
        {"request_id", request_id},
        {"message", message},
        {"data", data},
        {"ts", util::format_timestamp(timestamp)}
    };
}

void LogEventSink::emit(const TradeEvent& event) {
    switch (event.type) {
        case TradeEventType::SourceRejected:
        case TradeEventType::QuoteExpired:
        case TradeEventType::GateRejected:
        case TradeEventType::RetryScheduled:
            spdlog::warn("[{}] {}: {}", event.request_id, to_string(event.type), event.message);
            break;
        case TradeEventType::TradeFailed:
        case TradeEventType::CircuitOpened:
            spdlog::error("[{}] {}: {}", event.request_id, to_string(event.type), event.message);
            break;
        case TradeEventType::TradeExecuted:
        case TradeEventType::TransactionSubmitted:
            spdlog::info("[{}] {}: {}", event.request_id, to_string(event.type), event.message);
            break;
        default:
            spdlog::debug("[{}] {}: {}", event.request_id, to_string(event.type), event.message);
            break;
    }
}

void FanoutEventSink::add(std::shared_ptr<EventSink> sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.push_back(std::move(sink));
}

void FanoutEventSink::emit(const TradeEvent& event) {
    std::vector<std::shared_ptr<EventSink>> sinks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sinks = sinks_;
    }

    for (const auto& sink : sinks) {
        try {
            sink->emit(event);
        } catch (const std::exception& e) {
            spdlog::error("Event sink failed for {}: {}", to_string(event.type), e.what());
        }
    }
}

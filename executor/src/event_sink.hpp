#pragma once
#include "clock.hpp"
#include <string>
#include <vector>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>

enum class TradeEventType {
    AttemptStarted,
    SourceRejected,
    ConsensusReached,
    QuoteBuilt,
    QuoteExpired,
    GateRejected,
    TransactionSubmitted,
    TradeExecuted,
    TradeFailed,
    RetryScheduled,
    CircuitOpened
};

const char* to_string(TradeEventType type);

struct TradeEvent {
    TradeEventType type;
    std::string request_id;
    std::string message;
    nlohmann::json data = nlohmann::json::object();
    TimePoint timestamp = std::chrono::system_clock::now();

    nlohmann::json to_json() const;
};

class EventSink {
public:
    virtual ~EventSink() = default;
    virtual void emit(const TradeEvent& event) = 0;
};

class NullEventSink : public EventSink {
public:
    void emit(const TradeEvent&) override {}
};

// Writes events through spdlog
class LogEventSink : public EventSink {
public:
    void emit(const TradeEvent& event) override;
};

class FanoutEventSink : public EventSink {
public:
    void add(std::shared_ptr<EventSink> sink);
    void emit(const TradeEvent& event) override;

private:
    std::mutex mutex_;
    std::vector<std::shared_ptr<EventSink>> sinks_;
};

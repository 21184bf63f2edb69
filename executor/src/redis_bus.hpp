#pragma once
#include "config.hpp"
#include "event_sink.hpp"
#include "types.hpp"
#include <functional>
#include <memory>
#include <string>

// Trade request intake and result/event publishing over Redis streams
class RedisBus {
public:
    explicit RedisBus(const Config& config);
    ~RedisBus();

    // Reads the request stream as a consumer-group member on its own thread.
    // Entries are acknowledged once handed to the callback.
    void start_consumer(std::function<void(const TradeRequest&)> callback);
    void stop_consumer();

    bool publish_result(const TradeResult& result);
    bool publish_event(const TradeEvent& event);
    // For requests that end without a TradeResult (circuit open, bad payload)
    bool publish_error(const std::string& request_id, const std::string& error);

    bool is_connected() const;

    // Non-copyable
    RedisBus(const RedisBus&) = delete;
    RedisBus& operator=(const RedisBus&) = delete;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};

class RedisEventSink : public EventSink {
public:
    explicit RedisEventSink(std::shared_ptr<RedisBus> bus) : bus_(std::move(bus)) {}

    void emit(const TradeEvent& event) override { bus_->publish_event(event); }

private:
    std::shared_ptr<RedisBus> bus_;
};

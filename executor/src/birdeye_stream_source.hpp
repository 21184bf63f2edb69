#pragma once
#include "price_source.hpp"
#include "clock.hpp"
#include <memory>
#include <string>

// Birdeye price stream over a TLS WebSocket. The stream keeps per-mint USD
// ticks; fetch_price subscribes both mints and waits for ticks that arrive
// after the call began, so a value seen earlier is never served.
class BirdeyeStreamSource : public PriceSource {
public:
    BirdeyeStreamSource(const std::string& ws_url, const std::string& api_key,
                        std::shared_ptr<Clock> clock);
    ~BirdeyeStreamSource() override;

    // Starts the network thread (connect, subscribe, read, reconnect)
    void start();
    void stop();
    bool is_connected() const;

    std::string id() const override { return "birdeye_ws"; }
    PriceQuote fetch_price(const TokenPair& pair, Deadline deadline) override;

    // Feeds one text frame to the tick parser
    void handle_message(const std::string& text);

    // Non-copyable
    BirdeyeStreamSource(const BirdeyeStreamSource&) = delete;
    BirdeyeStreamSource& operator=(const BirdeyeStreamSource&) = delete;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};

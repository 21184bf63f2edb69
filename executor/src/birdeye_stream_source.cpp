#include "birdeye_stream_source.hpp"
#include "backoff_manager.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/ssl.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <atomic>
#include <cmath>
#include <condition_variable>
#include <mutex>
#include <set>
#include <thread>
#include <unordered_map>

namespace beast     = boost::beast;
namespace websocket = beast::websocket;
namespace net       = boost::asio;
namespace ssl       = net::ssl;
using tcp           = net::ip::tcp;
using json          = nlohmann::json;

using WsStream = websocket::stream<beast::ssl_stream<beast::tcp_stream>>;

namespace {

std::string subscribe_message(const std::string& mint) {
    json msg = {
        {"type", "SUBSCRIBE_PRICE"},
        {"data", {
            {"queryType", "simple"},
            {"chartType", "1m"},
            {"address", mint},
            {"currency", "usd"}
        }}
    };
    return msg.dump();
}

} // namespace

class BirdeyeStreamSource::Impl {
public:
    Impl(const std::string& ws_url, const std::string& api_key, std::shared_ptr<Clock> clock)
        : endpoint_(util::parse_url(ws_url)),
          api_key_(api_key),
          clock_(std::move(clock)),
          backoff_(std::chrono::milliseconds(1000), std::chrono::milliseconds(30000), 2.0, 0.1) {
    }

    ~Impl() {
        stop();
    }

    void start() {
        if (running_.exchange(true)) {
            return;
        }
        started_ = true;
        worker_ = std::thread([this] { run(); });
        spdlog::info("Birdeye stream starting for host: {}", endpoint_.host);
    }

    void stop() {
        {
            // Under stop_mutex_ so the reconnect wait cannot miss the change
            std::lock_guard<std::mutex> lock(stop_mutex_);
            if (!running_.exchange(false)) {
                return;
            }
        }
        net::post(ioc_, [this] { close_socket(); });
        stop_cv_.notify_all();
        if (worker_.joinable()) {
            worker_.join();
        }
        connected_ = false;
        ticks_cv_.notify_all();
        spdlog::info("Birdeye stream stopped");
    }

    bool is_connected() const {
        return connected_;
    }

    PriceQuote fetch_price(const TokenPair& pair, Deadline deadline) {
        if (started_ && !connected_) {
            throw SourceError(SourceErrorKind::Unavailable, "birdeye_ws: stream disconnected");
        }

        auto call_started = std::chrono::steady_clock::now();
        ensure_subscribed(pair.base_mint);
        ensure_subscribed(pair.quote_mint);

        std::unique_lock<std::mutex> lock(mutex_);
        bool ready = ticks_cv_.wait_until(lock, deadline, [&] {
            return (started_ && !connected_) ||
                   (has_tick_since(pair.base_mint, call_started) &&
                    has_tick_since(pair.quote_mint, call_started));
        });

        if (started_ && !connected_) {
            throw SourceError(SourceErrorKind::Unavailable, "birdeye_ws: stream disconnected");
        }
        if (!ready) {
            throw SourceError(SourceErrorKind::Timeout, "birdeye_ws: no fresh tick before deadline");
        }

        const Tick& base = ticks_.at(pair.base_mint);
        const Tick& quote_tick = ticks_.at(pair.quote_mint);

        PriceQuote quote;
        quote.token_pair = pair;
        quote.price = base.usd_price / quote_tick.usd_price;
        quote.source_id = "birdeye_ws";
        // The older of the two ticks dates the derived price
        quote.observed_at = std::min(base.observed_at, quote_tick.observed_at);
        quote.latency_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - call_started).count();
        return quote;
    }

    void handle_message(const std::string& text) {
        json msg = json::parse(text, nullptr, false);
        if (msg.is_discarded() || !msg.is_object()) {
            spdlog::debug("Birdeye stream: ignoring non-JSON frame");
            return;
        }

        std::string type = msg.value("type", "");
        if (type == "ERROR") {
            spdlog::warn("Birdeye stream error frame: {}", text);
            return;
        }
        if (type != "PRICE_DATA" || !msg.contains("data") || !msg["data"].is_object()) {
            return;
        }

        const auto& data = msg["data"];
        std::string address = data.value("address", "");
        if (address.empty() || !data.contains("c") || !data["c"].is_number()) {
            return;
        }

        double price = data["c"].get<double>();
        if (!std::isfinite(price) || price <= 0.0) {
            spdlog::debug("Birdeye stream: dropping invalid price for {}", address);
            return;
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            ticks_[address] = Tick{price, clock_->now(), std::chrono::steady_clock::now()};
        }
        ticks_cv_.notify_all();
    }

private:
    struct Tick {
        double usd_price = 0.0;
        TimePoint observed_at;
        std::chrono::steady_clock::time_point received_at;
    };

    bool has_tick_since(const std::string& mint, std::chrono::steady_clock::time_point since) const {
        auto it = ticks_.find(mint);
        return it != ticks_.end() && it->second.received_at >= since;
    }

    void ensure_subscribed(const std::string& mint) {
        bool send = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            send = subscriptions_.insert(mint).second && connected_;
        }
        if (send) {
            std::string message = subscribe_message(mint);
            net::post(ioc_, [this, message] { write_frame(message); });
        }
    }

    // Runs on the io thread
    void write_frame(const std::string& message) {
        std::shared_ptr<WsStream> ws;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ws = ws_;
        }
        if (!ws) {
            return;
        }
        beast::error_code ec;
        ws->write(net::buffer(message), ec);
        if (ec) {
            spdlog::warn("Birdeye stream write failed: {}", ec.message());
        }
    }

    void close_socket() {
        std::shared_ptr<WsStream> ws;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ws = ws_;
        }
        if (ws) {
            beast::error_code ec;
            beast::get_lowest_layer(*ws).socket().close(ec);
        }
    }

    void run() {
        while (running_) {
            try {
                connect_and_read();
            } catch (const std::exception& e) {
                spdlog::warn("Birdeye stream connection error: {}", e.what());
            }

            {
                std::lock_guard<std::mutex> lock(mutex_);
                ws_.reset();
            }
            connected_ = false;
            ticks_cv_.notify_all();

            if (!running_) {
                break;
            }

            backoff_.record_failure("birdeye");
            auto delay = backoff_.get_delay("birdeye");
            spdlog::info("Birdeye stream reconnecting in {} ms", delay.count());

            std::unique_lock<std::mutex> lock(stop_mutex_);
            stop_cv_.wait_for(lock, delay, [this] { return !running_; });
        }
    }

    void connect_and_read() {
        ssl::context ctx(ssl::context::tlsv12_client);
        ctx.set_default_verify_paths();
        ctx.set_verify_mode(ssl::verify_peer);

        tcp::resolver resolver(ioc_);
        auto const results = resolver.resolve(endpoint_.host, std::to_string(endpoint_.port));

        auto ws = std::make_shared<WsStream>(ioc_, ctx);
        beast::get_lowest_layer(*ws).connect(results);
        if (!SSL_set_tlsext_host_name(ws->next_layer().native_handle(), endpoint_.host.c_str())) {
            throw std::runtime_error("failed to set SNI host name");
        }
        ws->next_layer().handshake(ssl::stream_base::client);

        ws->set_option(websocket::stream_base::decorator([](websocket::request_type& req) {
            req.set(beast::http::field::origin, "ws://public-api.birdeye.so");
            req.set(beast::http::field::sec_websocket_protocol, "echo-protocol");
        }));
        ws->set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));

        std::string target = endpoint_.path;
        if (!api_key_.empty()) {
            target += (target.find('?') == std::string::npos ? "?" : "&");
            target += "x-api-key=" + api_key_;
        }
        ws->handshake(endpoint_.host, target);
        ws->text(true);

        std::set<std::string> mints;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ws_ = ws;
            mints = subscriptions_;
        }
        connected_ = true;
        backoff_.record_success("birdeye");
        spdlog::info("Birdeye stream connected, resubscribing {} mints", mints.size());

        for (const auto& mint : mints) {
            ws->write(net::buffer(subscribe_message(mint)));
        }

        read_next(ws);
        ioc_.restart();
        ioc_.run();
    }

    void read_next(const std::shared_ptr<WsStream>& ws) {
        ws->async_read(buffer_, [this, ws](beast::error_code ec, std::size_t) {
            if (ec) {
                if (running_) {
                    spdlog::warn("Birdeye stream read failed: {}", ec.message());
                }
                return;
            }
            std::string text = beast::buffers_to_string(buffer_.data());
            buffer_.consume(buffer_.size());
            handle_message(text);
            if (running_) {
                read_next(ws);
            }
        });
    }

    util::UrlParts endpoint_;
    std::string api_key_;
    std::shared_ptr<Clock> clock_;
    BackoffManager backoff_;

    net::io_context ioc_;
    beast::flat_buffer buffer_;
    std::shared_ptr<WsStream> ws_;
    std::thread worker_;

    std::atomic<bool> running_{false};
    std::atomic<bool> started_{false};
    std::atomic<bool> connected_{false};

    mutable std::mutex mutex_;
    std::condition_variable ticks_cv_;
    std::unordered_map<std::string, Tick> ticks_;
    std::set<std::string> subscriptions_;

    std::mutex stop_mutex_;
    std::condition_variable stop_cv_;
};

BirdeyeStreamSource::BirdeyeStreamSource(const std::string& ws_url, const std::string& api_key,
                                         std::shared_ptr<Clock> clock)
    : pImpl_(std::make_unique<Impl>(ws_url, api_key, std::move(clock))) {}

BirdeyeStreamSource::~BirdeyeStreamSource() = default;

void BirdeyeStreamSource::start() {
    pImpl_->start();
}

void BirdeyeStreamSource::stop() {
    pImpl_->stop();
}

bool BirdeyeStreamSource::is_connected() const {
    return pImpl_->is_connected();
}

PriceQuote BirdeyeStreamSource::fetch_price(const TokenPair& pair, Deadline deadline) {
    return pImpl_->fetch_price(pair, deadline);
}

void BirdeyeStreamSource::handle_message(const std::string& text) {
    pImpl_->handle_message(text);
}

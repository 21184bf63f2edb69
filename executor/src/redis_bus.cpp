#include "redis_bus.hpp"
#include "util.hpp"
#include <sw/redis++/redis++.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <atomic>
#include <chrono>
#include <iterator>
#include <thread>
#include <unordered_map>
#include <vector>

using json = nlohmann::json;

namespace {

using Attrs = std::vector<std::pair<std::string, std::string>>;
using Item = std::pair<std::string, sw::redis::Optional<Attrs>>;
using ItemStream = std::vector<Item>;

sw::redis::ConnectionOptions connection_options(const Config& config) {
    sw::redis::ConnectionOptions opts;
    opts.host = config.redis_host;
    opts.port = config.redis_port;
    if (!config.redis_password.empty()) {
        opts.password = config.redis_password;
    }
    opts.socket_timeout = std::chrono::milliseconds(2000);
    return opts;
}

} // namespace

class RedisBus::Impl {
public:
    explicit Impl(const Config& config)
        : config_(config), running_(false) {
        sw::redis::ConnectionPoolOptions pool_opts;
        pool_opts.size = static_cast<std::size_t>(config_.worker_threads) + 2;

        redis_ = std::make_unique<sw::redis::Redis>(connection_options(config_), pool_opts);
        redis_->ping();
        spdlog::info("Connected to Redis at {}:{}", config_.redis_host, config_.redis_port);
    }

    ~Impl() {
        stop_consumer();
    }

    void start_consumer(std::function<void(const TradeRequest&)> callback) {
        if (consumer_thread_.joinable()) {
            spdlog::warn("Trade request consumer already running");
            return;
        }

        running_ = true;
        consumer_thread_ = std::thread([this, callback]() {
            run_consumer(callback);
        });
    }

    void stop_consumer() {
        if (!running_.exchange(false)) {
            return;
        }
        if (consumer_thread_.joinable()) {
            consumer_thread_.join();
        }
        spdlog::info("Trade request consumer stopped");
    }

    bool publish_result(const TradeResult& result) {
        return xadd(config_.stream_results, result.to_json().dump());
    }

    bool publish_event(const TradeEvent& event) {
        return xadd(config_.stream_events, event.to_json().dump());
    }

    bool publish_error(const std::string& request_id, const std::string& error) {
        json payload = {
            {"request_id", request_id},
            {"status", "error"},
            {"error", error},
            {"ts", util::current_iso8601()}
        };
        return xadd(config_.stream_results, payload.dump());
    }

    bool is_connected() const {
        try {
            redis_->ping();
            return true;
        } catch (const sw::redis::Error& e) {
            spdlog::debug("Redis ping failed: {}", e.what());
            return false;
        }
    }

private:
    void run_consumer(const std::function<void(const TradeRequest&)>& callback) {
        // Separate connection: the blocking read must not hold a pool slot
        sw::redis::ConnectionOptions opts = connection_options(config_);
        opts.socket_timeout = std::chrono::milliseconds(0);
        sw::redis::Redis redis(opts);

        try {
            redis.xgroup_create(config_.stream_requests, config_.consumer_group, "$", true);
        } catch (const sw::redis::Error& e) {
            spdlog::debug("Consumer group already exists or error: {}", e.what());
        }

        std::string consumer_id = config_.service_name + "_" + util::generate_uuid().substr(0, 8);
        spdlog::info("Consuming trade requests from {} as {}", config_.stream_requests, consumer_id);

        while (running_) {
            try {
                std::unordered_map<std::string, ItemStream> result;
                redis.xreadgroup(config_.consumer_group, consumer_id, config_.stream_requests, ">",
                                 std::chrono::milliseconds(1000), 16,
                                 std::inserter(result, result.end()));

                for (const auto& stream : result) {
                    for (const auto& item : stream.second) {
                        handle_entry(redis, item, callback);
                    }
                }
            } catch (const sw::redis::Error& e) {
                spdlog::error("Error in trade request consumer: {}", e.what());
                std::this_thread::sleep_for(std::chrono::seconds(1));
            }
        }
    }

    void handle_entry(sw::redis::Redis& redis, const Item& item,
                      const std::function<void(const TradeRequest&)>& callback) {
        const std::string& id = item.first;

        std::string data;
        if (item.second) {
            for (const auto& field : *item.second) {
                if (field.first == "data") {
                    data = field.second;
                }
            }
        }

        // At-most-once: a request is acknowledged before it is traded, so a
        // crash can drop it but never replay a swap
        redis.xack(config_.stream_requests, config_.consumer_group, id);

        json j = json::parse(data, nullptr, false);
        if (j.is_discarded()) {
            spdlog::error("Trade request {} is not valid JSON", id);
            publish_error(id, "request payload is not valid JSON");
            return;
        }

        auto request = TradeRequest::from_json(j);
        if (!request) {
            publish_error(j.value("request_id", id), "invalid trade request");
            return;
        }

        try {
            callback(*request);
        } catch (const std::exception& e) {
            spdlog::error("Trade request {} rejected by handler: {}", request->request_id, e.what());
            publish_error(request->request_id, e.what());
        }
    }

    bool xadd(const std::string& stream, const std::string& payload) {
        try {
            redis_->xadd(stream, "*", {std::make_pair("data", payload)});
            return true;
        } catch (const sw::redis::Error& e) {
            spdlog::error("Failed to publish to {}: {}", stream, e.what());
            return false;
        }
    }

    Config config_;
    std::unique_ptr<sw::redis::Redis> redis_;
    std::atomic<bool> running_;
    std::thread consumer_thread_;
};

RedisBus::RedisBus(const Config& config)
    : pImpl_(std::make_unique<Impl>(config)) {}

RedisBus::~RedisBus() = default;

void RedisBus::start_consumer(std::function<void(const TradeRequest&)> callback) {
    pImpl_->start_consumer(std::move(callback));
}

void RedisBus::stop_consumer() {
    pImpl_->stop_consumer();
}

bool RedisBus::publish_result(const TradeResult& result) {
    return pImpl_->publish_result(result);
}

bool RedisBus::publish_event(const TradeEvent& event) {
    return pImpl_->publish_event(event);
}

bool RedisBus::publish_error(const std::string& request_id, const std::string& error) {
    return pImpl_->publish_error(request_id, error);
}

bool RedisBus::is_connected() const {
    return pImpl_->is_connected();
}

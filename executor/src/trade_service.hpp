#pragma once
#include "cancellation.hpp"
#include "config.hpp"
#include "types.hpp"
#include <atomic>
#include <condition_variable>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>
#include <nlohmann/json.hpp>

class BirdeyeStreamSource;
class CircuitBreaker;
class HealthServer;
class RedisBus;
class RetryCoordinator;
class SolanaClient;
class TradeAuditStore;

// Wires the pipeline to the outside: requests from Redis, results and
// events back to Redis, terminal outcomes to the audit table.
class TradeService {
public:
    explicit TradeService(const Config& config);
    ~TradeService();

    // Blocks until stop()
    void run();
    void stop();

    // Runs one request to completion and publishes its outcome
    void process(const TradeRequest& request);

    nlohmann::json health() const;
    nlohmann::json stats() const;

private:
    void enqueue(const TradeRequest& request);
    void publish_error(const std::string& request_id, const std::string& error);
    void worker_loop(int worker_id);

    struct Counters {
        std::atomic<uint64_t> received{0};
        std::atomic<uint64_t> executed{0};
        std::atomic<uint64_t> rejected{0};
        std::atomic<uint64_t> failed{0};
        std::atomic<uint64_t> circuit_open{0};
        std::atomic<uint64_t> errors{0};
        std::atomic<uint64_t> unpublished{0};
        std::atomic<uint64_t> unaudited{0};
    };

    Config config_;

    std::shared_ptr<SolanaClient> chain_;
    std::shared_ptr<BirdeyeStreamSource> birdeye_;
    std::shared_ptr<CircuitBreaker> breaker_;
    std::shared_ptr<RedisBus> bus_;
    std::unique_ptr<TradeAuditStore> audit_;
    std::unique_ptr<RetryCoordinator> coordinator_;
    std::unique_ptr<HealthServer> health_server_;

    std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::deque<TradeRequest> queue_;
    std::vector<std::thread> workers_;

    std::mutex inflight_mutex_;
    std::map<uint64_t, CancellationToken> inflight_;
    uint64_t next_inflight_id_ = 0;

    Counters counters_;
    std::atomic<bool> running_{false};
};

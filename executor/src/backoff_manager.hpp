#pragma once
#include <chrono>
#include <mutex>
#include <string>
#include <unordered_map>

class BackoffManager {
public:
    BackoffManager(std::chrono::milliseconds base_delay = std::chrono::milliseconds(1000),
                   std::chrono::milliseconds max_delay = std::chrono::milliseconds(30000),
                   double multiplier = 2.0,
                   double jitter = 0.1);

    // Record a failure for an endpoint
    void record_failure(const std::string& endpoint);

    // Record a success for an endpoint (resets backoff)
    void record_success(const std::string& endpoint);

    // Current delay for an endpoint
    std::chrono::milliseconds get_delay(const std::string& endpoint);

    // True while the endpoint is still inside its backoff window
    bool should_wait(const std::string& endpoint);

    int failure_count(const std::string& endpoint);

    // base * multiplier^(failure_count - 1), capped, then jittered (+/- jitter)
    static std::chrono::milliseconds compute_delay(std::chrono::milliseconds base,
                                                   std::chrono::milliseconds max,
                                                   double multiplier,
                                                   int failure_count,
                                                   double jitter);

private:
    struct BackoffState {
        int failure_count = 0;
        std::chrono::steady_clock::time_point last_failure;
        std::chrono::milliseconds current_delay{0};

        BackoffState() : last_failure(std::chrono::steady_clock::now()) {}
    };

    std::mutex mutex_;
    std::unordered_map<std::string, BackoffState> states_;
    std::chrono::milliseconds base_delay_;
    std::chrono::milliseconds max_delay_;
    double multiplier_;
    double jitter_;
};

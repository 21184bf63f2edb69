#pragma once
#include "clock.hpp"
#include <atomic>
#include <cstdint>
#include <memory>

enum class CircuitState { Closed, Open, HalfOpen };

const char* to_string(CircuitState state);

// Counts consecutive exhausted trades across coordinators. Shared by
// std::shared_ptr; all counters are lock-free atomics.
class CircuitBreaker {
public:
    CircuitBreaker(int failure_threshold, int64_t cooldown_ms, std::shared_ptr<Clock> clock);

    // True when a call may proceed. After the cooldown exactly one caller is
    // admitted as the half-open probe until it reports back.
    bool allow_request();

    void record_success();
    void record_failure();

    CircuitState state() const;
    int consecutive_failures() const { return consecutive_failures_.load(); }
    // Milliseconds until the cooldown ends; 0 when not open
    int64_t remaining_cooldown_ms() const;

private:
    int64_t now_ms() const;

    const int failure_threshold_;
    const int64_t cooldown_ms_;
    std::shared_ptr<Clock> clock_;

    std::atomic<int> consecutive_failures_{0};
    std::atomic<int64_t> open_until_ms_{0};     // 0 = closed
    std::atomic<bool> probe_in_flight_{false};
};

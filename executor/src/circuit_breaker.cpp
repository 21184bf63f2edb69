#include "circuit_breaker.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

const char* to_string(CircuitState state) {
    switch (state) {
        case CircuitState::Closed: return "closed";
        case CircuitState::Open: return "open";
        case CircuitState::HalfOpen: return "half_open";
    }
    return "unknown";
}

CircuitBreaker::CircuitBreaker(int failure_threshold, int64_t cooldown_ms, std::shared_ptr<Clock> clock)
    : failure_threshold_(failure_threshold),
      cooldown_ms_(cooldown_ms),
      clock_(std::move(clock)) {
    if (failure_threshold_ < 1) {
        throw std::invalid_argument("Circuit breaker threshold must be at least 1");
    }
}

bool CircuitBreaker::allow_request() {
    int64_t open_until = open_until_ms_.load();
    if (open_until == 0) {
        return true;
    }
    if (now_ms() < open_until) {
        return false;
    }

    // Cooldown over: admit a single probe
    bool expected = false;
    return probe_in_flight_.compare_exchange_strong(expected, true);
}

void CircuitBreaker::record_success() {
    consecutive_failures_.store(0);
    int64_t was_open = open_until_ms_.exchange(0);
    probe_in_flight_.store(false);
    if (was_open != 0) {
        spdlog::info("Circuit breaker closed after successful probe");
    }
}

void CircuitBreaker::record_failure() {
    int failures = consecutive_failures_.fetch_add(1) + 1;
    bool was_probe = probe_in_flight_.exchange(false);

    if (failures >= failure_threshold_ || was_probe) {
        int64_t reopen_at = now_ms() + cooldown_ms_;
        int64_t previous = open_until_ms_.load();
        // Only extend; a concurrent failure may already have set a later time
        while (previous < reopen_at && !open_until_ms_.compare_exchange_weak(previous, reopen_at)) {
        }
        spdlog::warn("Circuit breaker open for {} ms after {} consecutive failures", cooldown_ms_, failures);
    }
}

CircuitState CircuitBreaker::state() const {
    int64_t open_until = open_until_ms_.load();
    if (open_until == 0) {
        return CircuitState::Closed;
    }
    return now_ms() < open_until ? CircuitState::Open : CircuitState::HalfOpen;
}

int64_t CircuitBreaker::remaining_cooldown_ms() const {
    int64_t open_until = open_until_ms_.load();
    if (open_until == 0) {
        return 0;
    }
    int64_t remaining = open_until - now_ms();
    return remaining > 0 ? remaining : 0;
}

int64_t CircuitBreaker::now_ms() const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        clock_->now().time_since_epoch()).count();
}

#include "backoff_manager.hpp"
#include "util.hpp"
#include <algorithm>
#include <cmath>

BackoffManager::BackoffManager(std::chrono::milliseconds base_delay,
                               std::chrono::milliseconds max_delay,
                               double multiplier,
                               double jitter)
    : base_delay_(base_delay),
      max_delay_(max_delay),
      multiplier_(multiplier),
      jitter_(jitter) {
}

void BackoffManager::record_failure(const std::string& endpoint) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto& state = states_[endpoint];
    state.failure_count++;
    state.last_failure = std::chrono::steady_clock::now();
    state.current_delay = compute_delay(base_delay_, max_delay_, multiplier_, state.failure_count, jitter_);
}

void BackoffManager::record_success(const std::string& endpoint) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = states_.find(endpoint);
    if (it != states_.end()) {
        it->second.failure_count = 0;
        it->second.current_delay = std::chrono::milliseconds(0);
    }
}

std::chrono::milliseconds BackoffManager::get_delay(const std::string& endpoint) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = states_.find(endpoint);
    if (it == states_.end()) {
        return std::chrono::milliseconds(0);
    }
    return it->second.current_delay;
}

bool BackoffManager::should_wait(const std::string& endpoint) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = states_.find(endpoint);
    if (it == states_.end() || it->second.failure_count == 0) {
        return false;
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - it->second.last_failure);
    return elapsed < it->second.current_delay;
}

int BackoffManager::failure_count(const std::string& endpoint) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = states_.find(endpoint);
    return it == states_.end() ? 0 : it->second.failure_count;
}

std::chrono::milliseconds BackoffManager::compute_delay(std::chrono::milliseconds base,
                                                        std::chrono::milliseconds max,
                                                        double multiplier,
                                                        int failure_count,
                                                        double jitter) {
    if (failure_count <= 0) {
        return std::chrono::milliseconds(0);
    }

    double delay_ms = static_cast<double>(base.count()) * std::pow(multiplier, failure_count - 1);
    delay_ms = std::min(delay_ms, static_cast<double>(max.count()));
    delay_ms = util::random_jitter(delay_ms, jitter);

    return std::chrono::milliseconds(static_cast<int64_t>(delay_ms));
}

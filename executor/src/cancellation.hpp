#pragma once
#include <atomic>
#include <chrono>
#include <memory>

// Shared cancellation flag with an optional steady-clock deadline.
// Copies observe the same state, so a caller can hand one to a worker and
// cancel it later.
class CancellationToken {
public:
    CancellationToken() : state_(std::make_shared<State>()) {}

    static CancellationToken with_timeout(std::chrono::milliseconds timeout) {
        CancellationToken token;
        token.state_->has_deadline = true;
        token.state_->deadline = std::chrono::steady_clock::now() + timeout;
        return token;
    }

    void cancel() { state_->cancelled = true; }

    bool is_cancelled() const {
        if (state_->cancelled) {
            return true;
        }
        return state_->has_deadline && std::chrono::steady_clock::now() >= state_->deadline;
    }

private:
    struct State {
        std::atomic<bool> cancelled{false};
        bool has_deadline = false;
        std::chrono::steady_clock::time_point deadline;
    };

    std::shared_ptr<State> state_;
};

#pragma once
#include <chrono>
#include <cstdint>
#include <memory>

using TimePoint = std::chrono::system_clock::time_point;

// Time source for every freshness, expiry and backoff decision in the pipeline.
class Clock {
public:
    virtual ~Clock() = default;

    virtual TimePoint now() const = 0;
    virtual void sleep_for(std::chrono::milliseconds duration) = 0;
};

class SystemClock : public Clock {
public:
    TimePoint now() const override;
    void sleep_for(std::chrono::milliseconds duration) override;

    static std::shared_ptr<Clock> instance();
};

inline int64_t millis_between(TimePoint from, TimePoint to) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(to - from).count();
}

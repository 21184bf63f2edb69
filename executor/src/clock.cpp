#include "clock.hpp"
#include <thread>

TimePoint SystemClock::now() const {
    return std::chrono::system_clock::now();
}

void SystemClock::sleep_for(std::chrono::milliseconds duration) {
    if (duration.count() > 0) {
        std::this_thread::sleep_for(duration);
    }
}

std::shared_ptr<Clock> SystemClock::instance() {
    static std::shared_ptr<Clock> clock = std::make_shared<SystemClock>();
    return clock;
}

#include "rate_limiter.hpp"
#include <algorithm>
#include <stdexcept>
#include <thread>

RateLimiter::RateLimiter(int requests_per_second, int burst_capacity)
    : rate_per_second_(requests_per_second),
      capacity_(burst_capacity) {
    if (requests_per_second <= 0 || burst_capacity <= 0) {
        throw std::invalid_argument("RateLimiter needs a positive rate and burst");
    }
}

bool RateLimiter::try_acquire(const std::string& upstream) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = std::chrono::steady_clock::now();
    Bucket& bucket = bucket_for(upstream, now);

    if (refill(bucket, now) > std::chrono::steady_clock::duration::zero()) {
        return false;
    }
    bucket.tokens -= 1.0;
    return true;
}

bool RateLimiter::acquire_before(const std::string& upstream,
                                 std::chrono::steady_clock::time_point deadline) {
    while (true) {
        std::chrono::steady_clock::duration wait;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto now = std::chrono::steady_clock::now();
            Bucket& bucket = bucket_for(upstream, now);
            wait = refill(bucket, now);
            if (wait == std::chrono::steady_clock::duration::zero()) {
                bucket.tokens -= 1.0;
                return true;
            }
            if (now + wait > deadline) {
                return false;
            }
        }
        // Another caller may take the refilled token; loop and re-check
        std::this_thread::sleep_for(wait);
    }
}

std::chrono::steady_clock::duration RateLimiter::refill(Bucket& bucket,
                                                        std::chrono::steady_clock::time_point now) const {
    double elapsed = std::chrono::duration<double>(now - bucket.refilled_at).count();
    bucket.tokens = std::min(capacity_, bucket.tokens + elapsed * rate_per_second_);
    bucket.refilled_at = now;

    if (bucket.tokens >= 1.0) {
        return std::chrono::steady_clock::duration::zero();
    }
    auto missing = std::chrono::duration<double>((1.0 - bucket.tokens) / rate_per_second_);
    return std::max(std::chrono::duration_cast<std::chrono::steady_clock::duration>(missing),
                    std::chrono::steady_clock::duration(1));
}

RateLimiter::Bucket& RateLimiter::bucket_for(const std::string& upstream,
                                             std::chrono::steady_clock::time_point now) {
    auto it = buckets_.find(upstream);
    if (it == buckets_.end()) {
        it = buckets_.emplace(upstream, Bucket{capacity_, now}).first;
    }
    return it->second;
}

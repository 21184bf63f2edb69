#pragma once
#include <chrono>
#include <mutex>
#include <string>
#include <unordered_map>

// Token buckets keyed by upstream name. Price sources use try_acquire and
// report themselves unavailable for the round when empty; routers may wait
// for a refill as long as it lands before their quote deadline.
class RateLimiter {
public:
    RateLimiter(int requests_per_second, int burst_capacity);

    bool try_acquire(const std::string& upstream);

    // Waits for a token only if one refills before `deadline`
    bool acquire_before(const std::string& upstream, std::chrono::steady_clock::time_point deadline);

private:
    struct Bucket {
        double tokens;
        std::chrono::steady_clock::time_point refilled_at;
    };

    // Refills and returns the wait until one token is available (zero if one is)
    std::chrono::steady_clock::duration refill(Bucket& bucket, std::chrono::steady_clock::time_point now) const;
    Bucket& bucket_for(const std::string& upstream, std::chrono::steady_clock::time_point now);

    std::mutex mutex_;
    std::unordered_map<std::string, Bucket> buckets_;
    const double rate_per_second_;
    const double capacity_;
};

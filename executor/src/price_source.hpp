#pragma once
#include "types.hpp"
#include <chrono>
#include <string>

using Deadline = std::chrono::steady_clock::time_point;

// A single external price provider. Implementations fetch on every call:
// no caching and no internal retry. Failures are reported as SourceError.
class PriceSource {
public:
    virtual ~PriceSource() = default;

    virtual std::string id() const = 0;

    // Returns a quote whose observed_at is the fetch completion time.
    // Must give up by the deadline with SourceErrorKind::Timeout.
    virtual PriceQuote fetch_price(const TokenPair& pair, Deadline deadline) = 0;
};

inline int64_t millis_until(Deadline deadline) {
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now()).count();
    return remaining > 0 ? remaining : 0;
}

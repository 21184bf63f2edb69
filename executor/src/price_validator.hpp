#pragma once
#include "cancellation.hpp"
#include "clock.hpp"
#include "config.hpp"
#include "event_sink.hpp"
#include "price_source.hpp"
#include "types.hpp"
#include <memory>
#include <string>
#include <vector>

struct SourceFailure {
    std::string source_id;
    std::string reason;
};

// Fans out to every configured PriceSource on each call and reduces the
// answers to a median consensus. Holds no price data between calls.
class MultiSourcePriceValidator {
public:
    MultiSourcePriceValidator(std::vector<std::shared_ptr<PriceSource>> sources,
                              std::shared_ptr<Clock> clock,
                              std::shared_ptr<EventSink> events = nullptr);

    // Throws ValidationError, or OperationCancelled if the token fires while
    // waiting on sources.
    ConsensusPrice get_consensus_price(const TokenPair& pair,
                                       const ValidatorConfig& config,
                                       const CancellationToken& cancel = CancellationToken(),
                                       const std::string& request_id = "");

    // Freshness, sanity, count and deviation checks over already collected
    // quotes, evaluated at `now`. Rejected quotes are appended to `rejected`.
    static ConsensusPrice aggregate(const TokenPair& pair,
                                    const std::vector<PriceQuote>& quotes,
                                    const ValidatorConfig& config,
                                    TimePoint now,
                                    std::vector<SourceFailure>& rejected);

    static double max_pairwise_deviation_pct(const std::vector<PriceQuote>& quotes);
    static double median_price(std::vector<PriceQuote> quotes);

private:
    struct FanoutResult {
        std::vector<PriceQuote> quotes;
        std::vector<SourceFailure> failures;
    };

    FanoutResult fan_out(const TokenPair& pair, const ValidatorConfig& config,
                         const CancellationToken& cancel);
    void report_rejections(const std::string& request_id, const TokenPair& pair,
                           const std::vector<SourceFailure>& failures);

    std::vector<std::shared_ptr<PriceSource>> sources_;
    std::shared_ptr<Clock> clock_;
    std::shared_ptr<EventSink> events_;
};

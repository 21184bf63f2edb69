#include "price_validator.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <algorithm>
#include <cmath>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <thread>

namespace {

// Shared between the caller and the detached fetch threads; whichever
// finishes last releases it.
struct FanoutState {
    std::mutex mutex;
    std::condition_variable cv;
    std::vector<PriceQuote> quotes;
    std::vector<SourceFailure> failures;
    std::vector<bool> finished;
    size_t pending = 0;
    bool abandoned = false;
};

constexpr auto kCancelPollInterval = std::chrono::milliseconds(10);

} // namespace

MultiSourcePriceValidator::MultiSourcePriceValidator(std::vector<std::shared_ptr<PriceSource>> sources,
                                                     std::shared_ptr<Clock> clock,
                                                     std::shared_ptr<EventSink> events)
    : sources_(std::move(sources)),
      clock_(std::move(clock)),
      events_(events ? std::move(events) : std::make_shared<NullEventSink>()) {
    if (sources_.empty()) {
        throw std::invalid_argument("MultiSourcePriceValidator requires at least one price source");
    }
}

ConsensusPrice MultiSourcePriceValidator::get_consensus_price(const TokenPair& pair,
                                                              const ValidatorConfig& config,
                                                              const CancellationToken& cancel,
                                                              const std::string& request_id) {
    if (cancel.is_cancelled()) {
        throw OperationCancelled("price validation");
    }

    auto fanout = fan_out(pair, config, cancel);

    std::vector<SourceFailure> rejected = fanout.failures;
    try {
        ConsensusPrice consensus = aggregate(pair, fanout.quotes, config, clock_->now(), rejected);
        report_rejections(request_id, pair, rejected);

        TradeEvent event{TradeEventType::ConsensusReached, request_id,
                         fmt::format("consensus {} from {} sources", consensus.price,
                                     consensus.contributing_sources.size())};
        event.data = to_json(consensus);
        events_->emit(event);
        return consensus;
    } catch (const ValidationError&) {
        report_rejections(request_id, pair, rejected);
        throw;
    }
}

MultiSourcePriceValidator::FanoutResult MultiSourcePriceValidator::fan_out(const TokenPair& pair,
                                                                           const ValidatorConfig& config,
                                                                           const CancellationToken& cancel) {
    auto state = std::make_shared<FanoutState>();
    state->pending = sources_.size();
    state->finished.assign(sources_.size(), false);

    const Deadline deadline = std::chrono::steady_clock::now() +
                              std::chrono::milliseconds(config.fresh_data_timeout_ms);

    for (size_t i = 0; i < sources_.size(); ++i) {
        std::shared_ptr<PriceSource> source = sources_[i];
        std::thread([state, source, pair, deadline, i]() {
            std::optional<PriceQuote> quote;
            std::optional<SourceFailure> failure;
            try {
                quote = source->fetch_price(pair, deadline);
            } catch (const SourceError& e) {
                failure = SourceFailure{source->id(), std::string(to_string(e.kind())) + ": " + e.what()};
            } catch (const std::exception& e) {
                failure = SourceFailure{source->id(), std::string("unexpected: ") + e.what()};
            }

            std::lock_guard<std::mutex> lock(state->mutex);
            if (!state->abandoned) {
                if (quote) {
                    state->quotes.push_back(*quote);
                } else if (failure) {
                    state->failures.push_back(*failure);
                }
            }
            state->finished[i] = true;
            state->pending--;
            state->cv.notify_all();
        }).detach();
    }

    std::unique_lock<std::mutex> lock(state->mutex);
    while (state->pending > 0) {
        if (cancel.is_cancelled()) {
            state->abandoned = true;
            throw OperationCancelled("price validation");
        }
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            break;
        }
        state->cv.wait_until(lock, std::min(deadline, now + kCancelPollInterval));
    }
    state->abandoned = true;

    FanoutResult result;
    result.quotes = state->quotes;
    result.failures = state->failures;
    for (size_t i = 0; i < sources_.size(); ++i) {
        if (!state->finished[i]) {
            result.failures.push_back({sources_[i]->id(), "timeout: no response within fresh data window"});
        }
    }

    spdlog::debug("Price fan-out for {}: {} quotes, {} failures",
                  pair.to_string(), result.quotes.size(), result.failures.size());
    return result;
}

ConsensusPrice MultiSourcePriceValidator::aggregate(const TokenPair& pair,
                                                    const std::vector<PriceQuote>& quotes,
                                                    const ValidatorConfig& config,
                                                    TimePoint now,
                                                    std::vector<SourceFailure>& rejected) {
    std::vector<PriceQuote> survivors;
    std::set<std::string> seen_sources;

    for (const auto& quote : quotes) {
        if (quote.token_pair != pair) {
            rejected.push_back({quote.source_id, "quote for wrong pair " + quote.token_pair.to_string()});
            continue;
        }
        if (!std::isfinite(quote.price) || quote.price <= 0.0) {
            rejected.push_back({quote.source_id, "invalid price"});
            continue;
        }
        int64_t age_ms = millis_between(quote.observed_at, now);
        if (age_ms > config.max_price_age_ms) {
            rejected.push_back({quote.source_id,
                                fmt::format("stale: {} ms old, limit {} ms", age_ms, config.max_price_age_ms)});
            continue;
        }
        // One vote per source
        if (!seen_sources.insert(quote.source_id).second) {
            rejected.push_back({quote.source_id, "duplicate quote from source"});
            continue;
        }
        survivors.push_back(quote);
    }

    if (static_cast<int>(survivors.size()) < config.min_price_sources) {
        throw ValidationError(ValidationErrorKind::InsufficientSources,
                              fmt::format("{} fresh quotes for {}, need {}",
                                          survivors.size(), pair.to_string(), config.min_price_sources));
    }

    double deviation = max_pairwise_deviation_pct(survivors);
    if (deviation > config.price_tolerance_percent) {
        throw ValidationError(ValidationErrorKind::Inconsistent,
                              fmt::format("sources disagree on {} by {:.4f}%, tolerance {}%",
                                          pair.to_string(), deviation, config.price_tolerance_percent));
    }

    ConsensusPrice consensus;
    consensus.token_pair = pair;
    consensus.price = median_price(survivors);
    consensus.max_deviation_pct = deviation;
    consensus.computed_at = now;
    consensus.contributing_sources = seen_sources;
    consensus.confidence = survivors.size() >= 3 ? PriceConfidence::High
                         : survivors.size() == 2 ? PriceConfidence::Medium
                                                 : PriceConfidence::Low;
    consensus.quotes = std::move(survivors);
    return consensus;
}

double MultiSourcePriceValidator::max_pairwise_deviation_pct(const std::vector<PriceQuote>& quotes) {
    double max_deviation = 0.0;
    for (size_t i = 0; i < quotes.size(); ++i) {
        for (size_t j = i + 1; j < quotes.size(); ++j) {
            double a = quotes[i].price;
            double b = quotes[j].price;
            double deviation = std::fabs(a - b) / std::min(a, b) * 100.0;
            max_deviation = std::max(max_deviation, deviation);
        }
    }
    return max_deviation;
}

double MultiSourcePriceValidator::median_price(std::vector<PriceQuote> quotes) {
    if (quotes.empty()) {
        throw std::invalid_argument("median of empty quote set");
    }
    std::sort(quotes.begin(), quotes.end(),
              [](const PriceQuote& a, const PriceQuote& b) { return a.price < b.price; });

    size_t mid = quotes.size() / 2;
    if (quotes.size() % 2 == 1) {
        return quotes[mid].price;
    }
    return (quotes[mid - 1].price + quotes[mid].price) / 2.0;
}

void MultiSourcePriceValidator::report_rejections(const std::string& request_id, const TokenPair& pair,
                                                  const std::vector<SourceFailure>& failures) {
    for (const auto& failure : failures) {
        spdlog::warn("Price source {} rejected for {}: {}", failure.source_id, pair.to_string(), failure.reason);

        TradeEvent event{TradeEventType::SourceRejected, request_id,
                         failure.source_id + ": " + failure.reason};
        event.data = {{"source_id", failure.source_id}, {"pair", pair.to_string()}, {"reason", failure.reason}};
        events_->emit(event);
    }
}

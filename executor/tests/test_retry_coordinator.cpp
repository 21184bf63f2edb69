#include <gtest/gtest.h>

#include "errors.hpp"
#include "fakes.hpp"
#include "retry_coordinator.hpp"
#include <future>
#include <map>
#include <mutex>
#include <thread>

using namespace testing_fakes;
using namespace std::chrono_literals;

// ============================================================================
// State machine
// ============================================================================

TEST(RetryStateTest, HappyPath)
{
    EXPECT_EQ(next_retry_state(RetryState::Idle, RetryEvent::Start, 0, 3), RetryState::Attempting);
    EXPECT_EQ(next_retry_state(RetryState::Attempting, RetryEvent::Succeeded, 1, 3), RetryState::Success);
}

TEST(RetryStateTest, TransientFailureRetriesWhileAttemptsRemain)
{
    EXPECT_EQ(next_retry_state(RetryState::Attempting, RetryEvent::TransientFailure, 1, 3), RetryState::Retrying);
    EXPECT_EQ(next_retry_state(RetryState::Attempting, RetryEvent::TransientFailure, 2, 3), RetryState::Retrying);
    EXPECT_EQ(next_retry_state(RetryState::Attempting, RetryEvent::TransientFailure, 3, 3), RetryState::Exhausted);
    EXPECT_EQ(next_retry_state(RetryState::Retrying, RetryEvent::Start, 1, 3), RetryState::Attempting);
}

TEST(RetryStateTest, PermanentFailureExhausts)
{
    EXPECT_EQ(next_retry_state(RetryState::Attempting, RetryEvent::PermanentFailure, 1, 3), RetryState::Exhausted);
    EXPECT_EQ(next_retry_state(RetryState::Retrying, RetryEvent::PermanentFailure, 1, 3), RetryState::Exhausted);
}

TEST(RetryStateTest, TerminalStatesAcceptNothing)
{
    EXPECT_THROW(next_retry_state(RetryState::Success, RetryEvent::Start, 1, 3), std::logic_error);
    EXPECT_THROW(next_retry_state(RetryState::Exhausted, RetryEvent::Start, 1, 3), std::logic_error);
    EXPECT_THROW(next_retry_state(RetryState::Idle, RetryEvent::Succeeded, 0, 3), std::logic_error);
    EXPECT_THROW(next_retry_state(RetryState::Attempting, RetryEvent::Start, 1, 3), std::logic_error);
}

// ============================================================================
// Coordinator
// ============================================================================

namespace {

class RetryCoordinatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        validator_config.max_price_age_ms = 1000;
        validator_config.min_price_sources = 2;
        validator_config.fresh_data_timeout_ms = 300;
        validator_config.price_tolerance_percent = 0.5;

        retry_config.max_attempts = 3;
        retry_config.base_backoff_ms = 200;
        retry_config.backoff_factor = 2.0;
        retry_config.max_backoff_ms = 2000;
        retry_config.backoff_jitter = 0.0;
        retry_config.consecutive_failure_threshold = 3;
        retry_config.circuit_cooldown_ms = 30000;

        execution_config.max_execution_time_ms = 1000;
        execution_config.confirmation_poll_ms = 200;

        source_a = std::make_shared<FakePriceSource>("a", 100.0, clock);
        source_b = std::make_shared<FakePriceSource>("b", 100.1, clock);

        router = std::make_shared<FakeRoutingProvider>("jupiter");
        router->returns(1000000000, 100200000);

        builder = std::make_shared<FakeSwapBuilder>(clock);
        chain = std::make_shared<FakeChainClient>();
        chain->settlement = settled(100.2);
        wallet = std::make_shared<FakeWallet>();
        breaker = std::make_shared<CircuitBreaker>(retry_config.consecutive_failure_threshold,
                                                   retry_config.circuit_cooldown_ms, clock);

        request.request_id = "req-1";
        request.requester_wallet = kWalletKey;
        request.input_token = kSol;
        request.output_token = kUsdc;
        request.amount = 1.0;
        request.max_slippage_pct = 1.0;
        request.min_profit_threshold = -1.0;
    }

    RetryCoordinator coordinator() {
        QuoteConfig quote_config;
        quote_config.quote_validity_ms = 500;

        TradePipeline pipeline;
        pipeline.validator = std::make_shared<MultiSourcePriceValidator>(
            std::vector<std::shared_ptr<PriceSource>>{source_a, source_b}, clock, events);
        pipeline.quote_builder = std::make_shared<QuoteBuilder>(
            std::vector<std::shared_ptr<RoutingProvider>>{router}, std::make_shared<TokenRegistry>(),
            quote_config, 10000, clock, events);
        pipeline.safety_gate = std::make_shared<SafetyGate>(SafetyConfig{});
        pipeline.executor = std::make_shared<TradeExecutor>(builder, chain, execution_config, clock, events);
        pipeline.wallet = wallet;
        pipeline.wallet_locks = wallet_locks;
        pipeline.breaker = breaker;
        pipeline.clock = clock;
        pipeline.events = events;
        return RetryCoordinator(std::move(pipeline), validator_config, retry_config);
    }

    // Pending for the first signature until `cutoff`, then `after`; later
    // signatures confirm immediately
    void first_signature_resolves(TimePoint cutoff, SignatureState after) {
        auto chain_ptr = chain.get();
        auto clock_ptr = clock.get();
        chain->status_for = [chain_ptr, clock_ptr, cutoff, after](const std::string& signature) {
            auto sent = chain_ptr->sent();
            if (!sent.empty() && signature == sent[0]) {
                SignatureState state = clock_ptr->now() < cutoff ? SignatureState::Pending : after;
                return SignatureStatus{state, ""};
            }
            return SignatureStatus{SignatureState::Confirmed, ""};
        };
    }

    std::shared_ptr<ManualClock> clock = std::make_shared<ManualClock>();
    std::shared_ptr<RecordingEventSink> events = std::make_shared<RecordingEventSink>();
    std::shared_ptr<FakePriceSource> source_a;
    std::shared_ptr<FakePriceSource> source_b;
    std::shared_ptr<FakeRoutingProvider> router;
    std::shared_ptr<FakeSwapBuilder> builder;
    std::shared_ptr<FakeChainClient> chain;
    std::shared_ptr<FakeWallet> wallet;
    std::shared_ptr<CircuitBreaker> breaker;
    std::shared_ptr<WalletLockRegistry> wallet_locks = std::make_shared<WalletLockRegistry>();

    ValidatorConfig validator_config;
    RetryConfig retry_config;
    ExecutionConfig execution_config;
    TradeRequest request;
};

} // namespace

TEST_F(RetryCoordinatorTest, ExecutesOnFirstAttempt)
{
    TradeResult result = coordinator().execute_trade(request);

    EXPECT_EQ(result.status, TradeStatus::Executed);
    EXPECT_EQ(result.attempts, 1);
    EXPECT_EQ(result.request_id, "req-1");
    EXPECT_EQ(chain->sends(), 1u);
    EXPECT_EQ(breaker->consecutive_failures(), 0);
    EXPECT_EQ(events->count(TradeEventType::AttemptStarted), 1u);
}

TEST_F(RetryCoordinatorTest, TransientFailuresAreBoundedByMaxAttempts)
{
    source_b->with_error(SourceErrorKind::Unavailable);

    TradeResult result = coordinator().execute_trade(request);

    EXPECT_EQ(result.status, TradeStatus::Failed);
    EXPECT_EQ(result.attempts, 3);
    EXPECT_EQ(source_a->calls(), 3);
    ASSERT_TRUE(result.rejection_reason.has_value());
    EXPECT_EQ(result.rejection_reason->rfind("retries exhausted after 3 attempts", 0), 0u);
    EXPECT_EQ(events->count(TradeEventType::RetryScheduled), 2u);
    EXPECT_EQ(chain->sends(), 0u);
}

TEST_F(RetryCoordinatorTest, BackoffGrowsExponentially)
{
    source_b->with_error(SourceErrorKind::Unavailable);

    coordinator().execute_trade(request);

    // 200 ms after the first failure, 400 ms after the second
    EXPECT_EQ(clock->slept_ms(), 600);
}

TEST_F(RetryCoordinatorTest, BackoffDelayIsCapped)
{
    RetryCoordinator c = coordinator();

    EXPECT_EQ(c.backoff_delay(1), 200ms);
    EXPECT_EQ(c.backoff_delay(2), 400ms);
    EXPECT_EQ(c.backoff_delay(10), 2000ms);
}

TEST_F(RetryCoordinatorTest, InconsistentPricesAreNotRetried)
{
    auto far = std::make_shared<FakePriceSource>("far", 110.0, clock);
    source_b = far;

    TradeResult result = coordinator().execute_trade(request);

    EXPECT_EQ(result.status, TradeStatus::Rejected);
    EXPECT_EQ(result.attempts, 1);
    EXPECT_EQ(router->calls, 0);
}

TEST_F(RetryCoordinatorTest, GateRejectionIsNotRetried)
{
    wallet->set_balance(0.1);

    TradeResult result = coordinator().execute_trade(request);

    EXPECT_EQ(result.status, TradeStatus::Rejected);
    EXPECT_EQ(result.attempts, 1);
    EXPECT_EQ(chain->sends(), 0u);
    EXPECT_EQ(events->count(TradeEventType::GateRejected), 1u);
    EXPECT_EQ(events->count(TradeEventType::TradeFailed), 1u);
}

TEST_F(RetryCoordinatorTest, QuoteExpiredAtGateIsReportedAsExpiry)
{
    // Balance read slow enough for the 500 ms quote to lapse before the gate
    class SlowBalanceWallet : public FakeWallet {
    public:
        explicit SlowBalanceWallet(std::shared_ptr<ManualClock> clock) : clock_(std::move(clock)) {}

        double get_balance(const std::string& token) override {
            clock_->advance(600ms);
            return FakeWallet::get_balance(token);
        }

    private:
        std::shared_ptr<ManualClock> clock_;
    };
    wallet = std::make_shared<SlowBalanceWallet>(clock);

    TradeResult result = coordinator().execute_trade(request);

    EXPECT_EQ(result.status, TradeStatus::Rejected);
    EXPECT_EQ(result.attempts, 1);
    EXPECT_EQ(chain->sends(), 0u);
    EXPECT_EQ(events->count(TradeEventType::GateRejected), 1u);
    EXPECT_EQ(events->count(TradeEventType::QuoteExpired), 1u);
}

TEST_F(RetryCoordinatorTest, SettlementSlippageIsFailedWithoutRetry)
{
    chain->settlement = settled(100.2 * 0.98);

    TradeResult result = coordinator().execute_trade(request);

    EXPECT_EQ(result.status, TradeStatus::Failed);
    EXPECT_EQ(result.attempts, 1);
    EXPECT_EQ(result.rejection_reason, std::optional<std::string>("slippage exceeded at settlement"));
    EXPECT_EQ(chain->sends(), 1u);
}

TEST_F(RetryCoordinatorTest, ForeignWalletIsRejected)
{
    request.requester_wallet = "9WzDXwBbmkg8ZTbNMqUxvQRAyrZzDsGYdLVL9zYtAWWM";

    TradeResult result = coordinator().execute_trade(request);

    EXPECT_EQ(result.status, TradeStatus::Rejected);
    EXPECT_EQ(result.attempts, 0);
    EXPECT_EQ(source_a->calls(), 0);
    EXPECT_EQ(breaker->consecutive_failures(), 0);
}

// ============================================================================
// Broadcast safety
// ============================================================================

TEST_F(RetryCoordinatorTest, UnresolvedBroadcastIsNotResent)
{
    chain->default_status = {SignatureState::Pending, ""};

    TradeResult result = coordinator().execute_trade(request);

    EXPECT_EQ(result.status, TradeStatus::Failed);
    EXPECT_EQ(chain->sends(), 1u);
    ASSERT_TRUE(result.tx_signature.has_value());
    EXPECT_EQ(*result.tx_signature, chain->sent()[0]);
    EXPECT_NE(result.rejection_reason->find("may land"), std::string::npos);
}

TEST_F(RetryCoordinatorTest, DroppedBroadcastIsRetriedWithFreshQuote)
{
    first_signature_resolves(clock->now() + 1100ms, SignatureState::NotFound);
    chain->block_height = builder->last_valid_block_height + 1;

    TradeResult result = coordinator().execute_trade(request);

    EXPECT_EQ(result.status, TradeStatus::Executed);
    EXPECT_EQ(result.attempts, 2);
    EXPECT_EQ(router->calls, 2);
    auto sent = chain->sent();
    ASSERT_EQ(sent.size(), 2u);
    EXPECT_NE(sent[0], sent[1]);
    EXPECT_EQ(*result.tx_signature, sent[1]);
}

TEST_F(RetryCoordinatorTest, UnseenBroadcastWithLiveBlockhashIsNotResent)
{
    first_signature_resolves(clock->now() + 1100ms, SignatureState::NotFound);
    chain->block_height = builder->last_valid_block_height;

    TradeResult result = coordinator().execute_trade(request);

    EXPECT_EQ(result.status, TradeStatus::Failed);
    EXPECT_EQ(chain->sends(), 1u);
    EXPECT_EQ(router->calls, 1);
    ASSERT_TRUE(result.tx_signature.has_value());
    EXPECT_EQ(*result.tx_signature, chain->sent()[0]);
    EXPECT_NE(result.rejection_reason->find("may land"), std::string::npos);
}

TEST_F(RetryCoordinatorTest, LateLandingBroadcastCompletesTheTrade)
{
    first_signature_resolves(clock->now() + 1100ms, SignatureState::Confirmed);

    TradeResult result = coordinator().execute_trade(request);

    EXPECT_EQ(result.status, TradeStatus::Executed);
    EXPECT_EQ(chain->sends(), 1u);
    EXPECT_EQ(*result.tx_signature, chain->sent()[0]);
    EXPECT_EQ(router->calls, 1);
}

TEST_F(RetryCoordinatorTest, SubmissionFailureIsReconciledBeforeResending)
{
    chain->send_error = ExecutionErrorKind::SubmissionFailed;
    chain->fail_sends_once = true;
    first_signature_resolves(clock->now(), SignatureState::NotFound);
    chain->block_height = builder->last_valid_block_height + 1;

    TradeResult result = coordinator().execute_trade(request);

    EXPECT_EQ(result.status, TradeStatus::Executed);
    EXPECT_EQ(result.attempts, 2);
    EXPECT_EQ(chain->sends(), 2u);
}

// ============================================================================
// Wallet serialization
// ============================================================================

TEST_F(RetryCoordinatorTest, SameWalletTradesNeverOverlapOnChain)
{
    std::atomic<int> open{0};
    std::atomic<int> max_open{0};
    std::atomic<bool> announced{false};
    std::promise<void> first_sent;
    auto first_sent_future = first_sent.get_future();

    chain->on_send = [&](const std::string&) {
        int now_open = ++open;
        int seen = max_open.load();
        while (now_open > seen && !max_open.compare_exchange_weak(seen, now_open)) {
        }
        if (!announced.exchange(true)) {
            first_sent.set_value();
        }
    };

    // Each signature stays pending for three polls, long enough for a quote
    // built before the wait to expire
    std::mutex polls_mutex;
    std::map<std::string, int> polls;
    chain->status_for = [&](const std::string& signature) {
        int n;
        {
            std::lock_guard<std::mutex> lock(polls_mutex);
            n = ++polls[signature];
        }
        if (n < 4) {
            std::this_thread::sleep_for(20ms);
            return SignatureStatus{SignatureState::Pending, ""};
        }
        if (n == 4) {
            --open;
        }
        return SignatureStatus{SignatureState::Confirmed, ""};
    };

    RetryCoordinator c = coordinator();
    TradeRequest second = request;
    second.request_id = "req-2";

    auto first = std::async(std::launch::async, [&c, this]() { return c.execute_trade(request); });
    ASSERT_EQ(first_sent_future.wait_for(5s), std::future_status::ready);

    TradeResult second_result = c.execute_trade(second);
    TradeResult first_result = first.get();

    EXPECT_EQ(first_result.status, TradeStatus::Executed);
    EXPECT_EQ(second_result.status, TradeStatus::Executed);
    EXPECT_EQ(chain->sends(), 2u);
    EXPECT_EQ(max_open.load(), 1);
    EXPECT_EQ(breaker->consecutive_failures(), 0);
}

TEST_F(RetryCoordinatorTest, CancelledWhileWaitingForWallet)
{
    auto held = wallet_locks->acquire(kWalletKey);
    RetryCoordinator c = coordinator();

    auto waiting = std::async(std::launch::async, [&c, this]() {
        return c.execute_trade(request, CancellationToken::with_timeout(100ms));
    });
    TradeResult result = waiting.get();

    EXPECT_EQ(result.status, TradeStatus::Failed);
    EXPECT_EQ(result.attempts, 1);
    EXPECT_EQ(source_a->calls(), 0);
    EXPECT_EQ(chain->sends(), 0u);
    EXPECT_NE(result.rejection_reason->find("wallet lock"), std::string::npos);
}

// ============================================================================
// Circuit breaker
// ============================================================================

TEST_F(RetryCoordinatorTest, CircuitOpensAfterConsecutiveExhaustedTrades)
{
    router->route.reset();
    RetryCoordinator c = coordinator();

    for (int i = 0; i < 3; ++i) {
        EXPECT_EQ(c.execute_trade(request).status, TradeStatus::Rejected);
    }
    int router_calls = router->calls;

    try {
        c.execute_trade(request);
        FAIL() << "expected ExecutionError";
    } catch (const ExecutionError& e) {
        EXPECT_EQ(e.kind(), ExecutionErrorKind::CircuitOpen);
    }
    EXPECT_EQ(router->calls, router_calls);
    EXPECT_EQ(chain->sends(), 0u);
    EXPECT_EQ(builder->builds, 0);
    EXPECT_EQ(events->count(TradeEventType::CircuitOpened), 1u);
}

TEST_F(RetryCoordinatorTest, OpenCircuitRejectsEveryCallUntilCooldown)
{
    router->route.reset();
    RetryCoordinator c = coordinator();
    for (int i = 0; i < 3; ++i) {
        c.execute_trade(request);
    }

    EXPECT_THROW(c.execute_trade(request), ExecutionError);
    EXPECT_THROW(c.execute_trade(request), ExecutionError);
    EXPECT_EQ(c.breaker().state(), CircuitState::Open);
}

TEST_F(RetryCoordinatorTest, SuccessfulTrialClosesCircuit)
{
    router->route.reset();
    RetryCoordinator c = coordinator();
    for (int i = 0; i < 3; ++i) {
        c.execute_trade(request);
    }

    clock->advance(std::chrono::milliseconds(retry_config.circuit_cooldown_ms));
    router->returns(1000000000, 100200000);

    EXPECT_EQ(c.execute_trade(request).status, TradeStatus::Executed);
    EXPECT_EQ(c.breaker().state(), CircuitState::Closed);
    EXPECT_EQ(c.breaker().consecutive_failures(), 0);
}

TEST_F(RetryCoordinatorTest, SuccessResetsFailureCount)
{
    router->route.reset();
    RetryCoordinator c = coordinator();
    c.execute_trade(request);
    c.execute_trade(request);

    router->returns(1000000000, 100200000);
    c.execute_trade(request);

    router->route.reset();
    c.execute_trade(request);
    c.execute_trade(request);

    EXPECT_EQ(c.breaker().state(), CircuitState::Closed);
    EXPECT_EQ(c.breaker().consecutive_failures(), 2);
}

#include <gtest/gtest.h>

#include "backoff_manager.hpp"
#include "config.hpp"
#include "fakes.hpp"
#include "rate_limiter.hpp"
#include "solana_tx.hpp"
#include "token_registry.hpp"
#include "types.hpp"
#include "util.hpp"
#include "wallet_lock.hpp"
#include <cstdlib>

using namespace testing_fakes;
using namespace std::chrono_literals;

// ============================================================================
// util
// ============================================================================

TEST(UtilTest, SplitStringTrimsAndDropsEmpty)
{
    auto parts = util::split_string(" https://a , ,https://b,", ',');

    ASSERT_EQ(parts.size(), 2u);
    EXPECT_EQ(parts[0], "https://a");
    EXPECT_EQ(parts[1], "https://b");
}

TEST(UtilTest, ParseUrl)
{
    auto parts = util::parse_url("wss://public-api.birdeye.so/socket/solana");
    EXPECT_EQ(parts.scheme, "wss");
    EXPECT_EQ(parts.host, "public-api.birdeye.so");
    EXPECT_EQ(parts.port, 443);
    EXPECT_EQ(parts.path, "/socket/solana");

    auto local = util::parse_url("http://127.0.0.1:8899");
    EXPECT_EQ(local.scheme, "http");
    EXPECT_EQ(local.port, 8899);

    EXPECT_THROW(util::parse_url("ftp://example.com"), std::runtime_error);
}

TEST(UtilTest, Base58KeepsLeadingZeros)
{
    std::vector<uint8_t> bytes = {0, 0, 1, 2, 3, 255};
    std::string encoded = util::base58_encode(bytes);

    EXPECT_EQ(encoded.substr(0, 2), "11");
    EXPECT_EQ(util::base58_decode(encoded), bytes);
}

TEST(UtilTest, Base58KnownVector)
{
    std::vector<uint8_t> wrapped_sol(32, 0);
    wrapped_sol = util::base58_decode(kSol);
    ASSERT_EQ(wrapped_sol.size(), 32u);
    EXPECT_EQ(util::base58_encode(wrapped_sol), kSol);
}

TEST(UtilTest, Base64Decode)
{
    std::vector<uint8_t> expected = {'s', 'w', 'a', 'p'};
    EXPECT_EQ(util::base64_decode("c3dhcA=="), expected);
    EXPECT_EQ(util::base64_encode(expected), "c3dhcA==");
}

TEST(UtilTest, RawAmountConversion)
{
    EXPECT_EQ(util::to_raw_amount(1.5, 9), 1500000000u);
    EXPECT_EQ(util::to_raw_amount(0.1, 6), 100000u);
    EXPECT_EQ(util::to_raw_amount(0.0, 6), 0u);
    EXPECT_EQ(util::to_raw_amount(0.0000001, 6), 0u);
    EXPECT_DOUBLE_EQ(util::from_raw_amount(2500000, 6), 2.5);
}

TEST(UtilTest, TransientHttpStatuses)
{
    EXPECT_TRUE(util::is_transient_http_status(0));
    EXPECT_TRUE(util::is_transient_http_status(503));
    EXPECT_FALSE(util::is_transient_http_status(400));
    EXPECT_FALSE(util::is_transient_http_status(200));
}

TEST(UtilTest, SolanaAddressShape)
{
    EXPECT_TRUE(util::is_valid_solana_address(kUsdc));
    EXPECT_FALSE(util::is_valid_solana_address("short"));
    EXPECT_FALSE(util::is_valid_solana_address("0OIl0OIl0OIl0OIl0OIl0OIl0OIl0OIl"));
}

// ============================================================================
// Transaction layout
// ============================================================================

TEST(SolanaTxTest, CompactU16)
{
    std::vector<uint8_t> bytes = {0x05, 0x80, 0x01, 0xff, 0xff, 0x03};
    size_t offset = 0;

    EXPECT_EQ(solana_tx::read_compact_u16(bytes, offset), 5);
    EXPECT_EQ(offset, 1u);
    EXPECT_EQ(solana_tx::read_compact_u16(bytes, offset), 128);
    EXPECT_EQ(offset, 3u);
    EXPECT_EQ(solana_tx::read_compact_u16(bytes, offset), 0xffff);
    EXPECT_EQ(offset, 6u);

    std::vector<uint8_t> truncated = {0x80};
    offset = 0;
    EXPECT_THROW(solana_tx::read_compact_u16(truncated, offset), std::runtime_error);
}

TEST(SolanaTxTest, FeePayerOfLegacyAndVersionedMessages)
{
    std::vector<uint8_t> payer = util::base58_decode(kWalletKey);
    ASSERT_EQ(payer.size(), solana_tx::kPublicKeySize);

    std::vector<uint8_t> legacy = {1};
    legacy.insert(legacy.end(), solana_tx::kSignatureSize, 0);
    legacy.insert(legacy.end(), {1, 0, 1, 2});
    legacy.insert(legacy.end(), payer.begin(), payer.end());
    legacy.insert(legacy.end(), solana_tx::kPublicKeySize, 7);
    EXPECT_EQ(solana_tx::fee_payer(legacy), kWalletKey);

    std::vector<uint8_t> versioned = {1};
    versioned.insert(versioned.end(), solana_tx::kSignatureSize, 0);
    versioned.insert(versioned.end(), {0x80, 1, 0, 1, 1});
    versioned.insert(versioned.end(), payer.begin(), payer.end());
    EXPECT_EQ(solana_tx::fee_payer(versioned), kWalletKey);
}

TEST(SolanaTxTest, FirstSignatureIsTransactionId)
{
    FakeSwapBuilder builder;
    FakeWallet wallet;
    auto signed_tx = wallet.sign(builder.build_swap_transaction(SwapQuote{}, kWalletKey).bytes);

    std::vector<uint8_t> expected(signed_tx.begin() + 1, signed_tx.begin() + 1 + solana_tx::kSignatureSize);
    EXPECT_EQ(solana_tx::first_signature(signed_tx), util::base58_encode(expected));
}

TEST(SolanaTxTest, RejectsTransactionWithoutSignatureSlots)
{
    std::vector<uint8_t> tx = {0, 1, 0, 1};
    EXPECT_THROW(solana_tx::parse_layout(tx), std::runtime_error);
}

// ============================================================================
// Backoff
// ============================================================================

TEST(BackoffManagerTest, ComputeDelayDoublesAndCaps)
{
    using util_ms = std::chrono::milliseconds;
    EXPECT_EQ(BackoffManager::compute_delay(100ms, 1000ms, 2.0, 0, 0.0), util_ms(0));
    EXPECT_EQ(BackoffManager::compute_delay(100ms, 1000ms, 2.0, 1, 0.0), util_ms(100));
    EXPECT_EQ(BackoffManager::compute_delay(100ms, 1000ms, 2.0, 3, 0.0), util_ms(400));
    EXPECT_EQ(BackoffManager::compute_delay(100ms, 1000ms, 2.0, 8, 0.0), util_ms(1000));
}

TEST(BackoffManagerTest, JitterStaysInBand)
{
    for (int i = 0; i < 50; ++i) {
        auto delay = BackoffManager::compute_delay(1000ms, 30000ms, 2.0, 1, 0.1);
        EXPECT_GE(delay.count(), 900);
        EXPECT_LE(delay.count(), 1100);
    }
}

TEST(BackoffManagerTest, TracksEndpointsSeparately)
{
    BackoffManager backoff(100ms, 1000ms, 2.0, 0.0);

    backoff.record_failure("a");
    backoff.record_failure("a");
    backoff.record_failure("b");

    EXPECT_EQ(backoff.failure_count("a"), 2);
    EXPECT_EQ(backoff.get_delay("a"), 200ms);
    EXPECT_EQ(backoff.get_delay("b"), 100ms);
    EXPECT_TRUE(backoff.should_wait("a"));

    backoff.record_success("a");
    EXPECT_EQ(backoff.failure_count("a"), 0);
    EXPECT_FALSE(backoff.should_wait("a"));
}

// ============================================================================
// Rate limiter, wallet locks, token registry
// ============================================================================

TEST(RateLimiterTest, BurstThenDenied)
{
    RateLimiter limiter(1, 3);

    EXPECT_TRUE(limiter.try_acquire("jupiter"));
    EXPECT_TRUE(limiter.try_acquire("jupiter"));
    EXPECT_TRUE(limiter.try_acquire("jupiter"));
    EXPECT_FALSE(limiter.try_acquire("jupiter"));
    EXPECT_TRUE(limiter.try_acquire("coingecko"));
}

TEST(RateLimiterTest, WaitsOnlyWhenRefillBeatsDeadline)
{
    RateLimiter limiter(20, 1);
    ASSERT_TRUE(limiter.try_acquire("jupiter@quote-api"));

    auto now = std::chrono::steady_clock::now();
    EXPECT_FALSE(limiter.acquire_before("jupiter@quote-api", now + std::chrono::milliseconds(5)));
    EXPECT_TRUE(limiter.acquire_before("jupiter@quote-api", now + std::chrono::milliseconds(500)));
}

TEST(RateLimiterTest, RejectsNonPositiveLimits)
{
    EXPECT_THROW(RateLimiter(0, 5), std::invalid_argument);
}

TEST(WalletLockTest, SerializesPerWallet)
{
    WalletLockRegistry locks;
    std::atomic<int> inside{0};
    std::atomic<int> max_inside{0};

    std::vector<std::thread> threads;
    for (int i = 0; i < 4; ++i) {
        threads.emplace_back([&]() {
            auto lock = locks.acquire(kWalletKey);
            int now_inside = ++inside;
            int seen = max_inside.load();
            while (now_inside > seen && !max_inside.compare_exchange_weak(seen, now_inside)) {
            }
            std::this_thread::sleep_for(5ms);
            --inside;
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(max_inside.load(), 1);
    EXPECT_EQ(locks.wallet_count(), 1u);
}

TEST(WalletLockTest, DifferentWalletsDoNotBlock)
{
    WalletLockRegistry locks;
    auto first = locks.acquire("wallet-a");
    auto second = locks.acquire("wallet-b");

    EXPECT_TRUE(first.owns_lock());
    EXPECT_TRUE(second.owns_lock());
    EXPECT_EQ(locks.wallet_count(), 2u);
}

TEST(WalletLockTest, CancelledWaitGivesUp)
{
    WalletLockRegistry locks;
    auto held = locks.acquire(kWalletKey);

    bool cancelled = false;
    std::thread waiter([&]() {
        try {
            locks.acquire(kWalletKey, CancellationToken::with_timeout(100ms));
        } catch (const OperationCancelled&) {
            cancelled = true;
        }
    });
    waiter.join();

    EXPECT_TRUE(cancelled);
    EXPECT_TRUE(held.owns_lock());
}

TEST(WalletLockTest, FreeWalletIsTakenDespiteDeadline)
{
    WalletLockRegistry locks;
    auto lock = locks.acquire(kWalletKey, CancellationToken::with_timeout(1000ms));

    EXPECT_TRUE(lock.owns_lock());
}

TEST(TokenRegistryTest, KnownAndExtraTokens)
{
    TokenRegistry tokens;
    EXPECT_EQ(tokens.decimals(kSol), 9);
    EXPECT_EQ(tokens.decimals(kUsdc), 6);
    EXPECT_FALSE(tokens.find("UnknownMint1111111111111111111111111111111").has_value());

    tokens.add_from_entries({"HZ1JovNiVvGrGNiiYvEozEVgZ58xaU3RKwX8eACQBCt3:6:PYTH"});
    EXPECT_EQ(tokens.symbol("HZ1JovNiVvGrGNiiYvEozEVgZ58xaU3RKwX8eACQBCt3"), "PYTH");

    EXPECT_THROW(tokens.add_from_entries({"bad"}), std::runtime_error);
    EXPECT_THROW(tokens.decimals("UnknownMint1111111111111111111111111111111"), std::runtime_error);
}

// ============================================================================
// Request and result payloads
// ============================================================================

TEST(TradeRequestTest, ParsesStreamPayload)
{
    auto request = TradeRequest::from_json({
        {"request_id", "r-42"},
        {"wallet", kWalletKey},
        {"input_mint", kSol},
        {"output_mint", kUsdc},
        {"amount", 0.5},
        {"max_slippage_pct", 0.8},
        {"min_profit", -0.2},
        {"timeout_ms", 3000}
    });

    ASSERT_TRUE(request.has_value());
    EXPECT_EQ(request->request_id, "r-42");
    EXPECT_DOUBLE_EQ(request->amount, 0.5);
    EXPECT_DOUBLE_EQ(request->max_slippage_pct, 0.8);
    EXPECT_DOUBLE_EQ(request->min_profit_threshold, -0.2);
    EXPECT_EQ(request->timeout_ms, 3000);
}

TEST(TradeRequestTest, RejectsInvalidPayloads)
{
    nlohmann::json base = {{"wallet", kWalletKey}, {"input_mint", kSol}, {"output_mint", kUsdc}, {"amount", 1.0}};

    auto missing = base;
    missing.erase("amount");
    EXPECT_FALSE(TradeRequest::from_json(missing).has_value());

    auto negative = base;
    negative["amount"] = -1.0;
    EXPECT_FALSE(TradeRequest::from_json(negative).has_value());

    auto same = base;
    same["output_mint"] = kSol;
    EXPECT_FALSE(TradeRequest::from_json(same).has_value());

    auto generated = TradeRequest::from_json(base);
    ASSERT_TRUE(generated.has_value());
    EXPECT_FALSE(generated->request_id.empty());
}

TEST(TradeResultTest, OptionalFieldsSerializeAsNull)
{
    TradeResult result;
    result.request_id = "r-1";
    result.status = TradeStatus::Rejected;
    result.rejection_reason = "quote expired";
    result.attempts = 1;

    auto j = result.to_json();
    EXPECT_EQ(j["status"], "rejected");
    EXPECT_TRUE(j["tx_signature"].is_null());
    EXPECT_TRUE(j["actual_output_amount"].is_null());
    EXPECT_EQ(j["rejection_reason"], "quote expired");
}

TEST(ConsensusPriceTest, PriceForEitherDirection)
{
    ConsensusPrice price;
    price.token_pair = {kSol, kUsdc};
    price.price = 200.0;

    EXPECT_DOUBLE_EQ(price.price_for(kSol, kUsdc), 200.0);
    EXPECT_DOUBLE_EQ(price.price_for(kUsdc, kSol), 0.005);
    EXPECT_THROW(price.price_for(kSol, kWalletKey), std::invalid_argument);
}

// ============================================================================
// Configuration
// ============================================================================

TEST(ConfigTest, NormalModeWidensFreshnessWindow)
{
    setenv("WALLET_KEYPAIR_PATH", "/tmp/id.json", 1);
    setenv("TRADE_MODE", "normal", 1);
    unsetenv("MAX_PRICE_AGE_MS");

    Config config = Config::from_env();
    EXPECT_EQ(config.validator.max_price_age_ms, 1000);
    EXPECT_NO_THROW(config.validate());

    setenv("TRADE_MODE", "hft", 1);
    EXPECT_EQ(Config::from_env().validator.max_price_age_ms, 50);
    unsetenv("TRADE_MODE");
}

TEST(ConfigTest, ValidateRejectsOutOfRangeValues)
{
    Config config;
    config.quote.quote_validity_ms = 2000;
    EXPECT_THROW(config.validate(), std::runtime_error);

    config = Config();
    config.validator.max_price_age_ms = 5000;
    EXPECT_THROW(config.validate(), std::runtime_error);

    config = Config();
    config.trade_mode = "turbo";
    EXPECT_THROW(config.validate(), std::runtime_error);
}

TEST(ConfigTest, RequiresKeypairPath)
{
    unsetenv("WALLET_KEYPAIR_PATH");
    EXPECT_THROW(Config::from_env(), std::runtime_error);
}

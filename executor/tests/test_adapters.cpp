#include <gtest/gtest.h>

#include "birdeye_stream_source.hpp"
#include "errors.hpp"
#include "fakes.hpp"
#include "jupiter_router.hpp"
#include "keypair_wallet.hpp"
#include "solana_client.hpp"
#include "util.hpp"
#include <openssl/evp.h>
#include <thread>

using namespace testing_fakes;
using namespace std::chrono_literals;

// ============================================================================
// Jupiter quote parsing
// ============================================================================

TEST(JupiterRouteTest, ParsesQuoteResponse)
{
    auto body = nlohmann::json::parse(R"({
        "inputMint": "So11111111111111111111111111111111111111112",
        "inAmount": "1000000000",
        "outputMint": "EPjFWdd5AufqSSqeM2qN1xzybapC8G4wEGGkZwyTDt1v",
        "outAmount": "150250000",
        "priceImpactPct": "0.0012",
        "routePlan": [
            {"swapInfo": {"ammKey": "a", "feeAmount": "25000", "feeMint": "So11111111111111111111111111111111111111112"}},
            {"swapInfo": {"ammKey": "b", "feeAmount": "300", "feeMint": "EPjFWdd5AufqSSqeM2qN1xzybapC8G4wEGGkZwyTDt1v"}}
        ]
    })");

    Route route = JupiterRouter::parse_route(body, "jupiter@lite-api.jup.ag");

    EXPECT_EQ(route.provider, "jupiter@lite-api.jup.ag");
    EXPECT_EQ(route.in_amount_raw, 1000000000u);
    EXPECT_EQ(route.out_amount_raw, 150250000u);
    EXPECT_NEAR(route.price_impact_pct, 0.12, 1e-9);
    EXPECT_EQ(route.hops, 2);
    ASSERT_EQ(route.fees.size(), 2u);
    EXPECT_EQ(route.fees[0].mint, kSol);
    EXPECT_EQ(route.fees[0].amount_raw, 25000u);
    EXPECT_EQ(route.payload, body);
}

TEST(JupiterRouteTest, MalformedQuoteIsProviderError)
{
    auto body = nlohmann::json::parse(R"({"inAmount": "1000", "outAmount": "not-a-number"})");

    try {
        JupiterRouter::parse_route(body, "jupiter");
        FAIL() << "expected QuoteError";
    } catch (const QuoteError& e) {
        EXPECT_EQ(e.kind(), QuoteErrorKind::ProviderError);
    }
}

TEST(JupiterSwapTest, KeepsBlockhashExpiry)
{
    std::vector<uint8_t> bytes = {1, 2, 3, 4, 5};
    nlohmann::json body = {
        {"swapTransaction", util::base64_encode(bytes)},
        {"lastValidBlockHeight", 279632475}
    };

    SwapTransaction tx = JupiterRouter::parse_swap_response(body, "jupiter");

    EXPECT_EQ(tx.bytes, bytes);
    EXPECT_EQ(tx.last_valid_block_height, 279632475u);
}

TEST(JupiterSwapTest, MissingTransactionIsSubmissionFailure)
{
    nlohmann::json body = {{"lastValidBlockHeight", 279632475}};

    try {
        JupiterRouter::parse_swap_response(body, "jupiter");
        FAIL() << "expected ExecutionError";
    } catch (const ExecutionError& e) {
        EXPECT_EQ(e.kind(), ExecutionErrorKind::SubmissionFailed);
    }
}

// ============================================================================
// Settlement parsing
// ============================================================================

TEST(SolanaSettlementTest, TokenOutputIsOwnerBalanceDelta)
{
    auto tx = nlohmann::json::parse(R"({
        "meta": {
            "err": null,
            "fee": 10000,
            "preTokenBalances": [
                {"owner": "7xKXtg2CW87d97TXJSDpbD5jBkheTqA83TZRuJosgAsU", "mint": "EPjFWdd5AufqSSqeM2qN1xzybapC8G4wEGGkZwyTDt1v",
                 "uiTokenAmount": {"amount": "5000000", "decimals": 6}},
                {"owner": "pool", "mint": "EPjFWdd5AufqSSqeM2qN1xzybapC8G4wEGGkZwyTDt1v",
                 "uiTokenAmount": {"amount": "900000000", "decimals": 6}}
            ],
            "postTokenBalances": [
                {"owner": "7xKXtg2CW87d97TXJSDpbD5jBkheTqA83TZRuJosgAsU", "mint": "EPjFWdd5AufqSSqeM2qN1xzybapC8G4wEGGkZwyTDt1v",
                 "uiTokenAmount": {"amount": "155250000", "decimals": 6}},
                {"owner": "pool", "mint": "EPjFWdd5AufqSSqeM2qN1xzybapC8G4wEGGkZwyTDt1v",
                 "uiTokenAmount": {"amount": "749750000", "decimals": 6}}
            ]
        },
        "transaction": {"message": {"accountKeys": ["7xKXtg2CW87d97TXJSDpbD5jBkheTqA83TZRuJosgAsU"]}}
    })");

    Settlement settlement = SolanaClient::parse_settlement(tx, kWalletKey, kUsdc);

    EXPECT_FALSE(settlement.failed);
    EXPECT_DOUBLE_EQ(settlement.output_amount, 150.25);
    EXPECT_DOUBLE_EQ(settlement.fee_paid, 0.00001);
}

TEST(SolanaSettlementTest, NativeOutputAddsBackFeeForPayer)
{
    auto tx = nlohmann::json::parse(R"({
        "meta": {
            "err": null,
            "fee": 5000,
            "preBalances": [1000000000, 50],
            "postBalances": [1499995000, 50]
        },
        "transaction": {"message": {"accountKeys": [
            {"pubkey": "7xKXtg2CW87d97TXJSDpbD5jBkheTqA83TZRuJosgAsU", "signer": true},
            {"pubkey": "other", "signer": false}
        ]}}
    })");

    Settlement settlement = SolanaClient::parse_settlement(tx, kWalletKey, kSol);

    EXPECT_DOUBLE_EQ(settlement.output_amount, 0.5);
    EXPECT_DOUBLE_EQ(settlement.fee_paid, 0.000005);
}

TEST(SolanaSettlementTest, ErrorMarksSettlementFailed)
{
    auto tx = nlohmann::json::parse(R"({
        "meta": {"err": {"InstructionError": [2, {"Custom": 6001}]}, "fee": 5000},
        "transaction": {"message": {"accountKeys": []}}
    })");

    Settlement settlement = SolanaClient::parse_settlement(tx, kWalletKey, kUsdc);

    EXPECT_TRUE(settlement.failed);
    EXPECT_NE(settlement.error.find("6001"), std::string::npos);
    EXPECT_DOUBLE_EQ(settlement.output_amount, 0.0);
}

// ============================================================================
// Birdeye stream
// ============================================================================

namespace {

std::string price_frame(const std::string& address, double price) {
    nlohmann::json frame = {
        {"type", "PRICE_DATA"},
        {"data", {{"address", address}, {"c", price}, {"unixTime", 1700000000}}}
    };
    return frame.dump();
}

} // namespace

TEST(BirdeyeStreamTest, DerivesPairPriceFromFreshTicks)
{
    auto clock = std::make_shared<ManualClock>();
    BirdeyeStreamSource source("wss://public-api.birdeye.so/socket/solana", "key", clock);

    std::thread feeder([&source]() {
        std::this_thread::sleep_for(30ms);
        source.handle_message(price_frame(kSol, 150.0));
        source.handle_message(price_frame(kUsdc, 1.0));
    });

    PriceQuote quote = source.fetch_price({kSol, kUsdc}, std::chrono::steady_clock::now() + 2s);
    feeder.join();

    EXPECT_EQ(quote.source_id, "birdeye_ws");
    EXPECT_DOUBLE_EQ(quote.price, 150.0);
    EXPECT_EQ(quote.token_pair, (TokenPair{kSol, kUsdc}));
    EXPECT_EQ(quote.observed_at, clock->now());
}

TEST(BirdeyeStreamTest, TicksFromBeforeTheCallAreNotReused)
{
    BirdeyeStreamSource source("wss://public-api.birdeye.so/socket/solana", "key",
                               std::make_shared<ManualClock>());
    source.handle_message(price_frame(kSol, 150.0));
    source.handle_message(price_frame(kUsdc, 1.0));

    try {
        source.fetch_price({kSol, kUsdc}, std::chrono::steady_clock::now() + 100ms);
        FAIL() << "expected SourceError";
    } catch (const SourceError& e) {
        EXPECT_EQ(e.kind(), SourceErrorKind::Timeout);
    }
}

TEST(BirdeyeStreamTest, IgnoresMalformedFrames)
{
    BirdeyeStreamSource source("wss://public-api.birdeye.so/socket/solana", "key",
                               std::make_shared<ManualClock>());

    std::thread feeder([&source]() {
        std::this_thread::sleep_for(20ms);
        source.handle_message("not json");
        source.handle_message(R"({"type":"PRICE_DATA","data":{"address":"So11111111111111111111111111111111111111112","c":-3}})");
        source.handle_message(R"({"type":"WELCOME"})");
        source.handle_message(price_frame(kUsdc, 1.0));
    });

    EXPECT_THROW(source.fetch_price({kSol, kUsdc}, std::chrono::steady_clock::now() + 150ms), SourceError);
    feeder.join();
    EXPECT_FALSE(source.is_connected());
}

TEST(BirdeyeStreamTest, StopInterruptsReconnectWait)
{
    // Nothing listens on port 1, so the worker lands in its reconnect backoff
    BirdeyeStreamSource source("wss://127.0.0.1:1/socket/solana", "key", std::make_shared<ManualClock>());
    source.start();
    std::this_thread::sleep_for(200ms);

    auto begin = std::chrono::steady_clock::now();
    source.stop();
    auto took = std::chrono::steady_clock::now() - begin;

    EXPECT_LT(took, 800ms);
    EXPECT_FALSE(source.is_connected());
}

// ============================================================================
// Keypair wallet
// ============================================================================

namespace {

std::vector<uint8_t> make_keypair() {
    std::vector<uint8_t> keypair(64);
    for (int i = 0; i < 32; ++i) {
        keypair[i] = static_cast<uint8_t>(i + 1);
    }
    EVP_PKEY* key = EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr, keypair.data(), 32);
    size_t length = 32;
    EVP_PKEY_get_raw_public_key(key, keypair.data() + 32, &length);
    EVP_PKEY_free(key);
    return keypair;
}

std::vector<uint8_t> unsigned_transfer(const std::vector<uint8_t>& payer) {
    std::vector<uint8_t> tx = {1};
    tx.insert(tx.end(), solana_tx::kSignatureSize, 0);
    tx.insert(tx.end(), {1, 0, 1, 1});
    tx.insert(tx.end(), payer.begin(), payer.end());
    tx.insert(tx.end(), 32, 4);   // recent blockhash
    tx.push_back(0);              // no instructions
    return tx;
}

} // namespace

TEST(KeypairWalletTest, SignsFeePayerSlot)
{
    auto keypair = make_keypair();
    std::vector<uint8_t> public_key(keypair.begin() + 32, keypair.end());
    auto wallet = KeypairWallet::from_bytes(keypair, std::make_shared<FakeChainClient>());

    EXPECT_EQ(wallet->public_key(), util::base58_encode(public_key));

    auto tx = unsigned_transfer(public_key);
    auto signed_tx = wallet->sign(tx);
    ASSERT_EQ(signed_tx.size(), tx.size());

    auto layout = solana_tx::parse_layout(signed_tx);
    std::vector<uint8_t> message(signed_tx.begin() + layout.message_offset, signed_tx.end());
    std::vector<uint8_t> original_message(tx.begin() + layout.message_offset, tx.end());
    EXPECT_EQ(message, original_message);

    EVP_PKEY* verify_key = EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr, public_key.data(), 32);
    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    ASSERT_EQ(EVP_DigestVerifyInit(ctx, nullptr, nullptr, nullptr, verify_key), 1);
    int verified = EVP_DigestVerify(ctx, signed_tx.data() + 1, solana_tx::kSignatureSize,
                                    message.data(), message.size());
    EVP_MD_CTX_free(ctx);
    EVP_PKEY_free(verify_key);

    EXPECT_EQ(verified, 1);
}

TEST(KeypairWalletTest, RefusesForeignFeePayer)
{
    auto wallet = KeypairWallet::from_bytes(make_keypair(), std::make_shared<FakeChainClient>());
    auto tx = unsigned_transfer(util::base58_decode(kWalletKey));

    EXPECT_THROW(wallet->sign(tx), std::runtime_error);
}

TEST(KeypairWalletTest, RejectsMismatchedPublicHalf)
{
    auto keypair = make_keypair();
    keypair[40] ^= 0xff;

    EXPECT_THROW(KeypairWallet::from_bytes(keypair, std::make_shared<FakeChainClient>()), std::runtime_error);
}

TEST(KeypairWalletTest, RejectsMissingFile)
{
    EXPECT_THROW(KeypairWallet("/nonexistent/id.json", std::make_shared<FakeChainClient>()), std::runtime_error);
}

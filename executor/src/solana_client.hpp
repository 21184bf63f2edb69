#pragma once
#include "chain_client.hpp"
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

// JSON-RPC error object returned by the node
class RpcError : public std::runtime_error {
public:
    RpcError(int code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    int code() const { return code_; }

private:
    int code_;
};

struct SolanaClientOptions {
    std::vector<std::string> rpc_urls;
    std::string commitment = "confirmed";
    int64_t connect_timeout_ms = 2000;
    int64_t read_timeout_ms = 5000;
};

// Solana JSON-RPC client. Requests rotate to the next endpoint on transport
// failure; endpoints that failed recently are skipped while backing off.
class SolanaClient : public ChainClient {
public:
    explicit SolanaClient(SolanaClientOptions options);
    ~SolanaClient() override;

    std::string send_transaction(const std::vector<uint8_t>& signed_transaction) override;
    SignatureStatus get_signature_status(const std::string& signature) override;
    std::optional<Settlement> get_settlement(const std::string& signature,
                                             const std::string& owner,
                                             const std::string& output_mint) override;
    uint64_t get_block_height() override;
    double get_balance(const std::string& owner, const std::string& mint) override;
    bool is_healthy() override;

    // Interprets a getTransaction result; exposed for tests
    static Settlement parse_settlement(const nlohmann::json& transaction,
                                       const std::string& owner,
                                       const std::string& output_mint);

    // Non-copyable
    SolanaClient(const SolanaClient&) = delete;
    SolanaClient& operator=(const SolanaClient&) = delete;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};

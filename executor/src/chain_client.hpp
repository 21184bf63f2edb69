#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// NotFound: the queried node has no record of the signature yet. This is not
// proof the transaction was dropped while its blockhash is still valid.
// Pending: seen, but below the configured commitment.
enum class SignatureState { NotFound, Pending, Confirmed, Failed };

struct SignatureStatus {
    SignatureState state = SignatureState::NotFound;
    std::string error;          // set when state == Failed
};

// What a landed transaction did to the owner's output position
struct Settlement {
    bool failed = false;
    std::string error;
    double output_amount = 0.0; // output-token units received by the owner
    double fee_paid = 0.0;      // network fee, SOL
};

class ChainClient {
public:
    virtual ~ChainClient() = default;

    // Broadcasts once. Returns the signature.
    // Throws ExecutionError: OnChainFailure when preflight rejects the
    // transaction, SubmissionFailed on transport errors.
    virtual std::string send_transaction(const std::vector<uint8_t>& signed_transaction) = 0;

    // Throws std::runtime_error when no endpoint answers
    virtual SignatureStatus get_signature_status(const std::string& signature) = 0;

    // std::nullopt while the transaction is not visible at the configured commitment
    virtual std::optional<Settlement> get_settlement(const std::string& signature,
                                                     const std::string& owner,
                                                     const std::string& output_mint) = 0;

    // Finalized block height. Once it passes a transaction's
    // last_valid_block_height that transaction can no longer land.
    // Throws std::runtime_error when no endpoint answers.
    virtual uint64_t get_block_height() = 0;

    // UI units of `mint` held by `owner`; native SOL for the wrapped SOL mint
    virtual double get_balance(const std::string& owner, const std::string& mint) = 0;

    virtual bool is_healthy() = 0;
};

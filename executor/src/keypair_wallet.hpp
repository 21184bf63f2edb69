#pragma once
#include "wallet.hpp"
#include "chain_client.hpp"
#include <memory>
#include <string>

// Ed25519 wallet backed by a solana-keygen JSON keypair file
class KeypairWallet : public Wallet {
public:
    KeypairWallet(const std::string& keypair_path, std::shared_ptr<ChainClient> chain);
    ~KeypairWallet() override;

    // Builds a wallet from the 64 keypair bytes (secret seed then public key)
    static std::unique_ptr<KeypairWallet> from_bytes(const std::vector<uint8_t>& keypair,
                                                     std::shared_ptr<ChainClient> chain);

    std::string public_key() const override;
    std::vector<uint8_t> sign(const std::vector<uint8_t>& unsigned_transaction) override;
    double get_balance(const std::string& mint) override;

    // Non-copyable
    KeypairWallet(const KeypairWallet&) = delete;
    KeypairWallet& operator=(const KeypairWallet&) = delete;

private:
    struct FromBytes {};

public:
    // Reachable only through from_bytes
    KeypairWallet(FromBytes, const std::vector<uint8_t>& keypair, std::shared_ptr<ChainClient> chain);

private:

    class Impl;
    std::unique_ptr<Impl> pImpl_;
};

#pragma once
#include <cstdint>
#include <string>
#include <vector>

// Signing capability handed to the executor. Key material never leaves it.
class Wallet {
public:
    virtual ~Wallet() = default;

    // Base58 public key
    virtual std::string public_key() const = 0;

    // Signs a serialized transaction in place of the fee-payer signature and
    // returns the signed wire bytes
    virtual std::vector<uint8_t> sign(const std::vector<uint8_t>& unsigned_transaction) = 0;

    virtual double get_balance(const std::string& mint) = 0;
};

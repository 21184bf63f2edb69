#pragma once
#include "cancellation.hpp"
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

// One mutex per wallet address so a wallet never has two transactions in
// flight. Locks are created on first use and live as long as the registry.
class WalletLockRegistry {
public:
    using Lock = std::unique_lock<std::timed_mutex>;

    Lock acquire(const std::string& wallet);

    // Waits for the wallet until `cancel` fires, then throws OperationCancelled
    Lock acquire(const std::string& wallet, const CancellationToken& cancel);

    size_t wallet_count() const;

private:
    std::timed_mutex& mutex_for(const std::string& wallet);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::unique_ptr<std::timed_mutex>> locks_;
};

#include "wallet_lock.hpp"
#include "errors.hpp"
#include <chrono>

namespace {
constexpr std::chrono::milliseconds kCancelPollInterval(50);
}

WalletLockRegistry::Lock WalletLockRegistry::acquire(const std::string& wallet) {
    return Lock(mutex_for(wallet));
}

WalletLockRegistry::Lock WalletLockRegistry::acquire(const std::string& wallet, const CancellationToken& cancel) {
    Lock lock(mutex_for(wallet), std::defer_lock);
    while (!lock.try_lock_for(kCancelPollInterval)) {
        if (cancel.is_cancelled()) {
            throw OperationCancelled("waiting for wallet lock");
        }
    }
    return lock;
}

std::timed_mutex& WalletLockRegistry::mutex_for(const std::string& wallet) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& entry = locks_[wallet];
    if (!entry) {
        entry = std::make_unique<std::timed_mutex>();
    }
    return *entry;
}

size_t WalletLockRegistry::wallet_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return locks_.size();
}

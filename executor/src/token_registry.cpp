#include "token_registry.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

TokenRegistry::TokenRegistry() {
    initialize_known_tokens();
}

void TokenRegistry::initialize_known_tokens() {
    // Well-known Solana tokens
    add_token({kNativeSolMint, "SOL", 9});
    add_token({"EPjFWdd5AufqSSqeM2qN1xzybapC8G4wEGGkZwyTDt1v", "USDC", 6});
    add_token({"Es9vMFrzaCERmJfrF4H2FYD4KCoNkY11McCe8BenwNYB", "USDT", 6});
    add_token({"mSoLzYCxHdYgdzU16g5QSh3i5K3z3KZK7ytfqcJm7So", "mSOL", 9});
    add_token({"7dHbWXmci3dT8UFYWYZweBLXgycu7Y3iL6trKn1Y7ARj", "stSOL", 9});
    add_token({"DezXAZ8z7PnrnRJjz3wXBoRgixCa6xjnB7YaB1pPB263", "BONK", 5});
    add_token({"JUPyiwrYJFskUPiHa7hkeR8VUtAeFoSYbKedZNsDvCN", "JUP", 6});
}

void TokenRegistry::add_token(const TokenInfo& info) {
    std::lock_guard<std::mutex> lock(mutex_);
    tokens_[info.mint] = info;
}

void TokenRegistry::add_from_entries(const std::vector<std::string>& entries) {
    for (const auto& entry : entries) {
        auto parts = util::split_string(entry, ':');
        if (parts.size() < 2 || !util::is_valid_solana_address(parts[0])) {
            throw std::runtime_error("Invalid token entry: " + entry);
        }

        TokenInfo info;
        info.mint = parts[0];
        info.decimals = std::stoi(parts[1]);
        info.symbol = parts.size() > 2 ? parts[2] : parts[0].substr(0, 4);
        if (info.decimals < 0 || info.decimals > 18) {
            throw std::runtime_error("Invalid decimals in token entry: " + entry);
        }

        add_token(info);
        spdlog::info("Registered token {} ({} decimals)", info.symbol, info.decimals);
    }
}

std::optional<TokenInfo> TokenRegistry::find(const std::string& mint) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tokens_.find(mint);
    if (it == tokens_.end()) {
        return std::nullopt;
    }
    return it->second;
}

int TokenRegistry::decimals(const std::string& mint) const {
    auto info = find(mint);
    if (!info) {
        throw std::runtime_error("Unknown token mint: " + mint);
    }
    return info->decimals;
}

std::string TokenRegistry::symbol(const std::string& mint) const {
    auto info = find(mint);
    return info ? info->symbol : mint.substr(0, 8);
}

#pragma once
#include <string>
#include <vector>
#include <optional>
#include <unordered_map>
#include <mutex>

struct TokenInfo {
    std::string mint;
    std::string symbol;
    int decimals = 9;
};

// Static token metadata (symbol, decimals). Holds no prices.
class TokenRegistry {
public:
    static constexpr const char* kNativeSolMint = "So11111111111111111111111111111111111111112";

    TokenRegistry();

    void add_token(const TokenInfo& info);
    // Parses "mint:decimals" or "mint:decimals:symbol" entries
    void add_from_entries(const std::vector<std::string>& entries);

    std::optional<TokenInfo> find(const std::string& mint) const;
    // Throws std::runtime_error for unknown mints
    int decimals(const std::string& mint) const;
    std::string symbol(const std::string& mint) const;

    static bool is_native_sol(const std::string& mint) { return mint == kNativeSolMint; }

private:
    void initialize_known_tokens();

    mutable std::mutex mutex_;
    std::unordered_map<std::string, TokenInfo> tokens_;
};

#include "solana_client.hpp"
#include "backoff_manager.hpp"
#include "errors.hpp"
#include "token_registry.hpp"
#include "util.hpp"
#include <httplib.h>
#include <spdlog/spdlog.h>
#include <atomic>
#include <cmath>

namespace {

constexpr double kLamportsPerSol = 1e9;
constexpr int kPreflightFailureCode = -32002;

// Sum of raw token amounts held by owner for mint in a pre/postTokenBalances list
uint64_t owned_token_amount(const nlohmann::json& balances, const std::string& owner,
                            const std::string& mint, int& decimals) {
    uint64_t total = 0;
    if (!balances.is_array()) {
        return total;
    }
    for (const auto& entry : balances) {
        if (entry.value("owner", "") != owner || entry.value("mint", "") != mint) {
            continue;
        }
        const auto& ui = entry.at("uiTokenAmount");
        decimals = ui.value("decimals", decimals);
        total += std::stoull(ui.at("amount").get<std::string>());
    }
    return total;
}

bool meets_commitment(const std::string& observed, const std::string& required) {
    if (required == "processed") {
        return !observed.empty();
    }
    if (required == "confirmed") {
        return observed == "confirmed" || observed == "finalized";
    }
    return observed == "finalized";
}

} // namespace

class SolanaClient::Impl {
public:
    explicit Impl(SolanaClientOptions options)
        : options_(std::move(options)),
          backoff_(std::chrono::milliseconds(500), std::chrono::milliseconds(10000), 2.0, 0.0) {
        if (options_.rpc_urls.empty()) {
            throw std::runtime_error("At least one Solana RPC URL is required");
        }
        for (const auto& url : options_.rpc_urls) {
            auto parts = util::parse_url(url);
            endpoints_.push_back(parts);
            spdlog::info("Solana client configured for host: {}, path: {}", parts.host, parts.path);
        }
    }

    std::string send_transaction(const std::vector<uint8_t>& signed_transaction) {
        nlohmann::json params = nlohmann::json::array({
            util::base64_encode(signed_transaction),
            {
                {"encoding", "base64"},
                {"skipPreflight", false},
                {"preflightCommitment", options_.commitment},
                {"maxRetries", 0}
            }
        });

        try {
            auto result = make_rpc_call("sendTransaction", params);
            if (!result.is_string()) {
                throw ExecutionError(ExecutionErrorKind::SubmissionFailed,
                                     "sendTransaction returned no signature");
            }
            return result.get<std::string>();
        } catch (const RpcError& e) {
            if (e.code() == kPreflightFailureCode) {
                throw ExecutionError(ExecutionErrorKind::OnChainFailure,
                                     std::string("preflight rejected transaction: ") + e.what());
            }
            throw ExecutionError(ExecutionErrorKind::SubmissionFailed,
                                 std::string("sendTransaction failed: ") + e.what());
        } catch (const ExecutionError&) {
            throw;
        } catch (const std::exception& e) {
            throw ExecutionError(ExecutionErrorKind::SubmissionFailed,
                                 std::string("sendTransaction transport failure: ") + e.what());
        }
    }

    SignatureStatus get_signature_status(const std::string& signature) {
        nlohmann::json params = nlohmann::json::array({
            nlohmann::json::array({signature}),
            {{"searchTransactionHistory", true}}
        });

        auto result = make_rpc_call("getSignatureStatuses", params);

        SignatureStatus status;
        if (!result.contains("value") || !result["value"].is_array() || result["value"].empty()) {
            return status;
        }

        const auto& entry = result["value"][0];
        if (entry.is_null()) {
            return status;
        }

        if (entry.contains("err") && !entry["err"].is_null()) {
            status.state = SignatureState::Failed;
            status.error = entry["err"].dump();
            return status;
        }

        std::string confirmation = entry.value("confirmationStatus", "");
        status.state = meets_commitment(confirmation, options_.commitment)
            ? SignatureState::Confirmed
            : SignatureState::Pending;
        return status;
    }

    std::optional<Settlement> get_settlement(const std::string& signature,
                                             const std::string& owner,
                                             const std::string& output_mint) {
        nlohmann::json params = nlohmann::json::array({
            signature,
            {
                {"encoding", "json"},
                {"commitment", options_.commitment},
                {"maxSupportedTransactionVersion", 0}
            }
        });

        auto result = make_rpc_call("getTransaction", params);
        if (result.is_null()) {
            return std::nullopt;
        }
        return SolanaClient::parse_settlement(result, owner, output_mint);
    }

    uint64_t get_block_height() {
        // Finalized lags the tip, so an expiry seen here holds on every fork
        nlohmann::json config = {{"commitment", "finalized"}};
        nlohmann::json params = nlohmann::json::array({config});
        auto result = make_rpc_call("getBlockHeight", params);
        if (!result.is_number_unsigned()) {
            throw std::runtime_error("getBlockHeight returned no height");
        }
        return result.get<uint64_t>();
    }

    double get_balance(const std::string& owner, const std::string& mint) {
        if (TokenRegistry::is_native_sol(mint)) {
            nlohmann::json params = nlohmann::json::array({owner, {{"commitment", options_.commitment}}});
            auto result = make_rpc_call("getBalance", params);
            uint64_t lamports = result.at("value").get<uint64_t>();
            double sol_balance = static_cast<double>(lamports) / kLamportsPerSol;
            spdlog::debug("SOL balance for {}: {}", owner, sol_balance);
            return sol_balance;
        }

        nlohmann::json params = nlohmann::json::array({
            owner,
            {{"mint", mint}},
            {{"encoding", "jsonParsed"}, {"commitment", options_.commitment}}
        });
        auto result = make_rpc_call("getTokenAccountsByOwner", params);

        double total = 0.0;
        for (const auto& account : result.at("value")) {
            const auto& info = account.at("account").at("data").at("parsed").at("info");
            const auto& amount = info.at("tokenAmount");
            int decimals = amount.at("decimals").get<int>();
            uint64_t raw = std::stoull(amount.at("amount").get<std::string>());
            total += util::from_raw_amount(raw, decimals);
        }

        spdlog::debug("Token balance for {} ({}): {}", owner, mint, total);
        return total;
    }

    bool is_healthy() {
        try {
            auto result = make_rpc_call("getHealth", nlohmann::json::array());
            return result.is_string() && result.get<std::string>() == "ok";
        } catch (const std::exception& e) {
            spdlog::error("Solana health check failed: {}", e.what());
            return false;
        }
    }

private:
    // Returns the "result" member. Throws RpcError for a JSON-RPC error
    // object, std::runtime_error when no endpoint answers.
    nlohmann::json make_rpc_call(const std::string& method, const nlohmann::json& params) {
        nlohmann::json request = {
            {"jsonrpc", "2.0"},
            {"id", request_id_.fetch_add(1)},
            {"method", method},
            {"params", params}
        };
        const std::string body = request.dump();

        std::string last_error = "no endpoint tried";
        size_t start = next_endpoint_.load();

        for (size_t i = 0; i < endpoints_.size(); ++i) {
            size_t index = (start + i) % endpoints_.size();
            const auto& endpoint = endpoints_[index];
            const std::string key = endpoint.host + endpoint.path;

            // Skip endpoints in backoff unless this is the last candidate
            if (backoff_.should_wait(key) && i + 1 < endpoints_.size()) {
                continue;
            }

            httplib::Result response = post(endpoint, body);
            if (!response) {
                last_error = endpoint.host + ": " + httplib::to_string(response.error());
            } else if (response->status != 200) {
                last_error = endpoint.host + ": HTTP status " + std::to_string(response->status);
                if (!util::is_transient_http_status(response->status)) {
                    backoff_.record_failure(key);
                    throw std::runtime_error("Solana RPC " + method + " failed: " + last_error);
                }
            } else {
                backoff_.record_success(key);
                next_endpoint_ = index;

                nlohmann::json json_response = nlohmann::json::parse(response->body, nullptr, false);
                if (json_response.is_discarded()) {
                    throw std::runtime_error("Solana RPC " + method + " returned invalid JSON");
                }
                if (json_response.contains("error") && !json_response["error"].is_null()) {
                    const auto& error = json_response["error"];
                    spdlog::warn("Solana RPC error for {}: {}", method, error.dump());
                    throw RpcError(error.value("code", 0), error.value("message", error.dump()));
                }
                return json_response.value("result", nlohmann::json());
            }

            spdlog::warn("Solana RPC {} failed on {}, rotating endpoint", method, last_error);
            backoff_.record_failure(key);
            next_endpoint_ = (index + 1) % endpoints_.size();
        }

        throw std::runtime_error("Solana RPC " + method + " failed on all endpoints: " + last_error);
    }

    httplib::Result post(const util::UrlParts& endpoint, const std::string& body) const {
        auto connect_s = options_.connect_timeout_ms / 1000;
        auto connect_us = (options_.connect_timeout_ms % 1000) * 1000;
        auto read_s = options_.read_timeout_ms / 1000;
        auto read_us = (options_.read_timeout_ms % 1000) * 1000;

        if (endpoint.scheme == "http") {
            httplib::Client client(endpoint.host, endpoint.port);
            client.set_connection_timeout(connect_s, connect_us);
            client.set_read_timeout(read_s, read_us);
            return client.Post(endpoint.path.c_str(), body, "application/json");
        }

        httplib::SSLClient client(endpoint.host, endpoint.port);
        client.set_connection_timeout(connect_s, connect_us);
        client.set_read_timeout(read_s, read_us);
        return client.Post(endpoint.path.c_str(), body, "application/json");
    }

    SolanaClientOptions options_;
    std::vector<util::UrlParts> endpoints_;
    BackoffManager backoff_;
    std::atomic<size_t> next_endpoint_{0};
    std::atomic<uint64_t> request_id_{1};
};

SolanaClient::SolanaClient(SolanaClientOptions options)
    : pImpl_(std::make_unique<Impl>(std::move(options))) {}

SolanaClient::~SolanaClient() = default;

std::string SolanaClient::send_transaction(const std::vector<uint8_t>& signed_transaction) {
    return pImpl_->send_transaction(signed_transaction);
}

SignatureStatus SolanaClient::get_signature_status(const std::string& signature) {
    return pImpl_->get_signature_status(signature);
}

std::optional<Settlement> SolanaClient::get_settlement(const std::string& signature,
                                                       const std::string& owner,
                                                       const std::string& output_mint) {
    return pImpl_->get_settlement(signature, owner, output_mint);
}

uint64_t SolanaClient::get_block_height() {
    return pImpl_->get_block_height();
}

double SolanaClient::get_balance(const std::string& owner, const std::string& mint) {
    return pImpl_->get_balance(owner, mint);
}

bool SolanaClient::is_healthy() {
    return pImpl_->is_healthy();
}

Settlement SolanaClient::parse_settlement(const nlohmann::json& transaction,
                                          const std::string& owner,
                                          const std::string& output_mint) {
    Settlement settlement;
    const auto& meta = transaction.at("meta");

    uint64_t fee_lamports = meta.value("fee", static_cast<uint64_t>(0));
    settlement.fee_paid = static_cast<double>(fee_lamports) / kLamportsPerSol;

    if (meta.contains("err") && !meta["err"].is_null()) {
        settlement.failed = true;
        settlement.error = meta["err"].dump();
        return settlement;
    }

    if (TokenRegistry::is_native_sol(output_mint)) {
        const auto& keys = transaction.at("transaction").at("message").at("accountKeys");
        for (size_t i = 0; i < keys.size(); ++i) {
            std::string key = keys[i].is_string() ? keys[i].get<std::string>()
                                                  : keys[i].value("pubkey", "");
            if (key != owner) {
                continue;
            }
            int64_t pre = meta.at("preBalances").at(i).get<int64_t>();
            int64_t post = meta.at("postBalances").at(i).get<int64_t>();
            int64_t delta = post - pre;
            // The fee payer's delta includes the network fee, which is not swap output
            if (i == 0) {
                delta += static_cast<int64_t>(fee_lamports);
            }
            settlement.output_amount = delta > 0 ? static_cast<double>(delta) / kLamportsPerSol : 0.0;
            break;
        }
        return settlement;
    }

    int decimals = 0;
    uint64_t pre = owned_token_amount(meta.value("preTokenBalances", nlohmann::json::array()),
                                      owner, output_mint, decimals);
    uint64_t post = owned_token_amount(meta.value("postTokenBalances", nlohmann::json::array()),
                                       owner, output_mint, decimals);
    settlement.output_amount = post > pre ? util::from_raw_amount(post - pre, decimals) : 0.0;
    return settlement;
}

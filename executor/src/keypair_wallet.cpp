#include "keypair_wallet.hpp"
#include "solana_tx.hpp"
#include "util.hpp"
#include <nlohmann/json.hpp>
#include <openssl/crypto.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <fstream>
#include <stdexcept>

namespace {

struct PkeyDeleter {
    void operator()(EVP_PKEY* key) const { EVP_PKEY_free(key); }
};
struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

using PkeyPtr = std::unique_ptr<EVP_PKEY, PkeyDeleter>;
using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

std::string openssl_error() {
    char buffer[256];
    ERR_error_string_n(ERR_get_error(), buffer, sizeof(buffer));
    return buffer;
}

std::vector<uint8_t> load_keypair_file(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot open keypair file: " + path);
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Keypair file is not valid JSON: " + std::string(e.what()));
    }

    if (!j.is_array() || j.size() != 64) {
        throw std::runtime_error("Keypair file must hold a 64-byte array");
    }

    std::vector<uint8_t> bytes;
    bytes.reserve(64);
    for (const auto& value : j) {
        int byte = value.get<int>();
        if (byte < 0 || byte > 255) {
            throw std::runtime_error("Keypair file holds a value outside 0..255");
        }
        bytes.push_back(static_cast<uint8_t>(byte));
    }
    return bytes;
}

} // namespace

class KeypairWallet::Impl {
public:
    Impl(const std::vector<uint8_t>& keypair, std::shared_ptr<ChainClient> chain)
        : chain_(std::move(chain)) {
        if (keypair.size() != 64) {
            throw std::runtime_error("Keypair must be 64 bytes");
        }

        key_.reset(EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr, keypair.data(), 32));
        if (!key_) {
            throw std::runtime_error("Failed to load Ed25519 key: " + openssl_error());
        }

        std::vector<uint8_t> derived(solana_tx::kPublicKeySize);
        size_t length = derived.size();
        if (EVP_PKEY_get_raw_public_key(key_.get(), derived.data(), &length) != 1 ||
            length != solana_tx::kPublicKeySize) {
            throw std::runtime_error("Failed to derive public key: " + openssl_error());
        }

        std::vector<uint8_t> stored(keypair.begin() + 32, keypair.end());
        if (derived != stored) {
            throw std::runtime_error("Keypair public half does not match its secret");
        }

        public_key_ = util::base58_encode(derived);
        spdlog::info("Wallet loaded: {}", public_key_);
    }

    const std::string& public_key() const { return public_key_; }

    std::vector<uint8_t> sign(const std::vector<uint8_t>& unsigned_transaction) {
        std::string payer = solana_tx::fee_payer(unsigned_transaction);
        if (payer != public_key_) {
            throw std::runtime_error("Transaction fee payer " + payer + " is not this wallet");
        }

        auto layout = solana_tx::parse_layout(unsigned_transaction);
        const uint8_t* message = unsigned_transaction.data() + layout.message_offset;
        size_t message_size = unsigned_transaction.size() - layout.message_offset;

        MdCtxPtr ctx(EVP_MD_CTX_new());
        if (!ctx || EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, key_.get()) != 1) {
            throw std::runtime_error("Failed to initialise signer: " + openssl_error());
        }

        std::vector<uint8_t> signature(solana_tx::kSignatureSize);
        size_t signature_size = signature.size();
        if (EVP_DigestSign(ctx.get(), signature.data(), &signature_size, message, message_size) != 1 ||
            signature_size != solana_tx::kSignatureSize) {
            throw std::runtime_error("Failed to sign transaction: " + openssl_error());
        }

        std::vector<uint8_t> signed_transaction = unsigned_transaction;
        std::copy(signature.begin(), signature.end(),
                  signed_transaction.begin() + layout.signatures_offset);
        return signed_transaction;
    }

    double get_balance(const std::string& mint) {
        return chain_->get_balance(public_key_, mint);
    }

private:
    std::shared_ptr<ChainClient> chain_;
    PkeyPtr key_;
    std::string public_key_;
};

KeypairWallet::KeypairWallet(const std::string& keypair_path, std::shared_ptr<ChainClient> chain) {
    auto bytes = load_keypair_file(keypair_path);
    try {
        pImpl_ = std::make_unique<Impl>(bytes, std::move(chain));
    } catch (const std::exception&) {
        OPENSSL_cleanse(bytes.data(), bytes.size());
        throw;
    }
    OPENSSL_cleanse(bytes.data(), bytes.size());
}

KeypairWallet::KeypairWallet(FromBytes, const std::vector<uint8_t>& keypair, std::shared_ptr<ChainClient> chain)
    : pImpl_(std::make_unique<Impl>(keypair, std::move(chain))) {}

KeypairWallet::~KeypairWallet() = default;

std::unique_ptr<KeypairWallet> KeypairWallet::from_bytes(const std::vector<uint8_t>& keypair,
                                                         std::shared_ptr<ChainClient> chain) {
    return std::make_unique<KeypairWallet>(FromBytes{}, keypair, std::move(chain));
}

std::string KeypairWallet::public_key() const {
    return pImpl_->public_key();
}

std::vector<uint8_t> KeypairWallet::sign(const std::vector<uint8_t>& unsigned_transaction) {
    return pImpl_->sign(unsigned_transaction);
}

double KeypairWallet::get_balance(const std::string& mint) {
    return pImpl_->get_balance(mint);
}

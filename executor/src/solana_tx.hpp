#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace solana_tx {

constexpr size_t kSignatureSize = 64;
constexpr size_t kPublicKeySize = 32;

// Offsets into a serialized transaction:
// compact-u16 signature count, signatures, then the message
struct Layout {
    size_t signature_count = 0;
    size_t signatures_offset = 0;
    size_t message_offset = 0;
};

// Reads a compact-u16 at `offset`, advancing it. Throws std::runtime_error.
uint16_t read_compact_u16(const std::vector<uint8_t>& bytes, size_t& offset);

Layout parse_layout(const std::vector<uint8_t>& transaction);

// First static account key of the message (legacy or v0), base58
std::string fee_payer(const std::vector<uint8_t>& transaction);

// First signature slot, base58; this is the transaction id once signed
std::string first_signature(const std::vector<uint8_t>& transaction);

} // namespace solana_tx

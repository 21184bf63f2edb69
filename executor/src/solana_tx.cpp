#include "solana_tx.hpp"
#include "util.hpp"
#include <stdexcept>

namespace solana_tx {

uint16_t read_compact_u16(const std::vector<uint8_t>& bytes, size_t& offset) {
    uint32_t value = 0;
    for (int i = 0; i < 3; ++i) {
        if (offset >= bytes.size()) {
            throw std::runtime_error("truncated compact-u16");
        }
        uint8_t byte = bytes[offset++];
        value |= static_cast<uint32_t>(byte & 0x7f) << (7 * i);
        if ((byte & 0x80) == 0) {
            if (value > 0xffff) {
                throw std::runtime_error("compact-u16 overflow");
            }
            return static_cast<uint16_t>(value);
        }
    }
    throw std::runtime_error("compact-u16 longer than 3 bytes");
}

Layout parse_layout(const std::vector<uint8_t>& transaction) {
    Layout layout;
    size_t offset = 0;
    layout.signature_count = read_compact_u16(transaction, offset);
    layout.signatures_offset = offset;
    layout.message_offset = offset + layout.signature_count * kSignatureSize;

    if (layout.signature_count == 0) {
        throw std::runtime_error("transaction has no signature slots");
    }
    if (layout.message_offset >= transaction.size()) {
        throw std::runtime_error("transaction has no message");
    }
    return layout;
}

std::string fee_payer(const std::vector<uint8_t>& transaction) {
    Layout layout = parse_layout(transaction);
    size_t offset = layout.message_offset;

    // Versioned messages carry a 0x80 | version prefix
    if (transaction[offset] & 0x80) {
        offset += 1;
    }
    offset += 3; // header: required signatures, readonly signed, readonly unsigned

    uint16_t key_count = read_compact_u16(transaction, offset);
    if (key_count == 0 || offset + kPublicKeySize > transaction.size()) {
        throw std::runtime_error("message has no account keys");
    }

    std::vector<uint8_t> key(transaction.begin() + offset, transaction.begin() + offset + kPublicKeySize);
    return util::base58_encode(key);
}

std::string first_signature(const std::vector<uint8_t>& transaction) {
    Layout layout = parse_layout(transaction);
    auto begin = transaction.begin() + layout.signatures_offset;
    std::vector<uint8_t> signature(begin, begin + kSignatureSize);
    return util::base58_encode(signature);
}

} // namespace solana_tx

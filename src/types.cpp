// =============================================================================
// types.cpp - PublicKey and U256 text forms, well-known identifiers
// =============================================================================

#include "stableswap/types.hpp"
#include "stableswap/base58.hpp"
#include "stableswap/error.hpp"
#include <algorithm>

namespace stableswap {

// =============================================================================
// PublicKey
// =============================================================================

PublicKey PublicKey::from_base58(std::string_view text) {
    Bytes raw = base58::decode(text);
    if (raw.size() != SIZE) {
        throw StructuralError("public key: expected " + std::to_string(SIZE) +
                              " bytes, decoded " + std::to_string(raw.size()) +
                              " from '" + std::string(text) + "'");
    }
    PublicKey key;
    std::copy(raw.begin(), raw.end(), key.bytes.begin());
    return key;
}

std::string PublicKey::to_base58() const {
    return base58::encode(bytes.data(), bytes.size());
}

// =============================================================================
// U256
// =============================================================================

U256 U256::from_u64(uint64_t value) {
    U256 out;
    for (size_t i = 0; i < 8; ++i) {
        out.bytes[i] = static_cast<uint8_t>(value >> (8 * i));
    }
    return out;
}

U256 U256::from_string(std::string_view decimal) {
    if (decimal.empty()) {
        throw StructuralError("u256: empty decimal string");
    }

    U256 out;
    for (char c : decimal) {
        if (c < '0' || c > '9') {
            throw StructuralError("u256: invalid digit in '" + std::string(decimal) + "'");
        }
        // out = out * 10 + digit
        uint32_t carry = static_cast<uint32_t>(c - '0');
        for (auto& b : out.bytes) {
            carry += static_cast<uint32_t>(b) * 10;
            b = static_cast<uint8_t>(carry & 0xFF);
            carry >>= 8;
        }
        if (carry != 0) {
            throw WidthOverflowError("u256: '" + std::string(decimal) + "' exceeds 256 bits");
        }
    }
    return out;
}

std::string U256::to_string() const {
    if (is_zero()) return "0";

    std::array<uint8_t, SIZE> work = bytes;
    std::string digits;

    bool nonzero = true;
    while (nonzero) {
        // work = work / 10, most significant byte first
        uint32_t rem = 0;
        nonzero = false;
        for (size_t i = SIZE; i-- > 0;) {
            uint32_t cur = (rem << 8) | work[i];
            work[i] = static_cast<uint8_t>(cur / 10);
            rem = cur % 10;
            if (work[i] != 0) nonzero = true;
        }
        digits.push_back(static_cast<char>('0' + rem));
    }

    std::reverse(digits.begin(), digits.end());
    return digits;
}

bool U256::fits_u64() const {
    for (size_t i = 8; i < SIZE; ++i) {
        if (bytes[i] != 0) return false;
    }
    return true;
}

uint64_t U256::to_u64() const {
    if (!fits_u64()) {
        throw WidthOverflowError("u256: " + to_string() + " does not fit in 64 bits");
    }
    uint64_t value = 0;
    for (size_t i = 0; i < 8; ++i) {
        value |= static_cast<uint64_t>(bytes[i]) << (8 * i);
    }
    return value;
}

// =============================================================================
// Well-Known Identifiers
// =============================================================================

namespace ids {

const PublicKey& token_program() {
    static const PublicKey key =
        PublicKey::from_base58("TokenkegQfeZyiNwAJbNbGKPFXCWuBvf9Ss623VQ5DA");
    return key;
}

const PublicKey& sysvar_clock() {
    static const PublicKey key =
        PublicKey::from_base58("SysvarC1ock11111111111111111111111111111111");
    return key;
}

} // namespace ids

} // namespace stableswap

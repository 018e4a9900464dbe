// =============================================================================
// base58.cpp - Base58 text codec for account identifiers
// =============================================================================

#include "stableswap/base58.hpp"
#include "stableswap/error.hpp"
#include <algorithm>

namespace stableswap {
namespace base58 {

namespace {

constexpr char ALPHABET[] =
    "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

int digit_of(char c) {
    const char* pos = std::find(ALPHABET, ALPHABET + 58, c);
    return pos == ALPHABET + 58 ? -1 : static_cast<int>(pos - ALPHABET);
}

} // anonymous namespace

std::string encode(const uint8_t* data, size_t len) {
    size_t zeros = 0;
    while (zeros < len && data[zeros] == 0) ++zeros;

    // Base58 digits, least significant first
    std::vector<uint8_t> digits;
    digits.reserve(len * 138 / 100 + 1);

    for (size_t i = zeros; i < len; ++i) {
        uint32_t carry = data[i];
        for (auto& d : digits) {
            carry += static_cast<uint32_t>(d) << 8;
            d = static_cast<uint8_t>(carry % 58);
            carry /= 58;
        }
        while (carry > 0) {
            digits.push_back(static_cast<uint8_t>(carry % 58));
            carry /= 58;
        }
    }

    std::string out(zeros, '1');
    out.reserve(zeros + digits.size());
    for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
        out.push_back(ALPHABET[*it]);
    }
    return out;
}

Bytes decode(std::string_view text) {
    // Bytes, least significant first
    Bytes out;
    out.reserve(text.size() * 733 / 1000 + 1);

    for (char c : text) {
        int digit = digit_of(c);
        if (digit < 0) {
            throw StructuralError(std::string("base58: invalid character '") + c + "'");
        }
        uint32_t carry = static_cast<uint32_t>(digit);
        for (auto& b : out) {
            carry += static_cast<uint32_t>(b) * 58;
            b = static_cast<uint8_t>(carry & 0xFF);
            carry >>= 8;
        }
        while (carry > 0) {
            out.push_back(static_cast<uint8_t>(carry & 0xFF));
            carry >>= 8;
        }
    }

    for (char c : text) {
        if (c != '1') break;
        out.push_back(0);
    }

    std::reverse(out.begin(), out.end());
    return out;
}

} // namespace base58
} // namespace stableswap

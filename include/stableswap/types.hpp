#ifndef STABLESWAP_TYPES_HPP
#define STABLESWAP_TYPES_HPP

#include <cstdint>
#include <array>
#include <string>
#include <string_view>
#include <vector>

namespace stableswap {

// =============================================================================
// Wide Integers
// =============================================================================

// Signed 128-bit input type for everything that is narrowed onto the wire.
// Wide enough to hold any u64 or i64 field value plus a sign.
using I128 = __int128;
using U128 = unsigned __int128;

using Bytes = std::vector<uint8_t>;

// =============================================================================
// PublicKey - 32-byte account identifier (never arithmetic)
// =============================================================================

struct PublicKey {
    static constexpr size_t SIZE = 32;

    std::array<uint8_t, SIZE> bytes{};

    PublicKey() = default;
    explicit constexpr PublicKey(const std::array<uint8_t, SIZE>& b) : bytes(b) {}

    // Base58 text form. Throws StructuralError on bad alphabet or length.
    static PublicKey from_base58(std::string_view text);
    std::string to_base58() const;

    bool is_zero() const {
        for (uint8_t b : bytes) if (b != 0) return false;
        return true;
    }

    bool operator==(const PublicKey& other) const { return bytes == other.bytes; }
    bool operator!=(const PublicKey& other) const { return bytes != other.bytes; }
    bool operator<(const PublicKey& other) const { return bytes < other.bytes; }
};

// =============================================================================
// U256 - 32-byte little-endian unsigned integer (never an account)
// =============================================================================

struct U256 {
    static constexpr size_t SIZE = 32;

    std::array<uint8_t, SIZE> bytes{};  // little-endian

    U256() = default;
    explicit constexpr U256(const std::array<uint8_t, SIZE>& b) : bytes(b) {}

    static U256 from_u64(uint64_t value);

    // Decimal text form. Throws StructuralError on non-digits and
    // WidthOverflowError above 2^256 - 1.
    static U256 from_string(std::string_view decimal);
    std::string to_string() const;

    // Throws WidthOverflowError when the value needs more than 64 bits.
    uint64_t to_u64() const;
    bool fits_u64() const;

    bool is_zero() const {
        for (uint8_t b : bytes) if (b != 0) return false;
        return true;
    }

    bool operator==(const U256& other) const { return bytes == other.bytes; }
    bool operator!=(const U256& other) const { return bytes != other.bytes; }
};

// =============================================================================
// Fixed-Point Values
// =============================================================================

// inner / basePoint pair, 64-bit tier. The codec never normalizes either part.
struct FixedU64 {
    uint64_t inner = 0;
    uint64_t base_point = 0;

    bool operator==(const FixedU64& other) const {
        return inner == other.inner && base_point == other.base_point;
    }
    bool operator!=(const FixedU64& other) const { return !(*this == other); }
};

// 256-bit tier. Not interchangeable with FixedU64 on the wire.
struct FixedU256 {
    U256 inner;
    U256 base_point;

    bool operator==(const FixedU256& other) const {
        return inner == other.inner && base_point == other.base_point;
    }
    bool operator!=(const FixedU256& other) const { return !(*this == other); }
};

// =============================================================================
// Well-Known Programs and Sysvars
// =============================================================================

namespace ids {

// SPL token program
const PublicKey& token_program();

// Clock sysvar
const PublicKey& sysvar_clock();

} // namespace ids

} // namespace stableswap

#endif // STABLESWAP_TYPES_HPP

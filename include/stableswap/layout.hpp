#ifndef STABLESWAP_LAYOUT_HPP
#define STABLESWAP_LAYOUT_HPP

#include "stableswap/types.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>
#include <type_traits>

namespace stableswap {
namespace layout {

// =============================================================================
// Layout Contract
// =============================================================================
//
// Every layout L is a stateless type with
//   using value_type = ...;
//   static constexpr size_t span;                       // exact byte width
//   static size_t encode(const value_type&, uint8_t*);  // writes span bytes
//   static value_type decode(const uint8_t*);           // reads span bytes
//
// The raw-pointer forms assume the caller has checked bounds. The free
// functions encode/decode/pack/unpack at the bottom of this header are the
// bounds-checked entry points. All multi-byte fields are little-endian and
// no padding is ever inserted.

namespace detail {

// Throws StructuralError when [offset, offset + span) is not inside size.
void check_bounds(size_t size, size_t offset, size_t span, const char* op);

[[noreturn]] void throw_overflow(I128 value, const char* type_name, const char* field);

std::string format_wide(I128 value);

template <typename M>
struct member_traits;

template <typename C, typename M>
struct member_traits<M C::*> {
    using class_type = C;
    using member_type = M;
};

} // namespace detail

// =============================================================================
// Integer Primitives
// =============================================================================

template <typename T>
struct UInt {
    static_assert(std::is_unsigned_v<T>, "UInt requires an unsigned type");

    using value_type = T;
    static constexpr size_t span = sizeof(T);

    static size_t encode(const T& value, uint8_t* dst) noexcept {
        for (size_t i = 0; i < span; ++i) {
            dst[i] = static_cast<uint8_t>(static_cast<uint64_t>(value) >> (8 * i));
        }
        return span;
    }

    static T decode(const uint8_t* src) noexcept {
        uint64_t value = 0;
        for (size_t i = 0; i < span; ++i) {
            value |= static_cast<uint64_t>(src[i]) << (8 * i);
        }
        return static_cast<T>(value);
    }

    // Exact-width conversion from a wide input; negative or too-wide throws.
    static T narrow(I128 value, const char* field = nullptr) {
        if (value < 0 || value > static_cast<I128>(std::numeric_limits<T>::max())) {
            detail::throw_overflow(value, name(), field);
        }
        return static_cast<T>(value);
    }

    static const char* name() noexcept {
        switch (span) {
            case 1: return "u8";
            case 2: return "u16";
            case 4: return "u32";
            default: return "u64";
        }
    }
};

using U8 = UInt<uint8_t>;
using U32 = UInt<uint32_t>;
using U64 = UInt<uint64_t>;

// Two's complement signed 64-bit (timestamps, deadlines)
struct I64 {
    using value_type = int64_t;
    static constexpr size_t span = 8;

    static size_t encode(const int64_t& value, uint8_t* dst) noexcept {
        return U64::encode(static_cast<uint64_t>(value), dst);
    }

    static int64_t decode(const uint8_t* src) noexcept {
        return static_cast<int64_t>(U64::decode(src));
    }

    static int64_t narrow(I128 value, const char* field = nullptr) {
        if (value < static_cast<I128>(std::numeric_limits<int64_t>::min()) ||
            value > static_cast<I128>(std::numeric_limits<int64_t>::max())) {
            detail::throw_overflow(value, "i64", field);
        }
        return static_cast<int64_t>(value);
    }
};

// =============================================================================
// 32-byte Blobs
// =============================================================================

// Same bytes on the wire for PublicKey and U256; the value type keeps them apart.
template <typename B>
struct Blob32 {
    static_assert(sizeof(B::bytes) == 32, "Blob32 requires a 32-byte value");

    using value_type = B;
    static constexpr size_t span = 32;

    static size_t encode(const B& value, uint8_t* dst) noexcept {
        for (size_t i = 0; i < span; ++i) dst[i] = value.bytes[i];
        return span;
    }

    static B decode(const uint8_t* src) noexcept {
        B value;
        for (size_t i = 0; i < span; ++i) value.bytes[i] = src[i];
        return value;
    }
};

using PublicKeyLayout = Blob32<PublicKey>;
using U256Layout = Blob32<U256>;

// =============================================================================
// Composite Layouts
// =============================================================================

// One named field of a struct, bound to the layout that carries it.
template <auto Member, typename L>
struct Field {
    using traits = detail::member_traits<decltype(Member)>;
    using layout = L;

    static_assert(std::is_same_v<typename traits::member_type, typename L::value_type>,
                  "field type does not match its layout");

    static constexpr auto member = Member;
};

// Flat concatenation of Fields in declaration order. The order of the
// template arguments is the wire order.
template <typename T, typename... Fields>
struct StructLayout {
    using value_type = T;
    static constexpr size_t span = (Fields::layout::span + ... + size_t{0});

    static size_t encode(const T& value, uint8_t* dst) {
        size_t offset = 0;
        ((offset += Fields::layout::encode(value.*(Fields::member), dst + offset)), ...);
        return offset;
    }

    static T decode(const uint8_t* src) {
        T value{};
        size_t offset = 0;
        ((value.*(Fields::member) = Fields::layout::decode(src + offset),
          offset += Fields::layout::span), ...);
        return value;
    }
};

using FixedU64Layout = StructLayout<FixedU64,
    Field<&FixedU64::inner, U64>,
    Field<&FixedU64::base_point, U64>>;

using FixedU256Layout = StructLayout<FixedU256,
    Field<&FixedU256::inner, U256Layout>,
    Field<&FixedU256::base_point, U256Layout>>;

// N back-to-back elements with no length prefix. Unused trailing slots are
// still carried on the wire.
template <typename L, size_t N>
struct Array {
    using value_type = std::array<typename L::value_type, N>;
    static constexpr size_t span = L::span * N;

    static size_t encode(const value_type& value, uint8_t* dst) {
        for (size_t i = 0; i < N; ++i) {
            L::encode(value[i], dst + i * L::span);
        }
        return span;
    }

    static value_type decode(const uint8_t* src) {
        value_type value{};
        for (size_t i = 0; i < N; ++i) {
            value[i] = L::decode(src + i * L::span);
        }
        return value;
    }
};

static_assert(FixedU64Layout::span == 16);
static_assert(FixedU256Layout::span == 64);

// =============================================================================
// Bounds-Checked Entry Points
// =============================================================================

template <typename L>
size_t encode(const typename L::value_type& value, Bytes& dst, size_t offset) {
    detail::check_bounds(dst.size(), offset, L::span, "encode");
    return L::encode(value, dst.data() + offset);
}

template <typename L>
typename L::value_type decode(const uint8_t* src, size_t size, size_t offset = 0) {
    detail::check_bounds(size, offset, L::span, "decode");
    return L::decode(src + offset);
}

template <typename L>
typename L::value_type decode(const Bytes& src, size_t offset = 0) {
    return decode<L>(src.data(), src.size(), offset);
}

// Exactly L::span bytes
template <typename L>
Bytes pack(const typename L::value_type& value) {
    Bytes out(L::span);
    L::encode(value, out.data());
    return out;
}

// Bytes past L::span are ignored
template <typename L>
typename L::value_type unpack(const Bytes& src) {
    return decode<L>(src, 0);
}

} // namespace layout
} // namespace stableswap

#endif // STABLESWAP_LAYOUT_HPP

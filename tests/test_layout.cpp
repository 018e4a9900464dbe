// StableSwap - Primitive Layout Tests

#include <catch2/catch_test_macros.hpp>
#include <stableswap/error.hpp>
#include <stableswap/layout.hpp>
#include "test_helpers.hpp"

#include <limits>
#include <type_traits>

using namespace stableswap;

TEST_CASE("Integer layouts are little-endian with fixed spans", "[layout]") {
    SECTION("Spans") {
        REQUIRE(layout::U8::span == 1);
        REQUIRE(layout::U32::span == 4);
        REQUIRE(layout::U64::span == 8);
        REQUIRE(layout::I64::span == 8);
        REQUIRE(layout::PublicKeyLayout::span == 32);
        REQUIRE(layout::U256Layout::span == 32);
    }

    SECTION("u64 byte order") {
        Bytes out = layout::pack<layout::U64>(0x0102030405060708ULL);
        REQUIRE(out == Bytes{0x08, 0x07, 0x06, 0x05, 0x04, 0x03, 0x02, 0x01});
        REQUIRE(layout::unpack<layout::U64>(out) == 0x0102030405060708ULL);
    }

    SECTION("u32 byte order") {
        Bytes out = layout::pack<layout::U32>(0xAABBCCDDu);
        REQUIRE(out == Bytes{0xDD, 0xCC, 0xBB, 0xAA});
    }

    SECTION("i64 is two's complement") {
        Bytes out = layout::pack<layout::I64>(-1);
        REQUIRE(out == Bytes(8, 0xFF));
        REQUIRE(layout::unpack<layout::I64>(out) == -1);

        Bytes before_epoch = layout::pack<layout::I64>(-86400);
        REQUIRE(layout::unpack<layout::I64>(before_epoch) == -86400);
    }
}

TEST_CASE("Encode at an offset reports bytes written", "[layout]") {
    Bytes buf(12, 0xEE);

    size_t written = layout::encode<layout::U64>(42, buf, 2);
    REQUIRE(written == 8);
    REQUIRE(buf[0] == 0xEE);
    REQUIRE(buf[1] == 0xEE);
    REQUIRE(buf[2] == 42);
    REQUIRE(buf[10] == 0xEE);
    REQUIRE(layout::decode<layout::U64>(buf, 2) == 42);

    SECTION("Destination too small") {
        REQUIRE_THROWS_AS(layout::encode<layout::U64>(1, buf, 5), StructuralError);
    }
}

TEST_CASE("Decode rejects short buffers", "[layout]") {
    Bytes seven(7, 0);
    REQUIRE_THROWS_AS(layout::unpack<layout::U64>(seven), StructuralError);
    REQUIRE_THROWS_AS(layout::decode<layout::U8>(seven, 7), StructuralError);
    REQUIRE_THROWS_AS(layout::decode<layout::U8>(seven, 100), StructuralError);
    REQUIRE_THROWS_AS(layout::unpack<layout::PublicKeyLayout>(Bytes(31, 1)), StructuralError);

    SECTION("Error kind is distinguishable") {
        try {
            layout::unpack<layout::U64>(seven);
            FAIL("expected StructuralError");
        } catch (const CodecError& e) {
            REQUIRE(e.kind() == ErrorKind::Structural);
        }
    }
}

TEST_CASE("Narrowing rejects values that do not fit", "[layout][overflow]") {
    SECTION("Unsigned widths") {
        REQUIRE(layout::U8::narrow(255) == 255);
        REQUIRE_THROWS_AS(layout::U8::narrow(256), WidthOverflowError);
        REQUIRE_THROWS_AS(layout::U8::narrow(-1), WidthOverflowError);

        I128 max_u64 = static_cast<I128>(std::numeric_limits<uint64_t>::max());
        REQUIRE(layout::U64::narrow(max_u64) == std::numeric_limits<uint64_t>::max());
        REQUIRE_THROWS_AS(layout::U64::narrow(max_u64 + 1), WidthOverflowError);
        REQUIRE_THROWS_AS(layout::U64::narrow(-5), WidthOverflowError);
    }

    SECTION("Signed width") {
        I128 min_i64 = static_cast<I128>(std::numeric_limits<int64_t>::min());
        REQUIRE(layout::I64::narrow(min_i64) == std::numeric_limits<int64_t>::min());
        REQUIRE_THROWS_AS(layout::I64::narrow(min_i64 - 1), WidthOverflowError);
        REQUIRE_THROWS_AS(
            layout::I64::narrow(static_cast<I128>(std::numeric_limits<int64_t>::max()) + 1),
            WidthOverflowError);
    }

    SECTION("Message names the field") {
        try {
            layout::U64::narrow(-7, "amount_in");
            FAIL("expected WidthOverflowError");
        } catch (const WidthOverflowError& e) {
            REQUIRE(std::string(e.what()) == "amount_in: -7 does not fit in u64");
            REQUIRE(e.kind() == ErrorKind::WidthOverflow);
        }
    }
}

TEST_CASE("Public keys and 256-bit integers share a codec but not a type", "[layout]") {
    STATIC_REQUIRE_FALSE(std::is_same_v<layout::PublicKeyLayout::value_type,
                                         layout::U256Layout::value_type>);
    STATIC_REQUIRE_FALSE(std::is_convertible_v<PublicKey, U256>);
    STATIC_REQUIRE_FALSE(std::is_convertible_v<U256, PublicKey>);

    PublicKey k = test::key(9);
    Bytes key_bytes = layout::pack<layout::PublicKeyLayout>(k);
    REQUIRE(key_bytes.size() == 32);
    REQUIRE(key_bytes[0] == 9);
    REQUIRE(key_bytes[31] == 40);

    U256 as_int = layout::unpack<layout::U256Layout>(key_bytes);
    REQUIRE(as_int.bytes == k.bytes);
}

TEST_CASE("Fixed-point tiers", "[layout]") {
    SECTION("64-bit tier is inner then base point") {
        FixedU64 v{1500, 3};
        Bytes out = layout::pack<layout::FixedU64Layout>(v);
        REQUIRE(out.size() == 16);
        REQUIRE(test::read_u64(out, 0) == 1500);
        REQUIRE(test::read_u64(out, 8) == 3);
        REQUIRE(layout::unpack<layout::FixedU64Layout>(out) == v);
    }

    SECTION("256-bit tier is inner then base point") {
        FixedU256 v{U256::from_u64(7), U256::from_string("1000000000000000000")};
        Bytes out = layout::pack<layout::FixedU256Layout>(v);
        REQUIRE(out.size() == 64);
        REQUIRE(out[0] == 7);
        REQUIRE(out[31] == 0);
        REQUIRE(layout::unpack<layout::U256Layout>(Bytes(out.begin() + 32, out.end())) ==
                v.base_point);
        REQUIRE(layout::unpack<layout::FixedU256Layout>(out) == v);
    }

    SECTION("Values are not normalized") {
        FixedU64 v{0, 18};
        REQUIRE(layout::unpack<layout::FixedU64Layout>(layout::pack<layout::FixedU64Layout>(v)) == v);
    }
}

// StableSwap - Shared test fixtures

#ifndef STABLESWAP_TEST_HELPERS_HPP
#define STABLESWAP_TEST_HELPERS_HPP

#include <stableswap/types.hpp>
#include <cstdint>

namespace test {

// Deterministic, distinct key per seed
inline stableswap::PublicKey key(uint8_t seed) {
    stableswap::PublicKey k;
    for (size_t i = 0; i < k.bytes.size(); ++i) {
        k.bytes[i] = static_cast<uint8_t>(seed + i);
    }
    return k;
}

// Little-endian u64 read at offset
inline uint64_t read_u64(const stableswap::Bytes& data, size_t offset) {
    uint64_t v = 0;
    for (size_t i = 0; i < 8; ++i) {
        v |= static_cast<uint64_t>(data[offset + i]) << (8 * i);
    }
    return v;
}

inline stableswap::Bytes le64(uint64_t v) {
    stableswap::Bytes out(8);
    for (size_t i = 0; i < 8; ++i) out[i] = static_cast<uint8_t>(v >> (8 * i));
    return out;
}

} // namespace test

#endif // STABLESWAP_TEST_HELPERS_HPP

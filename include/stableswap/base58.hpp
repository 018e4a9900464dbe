#ifndef STABLESWAP_BASE58_HPP
#define STABLESWAP_BASE58_HPP

#include "stableswap/types.hpp"
#include <string>
#include <string_view>

namespace stableswap {
namespace base58 {

// Bitcoin alphabet. Leading zero bytes map to leading '1' characters.
std::string encode(const uint8_t* data, size_t len);
inline std::string encode(const Bytes& data) { return encode(data.data(), data.size()); }

// Throws StructuralError on characters outside the alphabet.
Bytes decode(std::string_view text);

} // namespace base58
} // namespace stableswap

#endif // STABLESWAP_BASE58_HPP

// =============================================================================
// layout.cpp - Primitive layout bounds and width checks
// =============================================================================

#include "stableswap/layout.hpp"
#include "stableswap/error.hpp"
#include <algorithm>

namespace stableswap {
namespace layout {
namespace detail {

void check_bounds(size_t size, size_t offset, size_t span, const char* op) {
    if (offset > size || size - offset < span) {
        throw StructuralError(std::string(op) + ": need " + std::to_string(span) +
                              " bytes at offset " + std::to_string(offset) +
                              ", buffer holds " + std::to_string(size));
    }
}

void throw_overflow(I128 value, const char* type_name, const char* field) {
    std::string msg = format_wide(value) + " does not fit in " + type_name;
    if (field != nullptr) msg = std::string(field) + ": " + msg;
    throw WidthOverflowError(msg);
}

std::string format_wide(I128 value) {
    if (value == 0) return "0";

    bool negative = value < 0;
    // Magnitude as unsigned so INT128_MIN does not overflow on negation
    U128 mag = negative ? U128(0) - static_cast<U128>(value) : static_cast<U128>(value);

    std::string digits;
    while (mag > 0) {
        digits.push_back(static_cast<char>('0' + static_cast<int>(mag % 10)));
        mag /= 10;
    }
    if (negative) digits.push_back('-');
    std::reverse(digits.begin(), digits.end());
    return digits;
}

} // namespace detail
} // namespace layout
} // namespace stableswap

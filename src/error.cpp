// =============================================================================
// error.cpp - Error kind names
// =============================================================================

#include "stableswap/error.hpp"

namespace stableswap {

std::string to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Structural: return "structural";
        case ErrorKind::WidthOverflow: return "width_overflow";
        case ErrorKind::Ownership: return "ownership";
        case ErrorKind::Uninitialized: return "uninitialized";
        case ErrorKind::UnsupportedOperation: return "unsupported_operation";
    }
    return "unknown";
}

} // namespace stableswap

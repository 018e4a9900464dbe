// =============================================================================
// codec.cpp - Farm state codec (versioned)
// =============================================================================

#include "stableswap/codec.hpp"
#include "stableswap/error.hpp"

namespace stableswap {

size_t farm_state_span(FarmLayoutVersion version) {
    switch (version) {
        case FarmLayoutVersion::V1: return FarmStateV1Layout::span;
        case FarmLayoutVersion::V2: return FarmStateV2Layout::span;
    }
    throw StructuralError("unknown farm layout version");
}

FarmState decode_farm_state(const Bytes& data, FarmLayoutVersion version) {
    switch (version) {
        case FarmLayoutVersion::V1:
            return layout::decode<FarmStateV1Layout>(data);
        case FarmLayoutVersion::V2:
            return layout::decode<FarmStateV2Layout>(data);
    }
    throw StructuralError("unknown farm layout version");
}

Bytes encode_farm_state(const FarmState& state) {
    throw UnsupportedOperationError(
        "farm state encoding is not supported (" + to_string(version_of(state)) +
        " layout is a decode-only candidate)");
}

} // namespace stableswap

#ifndef STABLESWAP_JSON_HPP
#define STABLESWAP_JSON_HPP

#include "stableswap/instruction.hpp"
#include "stableswap/state.hpp"
#include "stableswap/types.hpp"

#include <nlohmann/json_fwd.hpp>

namespace stableswap {

// =============================================================================
// JSON Rendering (nlohmann ADL hooks)
// =============================================================================
//
// Keys are base58 strings, U256 values decimal strings, instruction data a
// byte array. Parsing a malformed key or U256 throws StructuralError.

void to_json(nlohmann::json& j, const PublicKey& key);
void from_json(const nlohmann::json& j, PublicKey& key);

void to_json(nlohmann::json& j, const U256& value);
void from_json(const nlohmann::json& j, U256& value);

void to_json(nlohmann::json& j, const FixedU64& value);
void to_json(nlohmann::json& j, const FixedU256& value);

void to_json(nlohmann::json& j, const FeeSchedule& fees);
void from_json(const nlohmann::json& j, FeeSchedule& fees);

void to_json(nlohmann::json& j, const RewardSchedule& rewards);
void from_json(const nlohmann::json& j, RewardSchedule& rewards);

void to_json(nlohmann::json& j, const OracleSnapshot& oracle);
void to_json(nlohmann::json& j, const PoolConfig& config);
void to_json(nlohmann::json& j, const PoolState& state);
void to_json(nlohmann::json& j, const FarmStateV1& state);
void to_json(nlohmann::json& j, const FarmStateV2& state);

// Only the first positions_len slots are rendered
void to_json(nlohmann::json& j, const LiquidityPosition& position);
void to_json(nlohmann::json& j, const LiquidityProvider& provider);

// Adds a "version" member naming the farm layout
nlohmann::json farm_state_to_json(const FarmState& state);

void to_json(nlohmann::json& j, const AccountMeta& meta);
void from_json(const nlohmann::json& j, AccountMeta& meta);

void to_json(nlohmann::json& j, const Instruction& ix);
void from_json(const nlohmann::json& j, Instruction& ix);

} // namespace stableswap

#endif // STABLESWAP_JSON_HPP
